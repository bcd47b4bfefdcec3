#pragma once

#include <cstdint>
#include <mutex>
#include <optional>

#include "core/cancellation.hpp"

namespace status_poller::polling {

enum class session_state : std::uint8_t {
  IDLE = 0,
  FETCHING = 1,
  PUBLISHING = 2,
  CANCELLED = 3,
};

const char* to_string(session_state state) noexcept;

// Shared state of one active polling instance. Touched by the foreground
// (manual refresh, stop) and by the polling thread, always under mutex_.
class PollingSession {
 public:
  PollingSession() = default;

  PollingSession(const PollingSession&) = delete;
  PollingSession& operator=(const PollingSession&) = delete;

  core::CancellationToken& token() noexcept { return token_; }

  void cancel();
  [[nodiscard]] bool cancelled() const;

  // Sequence numbers start at 1 and strictly increase within the session.
  std::uint64_t stamp_request();

  // Records one owed manual fetch, stamped now. Returns false when one is
  // already owed or the session is cancelled.
  bool request_manual();
  std::optional<std::uint64_t> take_manual();
  [[nodiscard]] bool manual_pending() const;

  // Admits an outcome for delivery only if its sequence is newer than
  // everything delivered so far.
  bool accept(std::uint64_t sequence);
  [[nodiscard]] std::uint64_t highest_published() const;

  [[nodiscard]] session_state state() const;
  // No-op once CANCELLED.
  void transition(session_state next);

 private:
  mutable std::mutex mutex_;
  core::CancellationToken token_;
  std::uint64_t last_sequence_{0};
  std::optional<std::uint64_t> pending_manual_{};
  std::uint64_t highest_published_{0};
  session_state state_{session_state::IDLE};
};

}  // namespace status_poller::polling
