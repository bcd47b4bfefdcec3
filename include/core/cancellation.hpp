#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace status_poller::core {

enum class wake_reason : std::uint8_t {
  ELAPSED = 0,
  CANCELLED = 1,
  NOTIFIED = 2,
};

// Cooperative stop signal owned by one polling session.
// Waits wake immediately on cancel(); interruptible waits also wake on notify().
class CancellationToken {
 public:
  using clock = std::chrono::steady_clock;

  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel();
  [[nodiscard]] bool cancelled() const;

  void notify();
  bool take_notification();

  wake_reason wait_until(clock::time_point deadline, bool interruptible);

 private:
  mutable std::mutex mutex_;
  std::condition_variable wakeup_;
  bool cancelled_{false};
  bool notified_{false};
};

}  // namespace status_poller::core
