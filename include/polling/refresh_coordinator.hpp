#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "core/config.hpp"
#include "core/timer.hpp"
#include "fetch/status_fetcher.hpp"
#include "model/fetch_outcome.hpp"
#include "polling/polling_session.hpp"
#include "sinks/state_sink.hpp"

namespace status_poller::polling {

struct CoordinatorOptions {
  std::chrono::milliseconds refresh_interval{core::kAutoRefreshInterval};
  core::RetryConfig retry{};
};

// Owns the polling thread of one dashboard view. All fetches run on that
// thread, so scheduled ticks and manual refreshes never overlap.
//
// The sink is called on the polling thread. It may call manual_refresh(),
// running(), state() or stop(); a stop() issued there only cancels, and the
// thread is joined by the next start(), stop() or the destructor. start()
// from the polling thread is rejected.
class RefreshCoordinator {
 public:
  RefreshCoordinator(CoordinatorOptions options, fetch::StatusFetcher& fetcher, sinks::StateSink& sink,
                     core::Timer& timer);
  ~RefreshCoordinator();

  RefreshCoordinator(const RefreshCoordinator&) = delete;
  RefreshCoordinator& operator=(const RefreshCoordinator&) = delete;
  RefreshCoordinator(RefreshCoordinator&&) = delete;
  RefreshCoordinator& operator=(RefreshCoordinator&&) = delete;

  // Returns false if a session is already running. A previous polling
  // thread is joined before the new one starts.
  bool start();
  // Idempotent. Once it returns, no further update reaches the sink.
  void stop();
  // Returns false when no session is running or a follow-up is already owed.
  bool manual_refresh();

  // Delivers an outcome to the current session unless it is cancelled or a
  // newer sequence has already been delivered.
  bool publish(model::FetchOutcome outcome, std::uint64_t sequence);

  [[nodiscard]] bool running() const;
  [[nodiscard]] session_state state() const;

 private:
  bool deliver(PollingSession& session, const model::FetchOutcome& outcome, std::uint64_t sequence);
  void run_session(const std::shared_ptr<PollingSession>& session);
  [[nodiscard]] bool on_polling_thread() const;

  CoordinatorOptions options_;
  fetch::StatusFetcher& fetcher_;
  sinks::StateSink& sink_;
  core::Timer& timer_;

  // lifecycle_mutex_ serializes start()/stop() from foreground threads and is
  // never taken on the polling thread. Lock order: lifecycle_mutex_, then
  // delivery_mutex_, then control_mutex_. control_mutex_ is never held while
  // waiting on another lock or a join.
  std::mutex lifecycle_mutex_;
  std::mutex delivery_mutex_;
  mutable std::mutex control_mutex_;
  std::shared_ptr<PollingSession> session_{};
  std::thread worker_{};
};

}  // namespace status_poller::polling
