#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include "core/timer.hpp"
#include "fetch/status_fetcher.hpp"
#include "model/fetch_outcome.hpp"
#include "polling/polling_session.hpp"
#include "polling/retrying_fetch.hpp"

namespace status_poller::polling {

struct LoopStats {
  std::size_t scheduled_ticks{0};
  std::size_t manual_fetches{0};
  std::size_t failed_fetches{0};
  std::size_t published{0};
};

class PollingLoop {
 public:
  using Publisher = std::function<bool(model::FetchOutcome, std::uint64_t)>;

  PollingLoop(fetch::StatusFetcher& fetcher, RetryingFetchOperation retry, core::Timer& timer,
              std::chrono::milliseconds interval, Publisher publish);

  // Runs until the session is cancelled. The first scheduled tick is immediate.
  LoopStats run(PollingSession& session);

 private:
  fetch::StatusFetcher& fetcher_;
  RetryingFetchOperation retry_;
  core::Timer& timer_;
  std::chrono::milliseconds interval_{};
  Publisher publish_;
};

}  // namespace status_poller::polling
