#include "polling/polling_loop.hpp"

#include <utility>

namespace status_poller::polling {

PollingLoop::PollingLoop(fetch::StatusFetcher& fetcher, RetryingFetchOperation retry, core::Timer& timer,
                         const std::chrono::milliseconds interval, Publisher publish)
    : fetcher_(fetcher), retry_(std::move(retry)), timer_(timer), interval_(interval), publish_(std::move(publish)) {}

LoopStats PollingLoop::run(PollingSession& session) {
  LoopStats stats{};
  auto next_tick = timer_.now();

  while (!session.cancelled()) {
    std::uint64_t sequence = 0;
    bool scheduled = false;

    // Owed manual refreshes go first and leave the tick deadline alone.
    if (const auto manual = session.take_manual(); manual.has_value()) {
      sequence = *manual;
      ++stats.manual_fetches;
    } else if (timer_.now() >= next_tick) {
      sequence = session.stamp_request();
      scheduled = true;
      ++stats.scheduled_ticks;
    } else {
      if (timer_.wait_until(session.token(), next_tick, true) == core::wake_reason::CANCELLED) {
        break;
      }
      continue;
    }

    if (session.cancelled()) {
      break;
    }

    session.transition(session_state::FETCHING);
    auto outcome = retry_.run(fetcher_, session.token());
    if (!outcome.has_value()) {
      break;
    }

    if (!outcome->ok()) {
      ++stats.failed_fetches;
    }
    if (publish_(std::move(*outcome), sequence)) {
      ++stats.published;
    }
    session.transition(session_state::IDLE);

    if (scheduled) {
      next_tick = timer_.now() + interval_;
    }
  }

  return stats;
}

}  // namespace status_poller::polling
