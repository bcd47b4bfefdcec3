#include "sinks/dashboard_state.hpp"

namespace status_poller::sinks {

void DashboardState::on_update(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++view_.updates;
  view_.last_outcome_ms = completed_at_ms;
  view_.last_attempts = outcome.attempts;

  if (outcome.ok()) {
    view_.snapshot = outcome.snapshot();
    view_.error.reset();
    view_.last_updated_ms = completed_at_ms;
    view_.consecutive_failures = 0;
    return;
  }

  view_.error = outcome.error();
  ++view_.consecutive_failures;
}

DashboardView DashboardState::view() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return view_;
}

}  // namespace status_poller::sinks
