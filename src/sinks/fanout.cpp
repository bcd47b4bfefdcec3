#include "sinks/fanout.hpp"

namespace status_poller::sinks {

void FanoutSink::add(StateSink& sink) { sinks_.push_back(&sink); }

void FanoutSink::on_update(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  for (auto* sink : sinks_) {
    sink->on_update(outcome, completed_at_ms);
  }
}

}  // namespace status_poller::sinks
