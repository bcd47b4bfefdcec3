#pragma once

#include <cstdint>
#include <vector>

#include "sinks/state_sink.hpp"

namespace status_poller::sinks {

// Forwards each update to every registered sink, in registration order.
class FanoutSink final : public StateSink {
 public:
  void add(StateSink& sink);
  void on_update(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms) override;

 private:
  std::vector<StateSink*> sinks_{};
};

}  // namespace status_poller::sinks
