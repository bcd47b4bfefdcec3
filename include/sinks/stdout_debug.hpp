#pragma once

#include <cstdint>

#include "sinks/state_sink.hpp"

namespace status_poller::sinks {

class StdoutDebugSink final : public StateSink {
 public:
  void on_update(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms) override;
};

}  // namespace status_poller::sinks
