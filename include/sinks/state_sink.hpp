#pragma once

#include <cstdint>

#include "model/fetch_outcome.hpp"

namespace status_poller::sinks {

// Receives accepted outcomes, in request-sequence order, on the polling thread.
class StateSink {
 public:
  virtual void on_update(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms) = 0;
  virtual ~StateSink() = default;
};

}  // namespace status_poller::sinks
