#pragma once

#include <chrono>
#include <memory>

#include "core/cancellation.hpp"

namespace status_poller::core {

// Source of time and of the engine's suspension points.
class Timer {
 public:
  using clock = std::chrono::steady_clock;

  virtual clock::time_point now() const = 0;
  virtual wake_reason wait_until(CancellationToken& token, clock::time_point deadline, bool interruptible) = 0;
  virtual ~Timer() = default;
};

std::unique_ptr<Timer> make_steady_timer();

}  // namespace status_poller::core
