#include "core/timer.hpp"

#include <memory>

namespace status_poller::core {
namespace {

class SteadyTimer final : public Timer {
 public:
  clock::time_point now() const override { return clock::now(); }

  wake_reason wait_until(CancellationToken& token, const clock::time_point deadline, const bool interruptible) override {
    return token.wait_until(deadline, interruptible);
  }
};

}  // namespace

std::unique_ptr<Timer> make_steady_timer() { return std::make_unique<SteadyTimer>(); }

}  // namespace status_poller::core
