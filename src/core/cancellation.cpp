#include "core/cancellation.hpp"

namespace status_poller::core {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  wakeup_.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

void CancellationToken::notify() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    notified_ = true;
  }
  wakeup_.notify_all();
}

bool CancellationToken::take_notification() {
  std::lock_guard<std::mutex> lock(mutex_);
  const bool was_notified = notified_;
  notified_ = false;
  return was_notified;
}

wake_reason CancellationToken::wait_until(const clock::time_point deadline, const bool interruptible) {
  std::unique_lock<std::mutex> lock(mutex_);
  const bool woken = wakeup_.wait_until(lock, deadline, [this, interruptible]() {
    return cancelled_ || (interruptible && notified_);
  });

  if (cancelled_) {
    return wake_reason::CANCELLED;
  }
  if (woken) {
    notified_ = false;
    return wake_reason::NOTIFIED;
  }
  return wake_reason::ELAPSED;
}

}  // namespace status_poller::core
