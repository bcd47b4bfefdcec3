#include "polling/polling_session.hpp"

namespace status_poller::polling {

const char* to_string(const session_state state) noexcept {
  switch (state) {
    case session_state::IDLE:
      return "idle";
    case session_state::FETCHING:
      return "fetching";
    case session_state::PUBLISHING:
      return "publishing";
    case session_state::CANCELLED:
      return "cancelled";
  }
  return "idle";
}

void PollingSession::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = session_state::CANCELLED;
    pending_manual_.reset();
  }
  token_.cancel();
}

bool PollingSession::cancelled() const { return token_.cancelled(); }

std::uint64_t PollingSession::stamp_request() {
  std::lock_guard<std::mutex> lock(mutex_);
  return ++last_sequence_;
}

bool PollingSession::request_manual() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == session_state::CANCELLED || pending_manual_.has_value()) {
      return false;
    }
    pending_manual_ = ++last_sequence_;
  }
  token_.notify();
  return true;
}

std::optional<std::uint64_t> PollingSession::take_manual() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<std::uint64_t> sequence = pending_manual_;
  pending_manual_.reset();
  return sequence;
}

bool PollingSession::manual_pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_manual_.has_value();
}

bool PollingSession::accept(const std::uint64_t sequence) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sequence <= highest_published_) {
    return false;
  }
  highest_published_ = sequence;
  return true;
}

std::uint64_t PollingSession::highest_published() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return highest_published_;
}

session_state PollingSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void PollingSession::transition(const session_state next) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == session_state::CANCELLED) {
    return;
  }
  state_ = next;
}

}  // namespace status_poller::polling
