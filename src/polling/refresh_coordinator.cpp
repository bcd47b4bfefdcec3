#include "polling/refresh_coordinator.hpp"

#include <iostream>
#include <utility>

#include "core/timestamp.hpp"
#include "polling/polling_loop.hpp"
#include "polling/retrying_fetch.hpp"

namespace status_poller::polling {
namespace {

// Coordinator whose polling loop runs on the current thread, if any.
thread_local const RefreshCoordinator* t_polling_coordinator = nullptr;

}  // namespace

RefreshCoordinator::RefreshCoordinator(CoordinatorOptions options, fetch::StatusFetcher& fetcher,
                                       sinks::StateSink& sink, core::Timer& timer)
    : options_(options), fetcher_(fetcher), sink_(sink), timer_(timer) {}

RefreshCoordinator::~RefreshCoordinator() { stop(); }

bool RefreshCoordinator::on_polling_thread() const { return t_polling_coordinator == this; }

bool RefreshCoordinator::start() {
  if (on_polling_thread()) {
    std::cerr << "[coordinator] start rejected on the polling thread\n";
    return false;
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::thread previous;
  {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (session_ != nullptr && !session_->cancelled()) {
      return false;
    }
    previous = std::move(worker_);
  }

  // Left over when a previous session was stopped from its own thread.
  if (previous.joinable()) {
    previous.join();
  }

  auto session = std::make_shared<PollingSession>();
  {
    std::lock_guard<std::mutex> control(control_mutex_);
    session_ = session;
    worker_ = std::thread([this, session]() { run_session(session); });
  }

  std::cerr << "[coordinator] polling started | interval_ms=" << options_.refresh_interval.count()
            << " | max_retries=" << options_.retry.max_attempts
            << " | base_delay_ms=" << options_.retry.base_delay.count() << '\n';
  return true;
}

void RefreshCoordinator::stop() {
  if (on_polling_thread()) {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (session_ != nullptr) {
      session_->cancel();
    }
    return;
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  std::thread worker;
  {
    std::lock_guard<std::mutex> control(control_mutex_);
    if (session_ == nullptr) {
      return;
    }
    session_->cancel();
    worker = std::move(worker_);
  }

  // Barrier: an update already being delivered finishes before stop() returns.
  { std::lock_guard<std::mutex> delivery(delivery_mutex_); }

  if (worker.joinable()) {
    worker.join();
    std::cerr << "[coordinator] polling stopped\n";
  }
}

bool RefreshCoordinator::manual_refresh() {
  std::lock_guard<std::mutex> control(control_mutex_);
  if (session_ == nullptr || session_->cancelled()) {
    return false;
  }

  const bool accepted = session_->request_manual();
  if (!accepted) {
    std::cerr << "[coordinator] manual refresh already pending; coalesced\n";
  }
  return accepted;
}

bool RefreshCoordinator::publish(model::FetchOutcome outcome, const std::uint64_t sequence) {
  std::shared_ptr<PollingSession> session;
  {
    std::lock_guard<std::mutex> control(control_mutex_);
    session = session_;
  }
  if (session == nullptr) {
    return false;
  }
  return deliver(*session, outcome, sequence);
}

bool RefreshCoordinator::deliver(PollingSession& session, const model::FetchOutcome& outcome,
                                 const std::uint64_t sequence) {
  std::lock_guard<std::mutex> delivery(delivery_mutex_);
  if (session.cancelled()) {
    return false;
  }

  if (!session.accept(sequence)) {
    std::cerr << "[coordinator] dropping stale outcome seq=" << sequence
              << " (delivered seq=" << session.highest_published() << ")\n";
    return false;
  }

  const auto previous = session.state();
  session.transition(session_state::PUBLISHING);
  sink_.on_update(outcome, core::unix_timestamp_now_ms());
  session.transition(previous);
  return true;
}

bool RefreshCoordinator::running() const {
  std::lock_guard<std::mutex> control(control_mutex_);
  return session_ != nullptr && !session_->cancelled();
}

session_state RefreshCoordinator::state() const {
  std::lock_guard<std::mutex> control(control_mutex_);
  return session_ != nullptr ? session_->state() : session_state::IDLE;
}

void RefreshCoordinator::run_session(const std::shared_ptr<PollingSession>& session) {
  t_polling_coordinator = this;

  PollingLoop loop(fetcher_, RetryingFetchOperation(options_.retry, timer_), timer_, options_.refresh_interval,
                   [this, &session](model::FetchOutcome outcome, const std::uint64_t sequence) {
                     return deliver(*session, outcome, sequence);
                   });

  const LoopStats stats = loop.run(*session);
  std::cerr << "[coordinator] polling thread exiting | scheduled_ticks=" << stats.scheduled_ticks
            << " | manual_fetches=" << stats.manual_fetches << " | failed_fetches=" << stats.failed_fetches
            << " | published=" << stats.published << '\n';

  t_polling_coordinator = nullptr;
}

}  // namespace status_poller::polling
