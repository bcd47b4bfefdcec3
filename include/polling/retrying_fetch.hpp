#pragma once

#include <chrono>
#include <cstdint>
#include <optional>

#include "core/cancellation.hpp"
#include "core/config.hpp"
#include "core/timer.hpp"
#include "fetch/status_fetcher.hpp"
#include "model/fetch_outcome.hpp"

namespace status_poller::polling {

inline constexpr std::chrono::milliseconds kMaxBackoffDelay = std::chrono::hours(24);

// Delay before retry number `retry_index` (0-based): base * 2^retry_index,
// saturating at kMaxBackoffDelay.
std::chrono::milliseconds backoff_delay(std::chrono::milliseconds base_delay, std::uint32_t retry_index) noexcept;

class RetryingFetchOperation {
 public:
  RetryingFetchOperation(core::RetryConfig config, core::Timer& timer);

  // Returns nullopt when the token is cancelled before the sequence completes.
  std::optional<model::FetchOutcome> run(fetch::StatusFetcher& fetcher, core::CancellationToken& token);

 private:
  core::RetryConfig config_;
  core::Timer& timer_;
};

}  // namespace status_poller::polling
