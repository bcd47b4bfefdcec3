#include "polling/retrying_fetch.hpp"

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>
#include <variant>

namespace status_poller::polling {
namespace {

constexpr std::uint32_t kMaxBackoffShift = 30;

}  // namespace

std::chrono::milliseconds backoff_delay(const std::chrono::milliseconds base_delay, const std::uint32_t retry_index) noexcept {
  if (base_delay.count() <= 0) {
    return std::chrono::milliseconds{0};
  }
  const auto shift = std::min(retry_index, kMaxBackoffShift);
  if (base_delay >= kMaxBackoffDelay || base_delay.count() > (kMaxBackoffDelay.count() >> shift)) {
    return kMaxBackoffDelay;
  }
  return base_delay * (std::int64_t{1} << shift);
}

RetryingFetchOperation::RetryingFetchOperation(core::RetryConfig config, core::Timer& timer)
    : config_(config), timer_(timer) {}

std::optional<model::FetchOutcome> RetryingFetchOperation::run(fetch::StatusFetcher& fetcher,
                                                               core::CancellationToken& token) {
  std::uint32_t retries = 0;
  const std::uint32_t max_total_attempts = config_.max_attempts + 1;

  while (true) {
    if (token.cancelled()) {
      return std::nullopt;
    }

    const std::uint32_t attempt = retries + 1;
    model::FetchResult result = fetcher.fetch();

    if (auto* snapshot = std::get_if<model::HealthSnapshot>(&result)) {
      if (retries > 0) {
        std::cerr << "[retry] system health recovered on attempt " << attempt << '/' << max_total_attempts << '\n';
      }
      return model::FetchOutcome{std::move(*snapshot), attempt};
    }

    auto& error = std::get<model::ErrorDetail>(result);
    error.attempt = attempt;

    if (retries >= config_.max_attempts) {
      std::cerr << "[retry] system health failed after " << attempt << " attempts: " << error.message << '\n';
      model::ErrorDetail exhausted{};
      exhausted.kind = model::error_kind::EXHAUSTED;
      exhausted.message = "system health failed after " + std::to_string(attempt) + " attempts: " + error.message;
      exhausted.attempt = attempt;
      exhausted.final_cause = error.kind;
      return model::FetchOutcome{std::move(exhausted), attempt};
    }

    const auto delay = backoff_delay(config_.base_delay, retries);
    std::cerr << "[retry] system health request failed (attempt " << attempt << '/' << max_total_attempts
              << ", " << model::to_string(error.kind) << "), retrying in " << delay.count() << "ms: "
              << error.message << '\n';

    if (timer_.wait_until(token, timer_.now() + delay, false) == core::wake_reason::CANCELLED) {
      return std::nullopt;
    }
    ++retries;
  }
}

}  // namespace status_poller::polling
