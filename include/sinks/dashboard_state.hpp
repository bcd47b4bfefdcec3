#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>

#include "model/fetch_outcome.hpp"
#include "sinks/state_sink.hpp"

namespace status_poller::sinks {

struct DashboardView {
  // Last good snapshot; kept while failures are shown.
  std::optional<model::HealthSnapshot> snapshot{};
  std::optional<model::ErrorDetail> error{};
  std::uint64_t last_updated_ms{0};
  std::uint64_t last_outcome_ms{0};
  std::uint32_t consecutive_failures{0};
  std::uint32_t last_attempts{0};
  std::size_t updates{0};
};

// View model read by the UI thread while the polling thread writes it.
class DashboardState final : public StateSink {
 public:
  void on_update(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms) override;

  [[nodiscard]] DashboardView view() const;

 private:
  mutable std::mutex mutex_;
  DashboardView view_{};
};

}  // namespace status_poller::sinks
