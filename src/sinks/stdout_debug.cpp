#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace status_poller::sinks {

void StdoutDebugSink::on_update(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  if (!outcome.ok()) {
    const auto& error = outcome.error();
    std::printf("[update] at_ms=%llu error kind=%s attempts=%u message=%s\n",
                static_cast<unsigned long long>(completed_at_ms), model::to_string(error.kind), outcome.attempts,
                error.message.c_str());
    std::fflush(stdout);
    return;
  }

  const auto& snapshot = outcome.snapshot();
  std::printf("[update] at_ms=%llu status=%s cpu_pct=%d memory_mb=%d error_rate_pct=%.2f alerts=%zu pending=%zu attempts=%u\n",
              static_cast<unsigned long long>(completed_at_ms), snapshot.status.c_str(), snapshot.performance.cpu_usage_pct,
              snapshot.performance.memory_usage_mb, snapshot.performance.error_rate_pct, snapshot.active_alerts.size(),
              snapshot.pending_decisions.size(), outcome.attempts);
  std::fflush(stdout);
}

}  // namespace status_poller::sinks
