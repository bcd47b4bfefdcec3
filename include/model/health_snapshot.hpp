#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace status_poller::model {

enum class alert_priority : std::uint8_t {
    CRITICAL = 0,
    HIGH = 1,
    MEDIUM = 2,
    LOW = 3,
    INFO = 4,
};

struct SystemAlert {
    std::string message{};
    alert_priority priority{alert_priority::INFO};
    std::string created_at{};
    std::string category{};
    bool requires_action{false};
};

struct DatabaseHealth {
    std::int32_t avg_response_time_ms{0};
    bool connection_pool_healthy{false};
    std::int32_t health_score{0};
    std::int32_t active_connections{0};
    std::int32_t queries_last_hour{0};
};

struct PerformanceMetrics {
    std::int32_t db_response_time_ms{0};
    std::int32_t db_health_score{0};
    std::int32_t memory_usage_mb{0};
    std::int32_t cpu_usage_pct{0};
    std::int32_t requests_per_minute{0};
    double error_rate_pct{0.0};
};

// One complete health report from a successful fetch.
// Alerts and pending decisions keep the producer's order.
struct HealthSnapshot {
    std::string status{};
    std::int64_t uptime_seconds{0};
    std::string version{};
    std::int64_t database_size_bytes{0};
    std::int32_t memory_usage_mb{0};
    std::optional<DatabaseHealth> database_health{};
    PerformanceMetrics performance{};
    std::vector<SystemAlert> active_alerts{};
    std::vector<std::string> pending_decisions{};
    // Producer-side timestamp, verbatim; empty when the producer omits it.
    std::string timestamp{};
};

const char* to_string(alert_priority priority) noexcept;

} // namespace status_poller::model
