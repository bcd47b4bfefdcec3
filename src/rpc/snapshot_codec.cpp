#include "rpc/snapshot_codec.hpp"

#include <stdexcept>
#include <string>

namespace status_poller::rpc {

model::alert_priority parse_alert_priority(const std::string& value) {
  if (value == "Critical") {
    return model::alert_priority::CRITICAL;
  }
  if (value == "High") {
    return model::alert_priority::HIGH;
  }
  if (value == "Medium") {
    return model::alert_priority::MEDIUM;
  }
  if (value == "Low") {
    return model::alert_priority::LOW;
  }
  if (value == "Info") {
    return model::alert_priority::INFO;
  }
  throw std::invalid_argument("unknown alert priority: " + value);
}

nlohmann::json encode_outcome(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  nlohmann::json encoded{{"ok", outcome.ok()}, {"completed_at_ms", completed_at_ms}, {"attempts", outcome.attempts}};
  if (outcome.ok()) {
    encoded["snapshot"] = outcome.snapshot();
    return encoded;
  }

  const auto& error = outcome.error();
  encoded["error"] = {{"kind", model::to_string(error.kind)},
                      {"message", error.message},
                      {"attempt", error.attempt},
                      {"final_cause", model::to_string(error.final_cause)}};
  return encoded;
}

}  // namespace status_poller::rpc

namespace status_poller::model {

void from_json(const nlohmann::json& j, SystemAlert& alert) {
  j.at("message").get_to(alert.message);
  alert.priority = rpc::parse_alert_priority(j.at("priority").get<std::string>());
  j.at("created_at").get_to(alert.created_at);
  j.at("category").get_to(alert.category);
  alert.requires_action = j.value("requires_action", false);
}

void from_json(const nlohmann::json& j, DatabaseHealth& health) {
  j.at("avg_response_time").get_to(health.avg_response_time_ms);
  j.at("connection_pool_healthy").get_to(health.connection_pool_healthy);
  j.at("health_score").get_to(health.health_score);
  j.at("active_connections").get_to(health.active_connections);
  j.at("queries_last_hour").get_to(health.queries_last_hour);
}

void from_json(const nlohmann::json& j, PerformanceMetrics& metrics) {
  j.at("db_response_time").get_to(metrics.db_response_time_ms);
  j.at("db_health_score").get_to(metrics.db_health_score);
  j.at("memory_usage").get_to(metrics.memory_usage_mb);
  j.at("cpu_usage").get_to(metrics.cpu_usage_pct);
  j.at("requests_per_minute").get_to(metrics.requests_per_minute);
  j.at("error_rate").get_to(metrics.error_rate_pct);
}

void from_json(const nlohmann::json& j, HealthSnapshot& snapshot) {
  if (!j.is_object()) {
    throw std::invalid_argument("system health must be a JSON object");
  }

  j.at("status").get_to(snapshot.status);
  j.at("performance_metrics").get_to(snapshot.performance);
  j.at("active_alerts").get_to(snapshot.active_alerts);
  j.at("pending_decisions").get_to(snapshot.pending_decisions);

  snapshot.uptime_seconds = j.value("uptime_seconds", std::int64_t{0});
  snapshot.version = j.value("version", std::string{});
  snapshot.database_size_bytes = j.value("database_size", std::int64_t{0});
  snapshot.memory_usage_mb = j.value("memory_usage", std::int32_t{0});
  snapshot.timestamp = j.value("timestamp", std::string{});

  const auto db_it = j.find("database_health");
  if (db_it != j.end() && !db_it->is_null()) {
    snapshot.database_health = db_it->get<DatabaseHealth>();
  } else {
    snapshot.database_health.reset();
  }
}

void to_json(nlohmann::json& j, const SystemAlert& alert) {
  j = nlohmann::json{{"message", alert.message},
                     {"priority", to_string(alert.priority)},
                     {"created_at", alert.created_at},
                     {"category", alert.category},
                     {"requires_action", alert.requires_action}};
}

void to_json(nlohmann::json& j, const DatabaseHealth& health) {
  j = nlohmann::json{{"avg_response_time", health.avg_response_time_ms},
                     {"connection_pool_healthy", health.connection_pool_healthy},
                     {"health_score", health.health_score},
                     {"active_connections", health.active_connections},
                     {"queries_last_hour", health.queries_last_hour}};
}

void to_json(nlohmann::json& j, const PerformanceMetrics& metrics) {
  j = nlohmann::json{{"db_response_time", metrics.db_response_time_ms},
                     {"db_health_score", metrics.db_health_score},
                     {"memory_usage", metrics.memory_usage_mb},
                     {"cpu_usage", metrics.cpu_usage_pct},
                     {"requests_per_minute", metrics.requests_per_minute},
                     {"error_rate", metrics.error_rate_pct}};
}

void to_json(nlohmann::json& j, const HealthSnapshot& snapshot) {
  j = nlohmann::json{{"status", snapshot.status},
                     {"uptime_seconds", snapshot.uptime_seconds},
                     {"version", snapshot.version},
                     {"database_size", snapshot.database_size_bytes},
                     {"memory_usage", snapshot.memory_usage_mb},
                     {"performance_metrics", snapshot.performance},
                     {"active_alerts", snapshot.active_alerts},
                     {"pending_decisions", snapshot.pending_decisions},
                     {"timestamp", snapshot.timestamp}};
  if (snapshot.database_health.has_value()) {
    j["database_health"] = *snapshot.database_health;
  } else {
    j["database_health"] = nullptr;
  }
}

}  // namespace status_poller::model
