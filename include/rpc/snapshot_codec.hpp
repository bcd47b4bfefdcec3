#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "model/fetch_outcome.hpp"
#include "model/health_snapshot.hpp"

namespace status_poller::model {

// Field names follow the backend's snake_case serialization.
// Decoding throws nlohmann::json::exception or std::invalid_argument on shape mismatch.
void from_json(const nlohmann::json& j, SystemAlert& alert);
void from_json(const nlohmann::json& j, DatabaseHealth& health);
void from_json(const nlohmann::json& j, PerformanceMetrics& metrics);
void from_json(const nlohmann::json& j, HealthSnapshot& snapshot);

void to_json(nlohmann::json& j, const SystemAlert& alert);
void to_json(nlohmann::json& j, const DatabaseHealth& health);
void to_json(nlohmann::json& j, const PerformanceMetrics& metrics);
void to_json(nlohmann::json& j, const HealthSnapshot& snapshot);

}  // namespace status_poller::model

namespace status_poller::rpc {

model::alert_priority parse_alert_priority(const std::string& value);

// Outcome envelope written by the Redis sink:
// {"ok", "completed_at_ms", "attempts", "snapshot" | "error"}.
nlohmann::json encode_outcome(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms);

}  // namespace status_poller::rpc
