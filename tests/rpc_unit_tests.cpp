#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/fetch_outcome.hpp"
#include "rpc/jsonrpc.hpp"
#include "rpc/process_transport.hpp"
#include "rpc/rpc_status_fetcher.hpp"
#include "rpc/snapshot_codec.hpp"
#include "rpc/transport.hpp"
#include "stub/server.hpp"

using status_poller::model::ErrorDetail;
using status_poller::model::FetchOutcome;
using status_poller::model::FetchResult;
using status_poller::model::HealthSnapshot;
using status_poller::model::alert_priority;
using status_poller::model::error_kind;
using status_poller::rpc::JsonRpcStatusFetcher;
using status_poller::rpc::ProcessTransport;
using status_poller::rpc::ProcessTransportOptions;
using status_poller::rpc::Transport;
using status_poller::rpc::encode_outcome;
using status_poller::rpc::make_request;
using status_poller::rpc::parse_response;
using status_poller::stub::Server;

namespace {

using namespace std::chrono_literals;

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

const char* kSnapshotJson = R"({
  "status": "degraded",
  "uptime_seconds": 3600,
  "database_health": {
    "avg_response_time": 45,
    "connection_pool_healthy": false,
    "health_score": 61,
    "active_connections": 9,
    "queries_last_hour": 5000
  },
  "performance_metrics": {
    "db_response_time": 45,
    "db_health_score": 61,
    "memory_usage": 512,
    "cpu_usage": 77,
    "requests_per_minute": 120,
    "error_rate": 3.5
  },
  "active_alerts": [
    {"message": "pool saturated", "priority": "Critical", "created_at": "2025-01-01T00:00:00Z",
     "category": "database", "requires_action": true},
    {"message": "slow queries", "priority": "Medium", "created_at": "2025-01-01T00:01:00Z",
     "category": "database", "requires_action": false}
  ],
  "pending_decisions": ["scale pool", "rotate logs"],
  "version": "2.0.1",
  "database_size": 1048576,
  "memory_usage": 512,
  "timestamp": "2025-01-01T00:02:00Z"
})";

// Replies with a canned line, or fails when the line is empty.
class FakeTransport final : public Transport {
 public:
  explicit FakeTransport(std::vector<std::string> responses) : responses_(std::move(responses)) {}

  bool exchange(const std::string& request_line, std::string& response_line, std::string& error) override {
    requests_.push_back(request_line);
    const std::size_t call = requests_.size() - 1;
    if (call >= responses_.size() || responses_[call].empty()) {
      error = "connection refused";
      return false;
    }
    response_line = responses_[call];
    return true;
  }

  const std::vector<std::string>& requests() const { return requests_; }

 private:
  std::vector<std::string> responses_;
  std::vector<std::string> requests_{};
};

std::string result_line(const std::uint64_t id, const nlohmann::json& result) {
  return status_poller::rpc::make_result_response(id, result).dump();
}

FetchResult fetch_with(const std::string& line, std::vector<std::string>* requests = nullptr) {
  auto transport = std::make_unique<FakeTransport>(std::vector<std::string>{line});
  FakeTransport* raw = transport.get();
  JsonRpcStatusFetcher fetcher(std::move(transport));
  FetchResult result = fetcher.fetch();
  if (requests != nullptr) {
    *requests = raw->requests();
  }
  return result;
}

const ErrorDetail* as_error(const FetchResult& result) { return std::get_if<ErrorDetail>(&result); }

int test_snapshot_decode() {
  const auto snapshot = nlohmann::json::parse(kSnapshotJson).get<HealthSnapshot>();

  if (snapshot.status != "degraded" || snapshot.uptime_seconds != 3600 || snapshot.version != "2.0.1") {
    return fail("test_snapshot_decode", "top-level fields mismatch");
  }
  if (snapshot.database_size_bytes != 1048576 || snapshot.memory_usage_mb != 512) {
    return fail("test_snapshot_decode", "size fields mismatch");
  }
  if (!snapshot.database_health.has_value() || snapshot.database_health->health_score != 61 ||
      snapshot.database_health->connection_pool_healthy) {
    return fail("test_snapshot_decode", "database health mismatch");
  }
  if (snapshot.performance.cpu_usage_pct != 77 || snapshot.performance.error_rate_pct != 3.5) {
    return fail("test_snapshot_decode", "performance metrics mismatch");
  }
  if (snapshot.active_alerts.size() != 2 || snapshot.active_alerts[0].priority != alert_priority::CRITICAL ||
      snapshot.active_alerts[1].priority != alert_priority::MEDIUM || !snapshot.active_alerts[0].requires_action) {
    return fail("test_snapshot_decode", "alerts should keep order and priority");
  }
  if (snapshot.pending_decisions != std::vector<std::string>{"scale pool", "rotate logs"}) {
    return fail("test_snapshot_decode", "pending decisions should keep order");
  }
  return 0;
}

int test_snapshot_decode_optional_fields() {
  auto payload = nlohmann::json::parse(kSnapshotJson);
  payload["database_health"] = nullptr;
  payload.erase("version");
  payload.erase("timestamp");

  const auto snapshot = payload.get<HealthSnapshot>();
  if (snapshot.database_health.has_value() || !snapshot.version.empty() || !snapshot.timestamp.empty()) {
    return fail("test_snapshot_decode_optional_fields", "absent optional fields should stay empty");
  }

  auto missing_status = nlohmann::json::parse(kSnapshotJson);
  missing_status.erase("status");
  bool threw = false;
  try {
    (void)missing_status.get<HealthSnapshot>();
  } catch (const nlohmann::json::exception&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_snapshot_decode_optional_fields", "missing status should be a shape error");
  }

  auto bad_priority = nlohmann::json::parse(kSnapshotJson);
  bad_priority["active_alerts"][0]["priority"] = "Urgent";
  threw = false;
  try {
    (void)bad_priority.get<HealthSnapshot>();
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_snapshot_decode_optional_fields", "unknown priority should be rejected");
  }
  return 0;
}

int test_parse_response_validation() {
  const auto ok = parse_response(nlohmann::json::parse(R"({"jsonrpc":"2.0","id":3,"result":{}})"));
  if (ok.id != 3 || !ok.result.has_value() || ok.error.has_value()) {
    return fail("test_parse_response_validation", "result response should parse");
  }

  const auto err = parse_response(
      nlohmann::json::parse(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32000,"message":"db offline"}})"));
  if (!err.error.has_value() || err.error->code != -32000 || err.error->message != "db offline") {
    return fail("test_parse_response_validation", "error response should parse");
  }

  const std::vector<std::string> invalid = {
      R"([1,2])",
      R"({"jsonrpc":"1.0","id":1,"result":{}})",
      R"({"jsonrpc":"2.0","result":{}})",
      R"({"jsonrpc":"2.0","id":1})",
      R"({"jsonrpc":"2.0","id":1,"result":{},"error":{"code":1,"message":"x"}})",
      R"({"jsonrpc":"2.0","id":1,"error":{"code":"x","message":"x"}})",
  };
  for (const auto& text : invalid) {
    bool threw = false;
    try {
      (void)parse_response(nlohmann::json::parse(text));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    if (!threw) {
      return fail("test_parse_response_validation", "invalid envelope should be rejected");
    }
  }

  const auto request = make_request(7, "get_system_health", nlohmann::json::object());
  if (request.at("jsonrpc") != "2.0" || request.at("id") != 7 || request.at("method") != "get_system_health") {
    return fail("test_parse_response_validation", "request envelope mismatch");
  }
  return 0;
}

int test_fetcher_success_and_request_ids() {
  const auto snapshot = nlohmann::json::parse(kSnapshotJson);
  auto transport =
      std::make_unique<FakeTransport>(std::vector<std::string>{result_line(1, snapshot), result_line(2, snapshot)});
  FakeTransport* raw = transport.get();
  JsonRpcStatusFetcher fetcher(std::move(transport));

  const auto first = fetcher.fetch();
  const auto second = fetcher.fetch();
  if (!std::holds_alternative<HealthSnapshot>(first) || !std::holds_alternative<HealthSnapshot>(second)) {
    return fail("test_fetcher_success_and_request_ids", "well-formed responses should decode");
  }
  if (std::get<HealthSnapshot>(first).status != "degraded") {
    return fail("test_fetcher_success_and_request_ids", "decoded snapshot mismatch");
  }

  const auto& requests = raw->requests();
  if (requests.size() != 2) {
    return fail("test_fetcher_success_and_request_ids", "one request per fetch");
  }
  const auto first_request = nlohmann::json::parse(requests[0]);
  const auto second_request = nlohmann::json::parse(requests[1]);
  if (first_request.at("method") != "get_system_health" || first_request.at("id") != 1 ||
      second_request.at("id") != 2) {
    return fail("test_fetcher_success_and_request_ids", "request ids should increase from 1");
  }
  return 0;
}

int test_fetcher_error_classification() {
  const auto* transport_error = as_error(fetch_with(""));
  if (transport_error == nullptr || transport_error->kind != error_kind::TRANSPORT ||
      transport_error->message.find("connection refused") == std::string::npos) {
    return fail("test_fetcher_error_classification", "transport failure should be TRANSPORT");
  }

  const auto* garbage = as_error(fetch_with("not json"));
  if (garbage == nullptr || garbage->kind != error_kind::DECODE) {
    return fail("test_fetcher_error_classification", "malformed JSON should be DECODE");
  }

  const auto* wrong_id = as_error(fetch_with(result_line(99, nlohmann::json::parse(kSnapshotJson))));
  if (wrong_id == nullptr || wrong_id->kind != error_kind::DECODE) {
    return fail("test_fetcher_error_classification", "mismatched id should be DECODE");
  }

  const auto* remote = as_error(fetch_with(
      status_poller::rpc::make_error_response(1, {.code = -32000, .message = "database offline"}).dump()));
  if (remote == nullptr || remote->kind != error_kind::TRANSPORT ||
      remote->message.find("database offline") == std::string::npos) {
    return fail("test_fetcher_error_classification", "backend error object should be TRANSPORT");
  }

  auto wrong_shape = nlohmann::json::parse(kSnapshotJson);
  wrong_shape["performance_metrics"] = "n/a";
  const auto* shape = as_error(fetch_with(result_line(1, wrong_shape)));
  if (shape == nullptr || shape->kind != error_kind::DECODE) {
    return fail("test_fetcher_error_classification", "shape mismatch should be DECODE");
  }

  auto bad_priority = nlohmann::json::parse(kSnapshotJson);
  bad_priority["active_alerts"][1]["priority"] = "Whenever";
  const auto* priority = as_error(fetch_with(result_line(1, bad_priority)));
  if (priority == nullptr || priority->kind != error_kind::DECODE) {
    return fail("test_fetcher_error_classification", "unknown priority should be DECODE");
  }
  return 0;
}

int test_encode_outcome() {
  const auto snapshot = nlohmann::json::parse(kSnapshotJson).get<HealthSnapshot>();
  const auto ok = encode_outcome(FetchOutcome{snapshot, 2}, 1700000000000ULL);
  if (ok.at("ok") != true || ok.at("attempts") != 2 || ok.at("completed_at_ms") != 1700000000000ULL ||
      ok.at("snapshot").at("status") != "degraded" ||
      ok.at("snapshot").at("active_alerts").at(0).at("priority") != "Critical") {
    return fail("test_encode_outcome", "success envelope mismatch");
  }

  ErrorDetail error{};
  error.kind = error_kind::EXHAUSTED;
  error.message = "system health failed after 4 attempts: down";
  error.attempt = 4;
  error.final_cause = error_kind::TRANSPORT;
  const auto failed = encode_outcome(FetchOutcome{error, 4}, 5);
  if (failed.at("ok") != false || failed.contains("snapshot") || failed.at("error").at("kind") != "exhausted" ||
      failed.at("error").at("final_cause") != "transport" || failed.at("error").at("attempt") != 4) {
    return fail("test_encode_outcome", "failure envelope mismatch");
  }
  return 0;
}

int test_process_transport_exchange() {
  ProcessTransport echo(ProcessTransportOptions{.command = "cat", .timeout = 5000ms});
  std::string response;
  std::string error;
  if (!echo.exchange(R"({"ping":1})", response, error) || response != R"({"ping":1})") {
    return fail("test_process_transport_exchange", "cat should echo the request line");
  }

  ProcessTransport first_line(ProcessTransportOptions{.command = "printf 'one\\ntwo\\n'", .timeout = 5000ms});
  if (!first_line.exchange("ignored", response, error) || response != "one") {
    return fail("test_process_transport_exchange", "only the first output line is the response");
  }

  ProcessTransport silent(ProcessTransportOptions{.command = "exit 3", .timeout = 5000ms});
  if (silent.exchange("{}", response, error) || error.find("status 3") == std::string::npos) {
    return fail("test_process_transport_exchange", "silent exit should report its status");
  }

  ProcessTransport missing(
      ProcessTransportOptions{.command = "/nonexistent/health-backend-binary", .timeout = 5000ms});
  if (missing.exchange("{}", response, error) || error.empty()) {
    return fail("test_process_transport_exchange", "missing command should fail");
  }
  return 0;
}

int test_process_transport_timeout() {
  ProcessTransport slow(ProcessTransportOptions{.command = "sleep 5", .timeout = 100ms});
  std::string response;
  std::string error;

  const auto start = std::chrono::steady_clock::now();
  const bool ok = slow.exchange("{}", response, error);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  if (ok || error.find("timed out") == std::string::npos) {
    return fail("test_process_transport_timeout", "slow backend should time out");
  }
  if (elapsed > 3s) {
    return fail("test_process_transport_timeout", "timed out child should be killed promptly");
  }
  return 0;
}

int test_stub_server() {
  const auto fixture = std::filesystem::temp_directory_path() / "status_poller_stub_fixture.json";
  {
    std::ofstream out(fixture);
    out << kSnapshotJson;
  }

  Server server(fixture.string());
  std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"get_system_health","params":{}})"
                        "\n"
                        R"({"jsonrpc":"2.0","method":"get_system_health"})"
                        "\n"
                        R"({"jsonrpc":"2.0","id":"x","method":"get_alerts"})"
                        "\n"
                        "{broken\n");
  std::ostringstream out;
  std::ostringstream err;
  const int rc = server.run(in, out, err);

  std::vector<nlohmann::json> responses;
  std::istringstream lines(out.str());
  std::string line;
  while (std::getline(lines, line)) {
    responses.push_back(nlohmann::json::parse(line));
  }
  std::filesystem::remove(fixture);

  if (rc != 0 || responses.size() != 3) {
    return fail("test_stub_server", "notifications get no response");
  }
  const auto first = parse_response(responses[0]);
  if (first.id != 1 || !first.result.has_value() || first.result->get<HealthSnapshot>().status != "degraded") {
    return fail("test_stub_server", "get_system_health should return the fixture");
  }
  const auto unknown = parse_response(responses[1]);
  if (unknown.id != "x" || !unknown.error.has_value() || unknown.error->code != -32601) {
    return fail("test_stub_server", "unknown method should be -32601");
  }
  const auto broken = parse_response(responses[2]);
  if (!broken.id.is_null() || !broken.error.has_value() || broken.error->code != -32700) {
    return fail("test_stub_server", "unparseable line should be -32700");
  }

  Server missing_fixture("/nonexistent/fixture.json");
  std::istringstream one(R"({"jsonrpc":"2.0","id":2,"method":"get_system_health"})"
                         "\n");
  std::ostringstream missing_out;
  missing_fixture.run(one, missing_out, err);
  const auto missing = parse_response(nlohmann::json::parse(missing_out.str()));
  if (!missing.error.has_value() || missing.error->code != -32603) {
    return fail("test_stub_server", "unreadable fixture should be -32603");
  }
  return 0;
}

int test_fetcher_over_process_transport() {
  const auto response_file = std::filesystem::temp_directory_path() / "status_poller_response.jsonl";
  {
    std::ofstream out(response_file);
    out << result_line(1, nlohmann::json::parse(kSnapshotJson)) << '\n';
  }

  JsonRpcStatusFetcher fetcher(std::make_unique<ProcessTransport>(
      ProcessTransportOptions{.command = "cat >/dev/null; cat " + response_file.string(), .timeout = 5000ms}));
  const auto result = fetcher.fetch();
  std::filesystem::remove(response_file);

  if (!std::holds_alternative<HealthSnapshot>(result) ||
      std::get<HealthSnapshot>(result).active_alerts.size() != 2) {
    return fail("test_fetcher_over_process_transport", "end-to-end fetch should decode the snapshot");
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_snapshot_decode(); rc != 0) return rc;
  if (int rc = test_snapshot_decode_optional_fields(); rc != 0) return rc;
  if (int rc = test_parse_response_validation(); rc != 0) return rc;
  if (int rc = test_fetcher_success_and_request_ids(); rc != 0) return rc;
  if (int rc = test_fetcher_error_classification(); rc != 0) return rc;
  if (int rc = test_encode_outcome(); rc != 0) return rc;
  if (int rc = test_process_transport_exchange(); rc != 0) return rc;
  if (int rc = test_process_transport_timeout(); rc != 0) return rc;
  if (int rc = test_stub_server(); rc != 0) return rc;
  if (int rc = test_fetcher_over_process_transport(); rc != 0) return rc;

  std::cout << "[PASS] rpc unit tests\n";
  return 0;
}
