#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace status_poller::rpc {

constexpr const char* kJsonRpcVersion = "2.0";

struct JsonRpcError {
  int code;
  std::string message;
};

struct JsonRpcRequest {
  std::string method;
  nlohmann::json params;
  std::optional<nlohmann::json> id;
};

struct JsonRpcResponse {
  nlohmann::json id;
  std::optional<nlohmann::json> result;
  std::optional<JsonRpcError> error;
};

JsonRpcRequest parse_request(const nlohmann::json& request);
JsonRpcResponse parse_response(const nlohmann::json& response);

nlohmann::json make_request(std::uint64_t id, const std::string& method, const nlohmann::json& params);
nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error);

}  // namespace status_poller::rpc
