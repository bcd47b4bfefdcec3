#include "rpc/jsonrpc.hpp"

#include <stdexcept>

namespace status_poller::rpc {

namespace {

void validate_id(const nlohmann::json& id) {
  if (id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned()) {
    return;
  }
  throw std::invalid_argument("JSON-RPC id must be string, integer, or null");
}

void validate_version(const nlohmann::json& message) {
  const auto jsonrpc_it = message.find("jsonrpc");
  if (jsonrpc_it == message.end() || !jsonrpc_it->is_string() || *jsonrpc_it != kJsonRpcVersion) {
    throw std::invalid_argument("jsonrpc must be \"2.0\"");
  }
}

}  // namespace

JsonRpcRequest parse_request(const nlohmann::json& request) {
  if (!request.is_object()) {
    throw std::invalid_argument("Request must be a JSON object");
  }

  validate_version(request);

  const auto method_it = request.find("method");
  if (method_it == request.end() || !method_it->is_string()) {
    throw std::invalid_argument("method must be a string");
  }

  JsonRpcRequest parsed{.method = method_it->get<std::string>(), .params = nlohmann::json::object(), .id = std::nullopt};

  const auto params_it = request.find("params");
  if (params_it != request.end()) {
    if (!params_it->is_object() && !params_it->is_array()) {
      throw std::invalid_argument("params must be an object or an array");
    }
    parsed.params = *params_it;
  }

  const auto id_it = request.find("id");
  if (id_it != request.end()) {
    validate_id(*id_it);
    parsed.id = *id_it;
  }

  return parsed;
}

JsonRpcResponse parse_response(const nlohmann::json& response) {
  if (!response.is_object()) {
    throw std::invalid_argument("Response must be a JSON object");
  }

  validate_version(response);

  JsonRpcResponse parsed{.id = nullptr, .result = std::nullopt, .error = std::nullopt};

  const auto id_it = response.find("id");
  if (id_it == response.end()) {
    throw std::invalid_argument("response id is missing");
  }
  validate_id(*id_it);
  parsed.id = *id_it;

  const auto result_it = response.find("result");
  const auto error_it = response.find("error");
  const bool has_result = result_it != response.end();
  const bool has_error = error_it != response.end();
  if (has_result == has_error) {
    throw std::invalid_argument("response must carry exactly one of result or error");
  }

  if (has_result) {
    parsed.result = *result_it;
    return parsed;
  }

  if (!error_it->is_object()) {
    throw std::invalid_argument("error must be an object");
  }
  const auto code_it = error_it->find("code");
  const auto message_it = error_it->find("message");
  if (code_it == error_it->end() || !code_it->is_number_integer()) {
    throw std::invalid_argument("error.code must be an integer");
  }
  if (message_it == error_it->end() || !message_it->is_string()) {
    throw std::invalid_argument("error.message must be a string");
  }
  parsed.error = JsonRpcError{.code = code_it->get<int>(), .message = message_it->get<std::string>()};
  return parsed;
}

nlohmann::json make_request(const std::uint64_t id, const std::string& method, const nlohmann::json& params) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"method", method}, {"params", params}};
}

nlohmann::json make_result_response(const nlohmann::json& id, const nlohmann::json& result) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion}, {"id", id}, {"result", result}};
}

nlohmann::json make_error_response(const nlohmann::json& id, const JsonRpcError& error) {
  return nlohmann::json{{"jsonrpc", kJsonRpcVersion},
                        {"id", id},
                        {"error", {{"code", error.code}, {"message", error.message}}}};
}

}  // namespace status_poller::rpc
