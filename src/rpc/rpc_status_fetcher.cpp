#include "rpc/rpc_status_fetcher.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "rpc/jsonrpc.hpp"
#include "rpc/snapshot_codec.hpp"

namespace status_poller::rpc {
namespace {

model::ErrorDetail make_error(const model::error_kind kind, std::string message) {
  model::ErrorDetail error{};
  error.kind = kind;
  error.message = std::move(message);
  error.final_cause = kind;
  return error;
}

}  // namespace

JsonRpcStatusFetcher::JsonRpcStatusFetcher(std::unique_ptr<Transport> transport, std::string method)
    : transport_(std::move(transport)), method_(std::move(method)) {}

model::FetchResult JsonRpcStatusFetcher::fetch() {
  const std::uint64_t id = next_id_++;
  const std::string request = make_request(id, method_, nlohmann::json::object()).dump();

  std::string response_line;
  std::string transport_error;
  if (transport_ == nullptr || !transport_->exchange(request, response_line, transport_error)) {
    return make_error(model::error_kind::TRANSPORT,
                      "failed to invoke " + method_ + ": " + (transport_ == nullptr ? "no transport" : transport_error));
  }

  JsonRpcResponse response{};
  try {
    response = parse_response(nlohmann::json::parse(response_line));
  } catch (const nlohmann::json::exception& ex) {
    return make_error(model::error_kind::DECODE, std::string("malformed response: ") + ex.what());
  } catch (const std::invalid_argument& ex) {
    return make_error(model::error_kind::DECODE, std::string("malformed response: ") + ex.what());
  }

  if (response.id != nlohmann::json(id)) {
    return make_error(model::error_kind::DECODE, "response id " + response.id.dump() + " does not match request id " +
                                                     std::to_string(id));
  }

  if (response.error.has_value()) {
    return make_error(model::error_kind::TRANSPORT, method_ + " returned error " +
                                                        std::to_string(response.error->code) + ": " +
                                                        response.error->message);
  }

  try {
    return response.result->get<model::HealthSnapshot>();
  } catch (const nlohmann::json::exception& ex) {
    return make_error(model::error_kind::DECODE, std::string("failed to parse system health: ") + ex.what());
  } catch (const std::invalid_argument& ex) {
    return make_error(model::error_kind::DECODE, std::string("failed to parse system health: ") + ex.what());
  }
}

}  // namespace status_poller::rpc
