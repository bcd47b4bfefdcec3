#include "stub/server.hpp"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "rpc/jsonrpc.hpp"

namespace status_poller::stub {
namespace {

class FixtureError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace

Server::Server(std::string fixture_path) : fixture_path_(std::move(fixture_path)) {}

int Server::run(std::istream& in, std::ostream& out, std::ostream& err) const {
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    bool should_respond = true;
    try {
      const auto request = nlohmann::json::parse(line);
      const auto response = handle_request(request, should_respond);
      if (should_respond) {
        out << response.dump() << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      err << "health-backend-stub: failed to process request: " << ex.what() << '\n';
      if (should_respond) {
        out << rpc::make_error_response(nullptr, rpc::JsonRpcError{.code = -32700, .message = "parse error"}).dump()
            << '\n';
        out.flush();
      }
    }
  }

  return 0;
}

nlohmann::json Server::handle_request(const nlohmann::json& request, bool& should_respond) const {
  nlohmann::json id = nullptr;
  try {
    const auto parsed = rpc::parse_request(request);
    should_respond = parsed.id.has_value();
    if (parsed.id.has_value()) {
      id = *parsed.id;
    }

    if (parsed.method == "get_system_health") {
      return rpc::make_result_response(id, handle_get_system_health());
    }

    return rpc::make_error_response(id, rpc::JsonRpcError{.code = -32601, .message = "method not found"});
  } catch (const std::invalid_argument& ex) {
    if (!should_respond) {
      return {};
    }
    return rpc::make_error_response(id, rpc::JsonRpcError{.code = -32602, .message = ex.what()});
  } catch (const FixtureError& ex) {
    if (!should_respond) {
      return {};
    }
    return rpc::make_error_response(id, rpc::JsonRpcError{.code = -32603, .message = ex.what()});
  }
}

nlohmann::json Server::handle_get_system_health() const {
  std::ifstream input(fixture_path_);
  if (!input.is_open()) {
    throw FixtureError("unable to open fixture: " + fixture_path_);
  }

  try {
    return nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    throw FixtureError(std::string("invalid fixture: ") + ex.what());
  }
}

}  // namespace status_poller::stub
