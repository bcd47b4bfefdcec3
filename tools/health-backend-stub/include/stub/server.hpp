#pragma once

#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

namespace status_poller::stub {

// Answers get_system_health with the contents of a JSON fixture, one
// JSON-RPC request per input line.
class Server {
 public:
  explicit Server(std::string fixture_path);

  int run(std::istream& in, std::ostream& out, std::ostream& err) const;

 private:
  nlohmann::json handle_request(const nlohmann::json& request, bool& should_respond) const;
  nlohmann::json handle_get_system_health() const;

  std::string fixture_path_;
};

}  // namespace status_poller::stub
