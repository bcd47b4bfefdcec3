#pragma once

#include <string>

namespace status_poller::rpc {

// Carries one request line to the backend and returns one response line.
class Transport {
 public:
  virtual bool exchange(const std::string& request_line, std::string& response_line, std::string& error) = 0;
  virtual ~Transport() = default;
};

}  // namespace status_poller::rpc
