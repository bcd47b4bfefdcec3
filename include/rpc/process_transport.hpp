#pragma once

#include <chrono>
#include <string>

#include "rpc/transport.hpp"

namespace status_poller::rpc {

struct ProcessTransportOptions {
  std::string command{};
  std::chrono::milliseconds timeout{10000};
};

// Runs `/bin/sh -c command` per exchange. The request is written to the
// child's stdin, which is then closed; the first line of its stdout is the
// response. A child still running at the timeout is killed.
class ProcessTransport final : public Transport {
 public:
  explicit ProcessTransport(ProcessTransportOptions options);

  bool exchange(const std::string& request_line, std::string& response_line, std::string& error) override;

 private:
  ProcessTransportOptions options_;
};

}  // namespace status_poller::rpc
