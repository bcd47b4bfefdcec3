#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "fetch/status_fetcher.hpp"
#include "rpc/transport.hpp"

namespace status_poller::rpc {

// Fetches the health snapshot with one JSON-RPC call per attempt.
class JsonRpcStatusFetcher final : public fetch::StatusFetcher {
 public:
  JsonRpcStatusFetcher(std::unique_ptr<Transport> transport, std::string method = "get_system_health");

  model::FetchResult fetch() override;

 private:
  std::unique_ptr<Transport> transport_;
  std::string method_;
  std::uint64_t next_id_{1};
};

}  // namespace status_poller::rpc
