#pragma once

#include "model/fetch_outcome.hpp"

namespace status_poller::fetch {

// One attempt at retrieving a health snapshot from the backend.
// Failures are returned as values; implementations must not throw.
class StatusFetcher {
 public:
  virtual model::FetchResult fetch() = 0;
  virtual ~StatusFetcher() = default;
};

}  // namespace status_poller::fetch
