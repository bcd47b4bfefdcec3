#include "model/fetch_outcome.hpp"
#include "model/health_snapshot.hpp"

namespace status_poller::model {

const char* to_string(const alert_priority priority) noexcept {
  switch (priority) {
    case alert_priority::CRITICAL:
      return "Critical";
    case alert_priority::HIGH:
      return "High";
    case alert_priority::MEDIUM:
      return "Medium";
    case alert_priority::LOW:
      return "Low";
    case alert_priority::INFO:
      return "Info";
  }
  return "Info";
}

const char* to_string(const error_kind kind) noexcept {
  switch (kind) {
    case error_kind::TRANSPORT:
      return "transport";
    case error_kind::DECODE:
      return "decode";
    case error_kind::EXHAUSTED:
      return "exhausted";
  }
  return "transport";
}

}  // namespace status_poller::model
