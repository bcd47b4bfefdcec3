#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace status_poller::core {

inline constexpr std::uint32_t kMaxRetryAttempts = 3;
inline constexpr std::chrono::milliseconds kBaseRetryDelay{1000};
inline constexpr std::chrono::milliseconds kAutoRefreshInterval{30000};

struct RetryConfig {
  std::uint32_t max_attempts{kMaxRetryAttempts};
  std::chrono::milliseconds base_delay{kBaseRetryDelay};
};

struct RpcConfig {
  std::string command{"health-backend-stub configs/health_snapshot.json"};
  std::string method{"get_system_health"};
  std::chrono::milliseconds timeout{10000};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"dashboard:system_health"};
  std::string password{};
  int db{0};
  bool enabled{false};
};

struct PollerConfig {
  std::chrono::milliseconds refresh_interval{kAutoRefreshInterval};
  RetryConfig retry{};
  RpcConfig rpc{};
  bool stdout_debug{true};
  RedisConfig redis{};
};

PollerConfig load_poller_config(const std::string& path);

}  // namespace status_poller::core
