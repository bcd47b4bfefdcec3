#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sinks/state_sink.hpp"

struct redisContext;

namespace status_poller::sinks {

struct RedisStatusOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"dashboard:system_health"};
  std::uint32_t connect_timeout_ms{1000};
};

// Stores the latest outcome under <prefix>:latest and announces it on <prefix>:updates.
class RedisStatusSink final : public StateSink {
 public:
  explicit RedisStatusSink(RedisStatusOptions options = {});
  ~RedisStatusSink() override;

  RedisStatusSink(const RedisStatusSink&) = delete;
  RedisStatusSink& operator=(const RedisStatusSink&) = delete;

  bool check_connectivity();
  bool publish(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms);

  void on_update(const model::FetchOutcome& outcome, std::uint64_t completed_at_ms) override;

  [[nodiscard]] std::uint32_t publish_errors() const noexcept { return publish_errors_; }

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool publish_impl(const std::string& payload);
  bool run_command(const std::vector<std::string>& args);

  RedisStatusOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  std::uint32_t publish_errors_{0};
  bool was_ok_{true};
};

}  // namespace status_poller::sinks
