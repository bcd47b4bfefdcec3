#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include "core/config.hpp"
#include "core/timer.hpp"
#include "polling/refresh_coordinator.hpp"
#include "rpc/process_transport.hpp"
#include "rpc/rpc_status_fetcher.hpp"
#include "sinks/dashboard_state.hpp"
#include "sinks/fanout.hpp"
#include "sinks/redis_status.hpp"
#include "sinks/stdout_debug.hpp"

namespace {

constexpr std::chrono::milliseconds kSignalPollInterval{100};

volatile std::sig_atomic_t g_shutdown_requested = 0;
volatile std::sig_atomic_t g_refresh_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

void handle_refresh_signal(int /*signal*/) {
  g_refresh_requested = 1;
}

std::string format_config_settings(const status_poller::core::PollerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[poller] loaded config from " << config_path
         << " | refresh_interval_ms=" << config.refresh_interval.count()
         << " | max_retries=" << config.retry.max_attempts
         << " | base_delay_ms=" << config.retry.base_delay.count()
         << " | rpc_command=" << config.rpc.command
         << " | rpc_method=" << config.rpc.method
         << " | rpc_timeout_ms=" << config.rpc.timeout.count()
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false")
         << " | redis_db=" << config.redis.db
         << " | redis_auth=" << (config.redis.password.empty() ? "false" : "true")
         << " | redis_address=";

  if (!config.redis.unix_socket.empty()) {
    output << "unix://" << config.redis.unix_socket;
  } else {
    output << config.redis.host << ':' << config.redis.port;
  }
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  using namespace status_poller;

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::signal(SIGUSR1, handle_refresh_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/status-poller.yaml";

  core::PollerConfig config{};
  try {
    config = core::load_poller_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  rpc::ProcessTransportOptions transport_options{};
  transport_options.command = config.rpc.command;
  transport_options.timeout = config.rpc.timeout;
  rpc::JsonRpcStatusFetcher fetcher(std::make_unique<rpc::ProcessTransport>(transport_options), config.rpc.method);

  sinks::DashboardState dashboard;
  sinks::StdoutDebugSink stdout_sink;
  std::unique_ptr<sinks::RedisStatusSink> redis_sink;

  sinks::FanoutSink fanout;
  fanout.add(dashboard);
  if (config.stdout_debug) {
    fanout.add(stdout_sink);
  }

  if (config.redis.enabled) {
    sinks::RedisStatusOptions options{};
    options.host = config.redis.host;
    options.port = config.redis.port;
    options.unix_socket = config.redis.unix_socket;
    options.key_prefix = config.redis.key_prefix;
    options.password = config.redis.password;
    options.db = config.redis.db;
    redis_sink = std::make_unique<sinks::RedisStatusSink>(options);

    const std::string address =
        options.unix_socket.empty() ? options.host + ':' + std::to_string(options.port) : "unix://" + options.unix_socket;
    if (redis_sink->check_connectivity()) {
      std::cerr << "[poller] redis connectivity confirmed at " << address << '\n';
    } else {
      std::cerr << "[poller] redis connectivity check failed at " << address << '\n';
    }
    fanout.add(*redis_sink);
  }

  auto timer = core::make_steady_timer();
  polling::CoordinatorOptions coordinator_options{};
  coordinator_options.refresh_interval = config.refresh_interval;
  coordinator_options.retry = config.retry;
  polling::RefreshCoordinator coordinator(coordinator_options, fetcher, fanout, *timer);

  coordinator.start();
  while (g_shutdown_requested == 0) {
    if (g_refresh_requested != 0) {
      g_refresh_requested = 0;
      std::cerr << "[poller] manual refresh requested\n";
      coordinator.manual_refresh();
    }
    std::this_thread::sleep_for(kSignalPollInterval);
  }

  coordinator.stop();

  const auto view = dashboard.view();
  std::cerr << "[poller] shutdown signal received; exiting cleanly | updates=" << view.updates
            << " | consecutive_failures=" << view.consecutive_failures << '\n';

  return 0;
}
