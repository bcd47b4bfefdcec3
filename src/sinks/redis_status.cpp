#include "sinks/redis_status.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include <hiredis/hiredis.h>

#include "rpc/snapshot_codec.hpp"

namespace status_poller::sinks {

RedisStatusSink::RedisStatusSink(RedisStatusOptions options) : options_(std::move(options)) {}

RedisStatusSink::~RedisStatusSink() = default;

bool RedisStatusSink::check_connectivity() {
  return ensure_connected();
}

void RedisStatusSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisStatusSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisStatusSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate()) {
    context_.reset();
    return false;
  }
  if (!select_db()) {
    context_.reset();
    return false;
  }

  return true;
}

bool RedisStatusSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisStatusSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] SELECT " << options_.db << " rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisStatusSink::publish(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  if (!ensure_connected()) {
    return false;
  }

  const std::string payload = rpc::encode_outcome(outcome, completed_at_ms).dump();
  if (publish_impl(payload)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(payload);
}

void RedisStatusSink::on_update(const model::FetchOutcome& outcome, const std::uint64_t completed_at_ms) {
  const bool ok = publish(outcome, completed_at_ms);
  if (!ok) {
    ++publish_errors_;
    if (was_ok_) {
      std::cerr << "[redis] publish failed\n";
      was_ok_ = false;
    }
  } else if (!was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    was_ok_ = true;
  }
}

bool RedisStatusSink::publish_impl(const std::string& payload) {
  if (!run_command({"SET", options_.key_prefix + ":latest", payload})) {
    return false;
  }
  return run_command({"PUBLISH", options_.key_prefix + ":updates", payload});
}

bool RedisStatusSink::run_command(const std::vector<std::string>& args) {
  command_argv_.clear();
  command_argv_len_.clear();
  for (const auto& arg : args) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(
      redisCommandArgv(context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(),
                       command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] " << args.front() << " rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace status_poller::sinks
