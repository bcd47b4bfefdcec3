#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace status_poller::core {
namespace {

constexpr long long kMaxConfigurableRetries = 16;
constexpr long long kMaxRedisDb = 15;
constexpr std::chrono::milliseconds kMaxIntervalMs = std::chrono::hours(24);
constexpr std::chrono::milliseconds kMaxBaseDelayMs = std::chrono::hours(1);

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  const std::string lower = [&value]() {
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
  }();

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

std::chrono::milliseconds parse_bounded_ms(const std::string& key, const std::string& value,
                                           const std::chrono::milliseconds max) {
  const auto parsed = std::stoll(value);
  if (parsed <= 0 || parsed > max.count()) {
    throw std::runtime_error(key + " must be in range 1.." + std::to_string(max.count()));
  }
  return std::chrono::milliseconds(parsed);
}

// A '#' starts a comment at line start or after whitespace, outside quotes.
void strip_comment(std::string& line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char c = line[i];
    if (quote != '\0') {
      if (c == quote) {
        quote = '\0';
      }
      continue;
    }
    if (c == '"' || c == '\'') {
      quote = c;
      continue;
    }
    if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(line[i - 1])) != 0)) {
      line.erase(i);
      return;
    }
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(PollerConfig& config, const std::string& key, const std::string& value) {
  if (key == "refresh.interval_ms") {
    config.refresh_interval = parse_bounded_ms(key, value, kMaxIntervalMs);
    return;
  }

  if (key == "retry.max_attempts") {
    const auto attempts = std::stoll(value);
    if (attempts < 0 || attempts > kMaxConfigurableRetries) {
      throw std::runtime_error("retry.max_attempts must be in range 0..16");
    }
    config.retry.max_attempts = static_cast<std::uint32_t>(attempts);
    return;
  }

  if (key == "retry.base_delay_ms") {
    config.retry.base_delay = parse_bounded_ms(key, value, kMaxBaseDelayMs);
    return;
  }

  if (key == "rpc.command") {
    config.rpc.command = value;
    return;
  }

  if (key == "rpc.method") {
    config.rpc.method = value;
    return;
  }

  if (key == "rpc.timeout_ms") {
    config.rpc.timeout = parse_bounded_ms(key, value, kMaxIntervalMs);
    return;
  }

  if (key == "dashboard.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = std::stoll(value);
    if (db < 0 || db > kMaxRedisDb) {
      throw std::runtime_error("redis.db must be in range 0..15");
    }
    config.redis.db = static_cast<int>(db);
  }
}

}  // namespace

PollerConfig load_poller_config(const std::string& path) {
  PollerConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    strip_comment(line);

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (depth > sections.size()) {
        throw std::runtime_error("invalid indentation for section '" + key + "' at line " +
                                 std::to_string(line_number));
      }
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace status_poller::core
