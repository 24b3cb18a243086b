#include "relay/config.hpp"

#include "relay/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>

namespace relay {

expected<int64_t, ErrorCode> parse_int(std::string_view text, int64_t min, int64_t max) {
  using Result = expected<int64_t, ErrorCode>;
  if (text.empty() || text.size() > 20)
    return Result::error(ErrorCode::kInvalidConfig);
  // strtoll would skip leading whitespace and accept '+'
  if (text[0] != '-' && (text[0] < '0' || text[0] > '9'))
    return Result::error(ErrorCode::kInvalidConfig);

  std::string buf(text);
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(buf.c_str(), &end, 10);
  if (errno != 0 || end != buf.c_str() + buf.size())
    return Result::error(ErrorCode::kInvalidConfig);
  if (value < min || value > max)
    return Result::error(ErrorCode::kInvalidConfig);
  return Result::success(static_cast<int64_t>(value));
}

expected<uint16_t, ErrorCode> parse_port(std::string_view text) {
  auto value = parse_int(text, 0, std::numeric_limits<uint16_t>::max());
  if (!value.has_value())
    return expected<uint16_t, ErrorCode>::error(value.get_error());
  return expected<uint16_t, ErrorCode>::success(static_cast<uint16_t>(value.value()));
}

namespace {

const char* env(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

}  // namespace

expected<ServerConfig, ErrorCode> ServerConfig::from_env() {
  using Result = expected<ServerConfig, ErrorCode>;
  ServerConfig cfg;

  if (const char* v = env("PORT")) {
    auto port = parse_port(v);
    if (!port.has_value()) {
      RELAY_LOG_WARN(std::string("Invalid PORT: ") + v);
      return Result::error(port.get_error());
    }
    cfg.port = port.value();
  }

  if (const char* v = env("HOST"))
    cfg.host = v;

  if (const char* v = env("RELAY_DEBUG"))
    cfg.debug = std::string_view(v) == "1";

  if (const char* v = env("HEARTBEAT_INTERVAL")) {
    auto interval = parse_int(v, 1, std::numeric_limits<int32_t>::max());
    if (!interval.has_value()) {
      RELAY_LOG_WARN(std::string("Invalid HEARTBEAT_INTERVAL: ") + v);
      return Result::error(interval.get_error());
    }
    cfg.heartbeat_interval_ms = interval.value();
  }

  if (const char* v = env("RELAY_MAX_CONNECTIONS")) {
    auto max = parse_int(v, 1, 1000000);
    if (!max.has_value()) {
      RELAY_LOG_WARN(std::string("Invalid RELAY_MAX_CONNECTIONS: ") + v);
      return Result::error(max.get_error());
    }
    cfg.max_connections = static_cast<size_t>(max.value());
  }

  return Result::success(std::move(cfg));
}

}  // namespace relay
