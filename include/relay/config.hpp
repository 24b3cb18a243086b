#ifndef RELAY_CONFIG_HPP_
#define RELAY_CONFIG_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

namespace relay {

// ============================================================================
// TCP Tuning Configuration
// ============================================================================

struct TcpTuning {
  bool tcp_nodelay = true;      // Disable Nagle algorithm (small chat frames)
  bool tcp_quickack = false;    // Reduce ACK delay (Linux-specific)
  bool so_keepalive = false;    // Enable TCP keepalive

  // Keepalive parameters (Linux-specific, effective when so_keepalive=true)
  int keepalive_idle_s = 60;
  int keepalive_interval_s = 10;
  int keepalive_count = 5;
};

// ============================================================================
// ServerConfig
// ============================================================================

struct ServerConfig {
  std::string host = "0.0.0.0";
  uint16_t port = 4000;  // 0 binds an ephemeral port
  bool debug = false;

  int64_t heartbeat_interval_ms = 30000;
  // 0 derives 2 x heartbeat_interval_ms; negative disables the timeout.
  int64_t heartbeat_timeout_ms = 0;

  size_t max_connections = 1024;
  int poll_timeout_ms = 100;
  uint64_t close_timeout_ms = 5000;
  size_t max_pending_tx_bytes = 16 * 1024 * 1024;

  TcpTuning tcp;

  // Effective heartbeat timeout in ms, or 0 when disabled.
  uint64_t effective_heartbeat_timeout_ms() const {
    if (heartbeat_timeout_ms < 0 || heartbeat_interval_ms <= 0)
      return 0;
    if (heartbeat_timeout_ms == 0)
      return static_cast<uint64_t>(heartbeat_interval_ms) * 2;
    return static_cast<uint64_t>(heartbeat_timeout_ms);
  }

  /**
   * @brief Defaults overridden by PORT, HOST, RELAY_DEBUG, HEARTBEAT_INTERVAL
   *        and RELAY_MAX_CONNECTIONS.
   *
   * Returns kInvalidConfig if any set variable is malformed.
   */
  static expected<ServerConfig, ErrorCode> from_env();
};

expected<uint16_t, ErrorCode> parse_port(std::string_view text);

// Decimal integer within [min, max], nothing else.
expected<int64_t, ErrorCode> parse_int(std::string_view text, int64_t min, int64_t max);

}  // namespace relay

#endif  // RELAY_CONFIG_HPP_
