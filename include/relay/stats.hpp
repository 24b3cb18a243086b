#ifndef RELAY_STATS_HPP_
#define RELAY_STATS_HPP_

#include <cstddef>
#include <cstdint>

#include <atomic>

namespace relay {

static constexpr size_t kCacheLine = 64;

// ============================================================================
// ServerStats - Atomic counters, written by the reactor, readable anywhere
// ============================================================================

struct alignas(kCacheLine) ServerStats {
  // Throughput counters
  std::atomic<uint64_t> frames_in{0};
  std::atomic<uint64_t> frames_out{0};
  std::atomic<uint64_t> bytes_in{0};
  std::atomic<uint64_t> bytes_out{0};

  // Connection counters
  std::atomic<uint64_t> total_connections{0};
  std::atomic<uint64_t> active_connections{0};
  std::atomic<uint64_t> rejected_connections{0};

  // Error counters, by kind
  std::atomic<uint64_t> protocol_errors{0};
  std::atomic<uint64_t> application_errors{0};
  std::atomic<uint64_t> transport_errors{0};
  std::atomic<uint64_t> internal_errors{0};

  std::atomic<uint64_t> backpressure_events{0};
  std::atomic<uint64_t> heartbeat_timeouts{0};
  std::atomic<uint64_t> room_count{0};

  // Latency tracking (microseconds)
  std::atomic<uint64_t> last_poll_latency_us{0};
  std::atomic<uint64_t> max_poll_latency_us{0};


  // More than 90% of the connection limit in use
  bool is_overloaded(size_t max_connections) const {
    uint64_t active = active_connections.load(std::memory_order_relaxed);
    return active > (max_connections * 9 / 10);
  }
};

}  // namespace relay

#endif  // RELAY_STATS_HPP_
