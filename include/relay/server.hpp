#ifndef RELAY_SERVER_HPP_
#define RELAY_SERVER_HPP_

#include "config.hpp"
#include "connection.hpp"
#include "connection_registry.hpp"
#include "dispatcher.hpp"
#include "room_registry.hpp"
#include "stats.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <poll.h>
#include <vector>

namespace relay {

// ============================================================================
// Server (single-threaded poll() reactor)
// ============================================================================

class Server {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Binds and listens; throws std::runtime_error on failure.
  explicit Server(const ServerConfig& config = ServerConfig{});
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // Blocks until stop(). Closes every connection and logs stats on exit.
  void run();

  // Safe from any thread and from signal handlers.
  void stop() { stop_requested_.store(true, std::memory_order_relaxed); }

  bool is_running() const { return is_running_.load(std::memory_order_acquire); }

  // Bound port (the ephemeral one when configured with port 0)
  uint16_t port() const { return port_; }

  const ServerConfig& config() const { return config_; }

  // Reactor-thread access only
  ConnectionRegistry& connections() { return connections_; }
  RoomRegistry& rooms() { return rooms_; }
  Dispatcher& dispatcher() { return dispatcher_; }

  // Optional observers, invoked on the reactor thread
  std::function<void(const ConnPtr&)> on_connect;
  std::function<void(const ConnPtr&, const CloseInfo&)> on_disconnect;

  const ServerStats& stats() const { return stats_; }
  void print_stats() const;

 private:
  ServerConfig config_;
  uint16_t port_ = 0;
  int server_sock_ = -1;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> is_running_{false};

  ConnectionRegistry connections_;
  RoomRegistry rooms_;
  Dispatcher dispatcher_;
  ServerStats stats_;
  std::chrono::steady_clock::time_point started_at_ = std::chrono::steady_clock::now();

  // Rebuilt every iteration; poll_conns_[i] pairs with poll_fds_[i + 1]
  std::vector<pollfd> poll_fds_;
  std::vector<ConnPtr> poll_conns_;

  void accept_connections();
  // true: a connection was taken off the backlog; false: backlog empty
  expected<bool, ErrorCode> accept_connection();
  void reject_connection(int fd);
  void bind_callbacks(const ConnPtr& conn);
  void handle_connection_io(const ConnPtr& conn, const pollfd& pfd);
  void handle_connection_closed(const ConnPtr& conn, const CloseInfo& info);
  void enforce_timeouts();
  void sweep_closed();
  void drain_and_close();
  void apply_tcp_tuning(int fd);
};

}  // namespace relay

#endif  // RELAY_SERVER_HPP_
