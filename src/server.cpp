#include "relay/server.hpp"

#include "relay/handlers.hpp"
#include "relay/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <stdexcept>
#include <sys/socket.h>
#include <unistd.h>

namespace relay {

namespace {

void set_option(int fd, int level, int name, int value, const char* label) {
  if (::setsockopt(fd, level, name, &value, sizeof(value)) < 0) {
    RELAY_LOG_WARN(std::string("setsockopt ") + label + " failed: " + std::strerror(errno));
  }
}

bool set_non_blocking(int fd) {
  int flags = ::fcntl(fd, F_GETFL, 0);
  return flags >= 0 && ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

}  // namespace

Server::Server(const ServerConfig& config) : config_(config) {
  if (config_.debug)
    Logger::set_debug(true);

  server_sock_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (server_sock_ < 0) {
    RELAY_THROW(std::runtime_error(std::string("Failed to create socket: ") + std::strerror(errno)));
  }

  set_option(server_sock_, SOL_SOCKET, SO_REUSEADDR, 1, "SO_REUSEADDR");

  struct sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(config_.port);
  if (config_.host.empty()) {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else if (::inet_pton(AF_INET, config_.host.c_str(), &addr.sin_addr) != 1) {
    ::close(server_sock_);
    RELAY_THROW(std::runtime_error("Invalid bind address: " + config_.host));
  }

  if (::bind(server_sock_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    int err = errno;
    ::close(server_sock_);
    RELAY_THROW(std::runtime_error("Failed to bind " + config_.host + ":" + std::to_string(config_.port) + ": " +
                                   std::strerror(err)));
  }

  if (::listen(server_sock_, 128) < 0) {
    int err = errno;
    ::close(server_sock_);
    RELAY_THROW(std::runtime_error(std::string("Failed to listen: ") + std::strerror(err)));
  }

  if (!set_non_blocking(server_sock_)) {
    int err = errno;
    ::close(server_sock_);
    RELAY_THROW(std::runtime_error(std::string("Failed to set O_NONBLOCK: ") + std::strerror(err)));
  }

  struct sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(server_sock_, reinterpret_cast<struct sockaddr*>(&bound), &bound_len) == 0) {
    port_ = ntohs(bound.sin_port);
  } else {
    port_ = config_.port;
  }

  register_default_handlers(dispatcher_, rooms_);
  connections_.on_created = [this](const ConnPtr& conn) { bind_callbacks(conn); };

  RELAY_LOG_INFO("Relay server listening on " + config_.host + ":" + std::to_string(port_));
  if (config_.debug)
    RELAY_LOG_INFO("Debug mode enabled (RELAY_DEBUG=1)");
}

Server::~Server() {
  connections_.terminate_all(ErrorCode::kConnectionClosed);
  if (server_sock_ >= 0)
    ::close(server_sock_);
}

void Server::run() {
  started_at_ = std::chrono::steady_clock::now();
  is_running_.store(true, std::memory_order_release);

  while (!stop_requested_.load(std::memory_order_relaxed)) {
    poll_fds_.clear();
    poll_conns_.clear();
    poll_fds_.push_back({server_sock_, POLLIN, 0});

    for (const auto& conn : connections_.snapshot()) {
      if (conn->is_closed())
        continue;
      short events = POLLIN;
      if (conn->has_data_to_send())
        events |= POLLOUT;
      poll_fds_.push_back({conn->get_fd(), events, 0});
      poll_conns_.push_back(conn);
    }

    // Poll with latency tracking
    auto poll_start = std::chrono::steady_clock::now();
    int ret = ::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), config_.poll_timeout_ms);
    auto poll_end = std::chrono::steady_clock::now();

    uint64_t poll_us =
        static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(poll_end - poll_start).count());
    stats_.last_poll_latency_us.store(poll_us, std::memory_order_relaxed);
    if (poll_us > stats_.max_poll_latency_us.load(std::memory_order_relaxed)) {
      stats_.max_poll_latency_us.store(poll_us, std::memory_order_relaxed);
    }

    if (ret < 0) {
      if (errno == EINTR)
        continue;
      RELAY_LOG_ERROR(std::string("poll failed: ") + std::strerror(errno));
      break;
    }

    if (ret > 0) {
      if (poll_fds_[0].revents & POLLIN)
        accept_connections();

      for (size_t i = 0; i < poll_conns_.size(); ++i) {
        handle_connection_io(poll_conns_[i], poll_fds_[i + 1]);
      }
    }

    enforce_timeouts();
    sweep_closed();
  }

  RELAY_LOG_INFO("Shutting down Relay server...");
  drain_and_close();
  print_stats();
  is_running_.store(false, std::memory_order_release);
  RELAY_LOG_INFO("Server stopped");
}

void Server::accept_connections() {
  // Drain the backlog
  while (true) {
    auto accepted = accept_connection();
    if (!accepted.has_value() || !accepted.value())
      break;
  }
}

expected<bool, ErrorCode> Server::accept_connection() {
  using Result = expected<bool, ErrorCode>;
  struct sockaddr_in client_addr;
  socklen_t client_addr_len = sizeof(client_addr);
  int client_sock = ::accept(server_sock_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_addr_len);

  if (client_sock < 0) {
    int err = errno;
    if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
      RELAY_LOG_ERROR(std::string("accept failed: ") + std::strerror(err));
      stats_.transport_errors.fetch_add(1, std::memory_order_relaxed);
      return Result::error(ErrorCode::kSocketError);
    }
    return Result::success(false);
  }

  if (connections_.count() >= config_.max_connections) {
    reject_connection(client_sock);
    return Result::success(true);
  }

  apply_tcp_tuning(client_sock);

  char ip[INET_ADDRSTRLEN] = {0};
  if (::inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip)) == nullptr)
    std::snprintf(ip, sizeof(ip), "?");

  ConnPtr conn = connections_.create(sockpp::tcp_socket(client_sock));
  RELAY_LOG_INFO("[" + format_connection_id(conn->get_id()) + "] New connection from " + ip + ":" +
                 std::to_string(ntohs(client_addr.sin_port)));
  if (stats_.is_overloaded(config_.max_connections)) {
    RELAY_LOG_WARN("Connection count above 90% of the limit (" + std::to_string(connections_.count()) + "/" +
                   std::to_string(config_.max_connections) + ")");
  }
  return Result::success(true);
}

void Server::reject_connection(int fd) {
  stats_.rejected_connections.fetch_add(1, std::memory_order_relaxed);
  RELAY_LOG_WARN("Max connections reached (" + std::to_string(config_.max_connections) +
                 "), rejecting new connection");

  nlohmann::json body = {{"code", error_code_name(ErrorCode::kMaxConnectionsExceeded)},
                         {"message", error_code_description(ErrorCode::kMaxConnectionsExceeded)}};
  proto::Bytes frame = proto::encode_frame(proto::MessageType::kError,
                                           proto::Payload(std::in_place_type<nlohmann::json>, std::move(body)));
  // Best effort on a fresh socket; the frame fits in any send buffer
  if (::send(fd, frame.data(), frame.size(), MSG_NOSIGNAL | MSG_DONTWAIT) < 0) {
    RELAY_LOG_DEBUG(std::string("reject notice not sent: ") + std::strerror(errno));
  }
  ::close(fd);
}

void Server::bind_callbacks(const ConnPtr& conn) {
  conn->set_max_pending_tx(config_.max_pending_tx_bytes);

  conn->on_open = [this](const ConnPtr& c) {
    stats_.total_connections.fetch_add(1, std::memory_order_relaxed);
    stats_.active_connections.fetch_add(1, std::memory_order_relaxed);
    if (on_connect)
      on_connect(c);
  };

  conn->on_frame = [this](const ConnPtr& c, const proto::ParsedMessage& msg) {
    RELAY_LOG_DEBUG("[" + format_connection_id(c->get_id()) + "] frame " + proto::message_type_name(msg.type));
    // Failures are reported to the peer and counted through on_error
    Status routed = dispatcher_.dispatch(c, msg);
    static_cast<void>(routed);
  };

  conn->on_error = [this](const ConnPtr&, ErrorKind kind, ErrorCode, std::string_view) {
    switch (kind) {
      case ErrorKind::kProtocol: stats_.protocol_errors.fetch_add(1, std::memory_order_relaxed); break;
      case ErrorKind::kApplication: stats_.application_errors.fetch_add(1, std::memory_order_relaxed); break;
      case ErrorKind::kTransport: stats_.transport_errors.fetch_add(1, std::memory_order_relaxed); break;
      default: stats_.internal_errors.fetch_add(1, std::memory_order_relaxed); break;
    }
  };

  conn->on_backpressure = [this](const ConnPtr&) {
    stats_.backpressure_events.fetch_add(1, std::memory_order_relaxed);
  };

  conn->on_close = [this](const ConnPtr& c, const CloseInfo& info) { handle_connection_closed(c, info); };
}

void Server::handle_connection_closed(const ConnPtr& conn, const CloseInfo& info) {
  rooms_.leave_all(conn->get_id());

  stats_.active_connections.fetch_sub(1, std::memory_order_relaxed);
  stats_.room_count.store(rooms_.room_count(), std::memory_order_relaxed);
  stats_.bytes_in.fetch_add(info.stats.bytes_received, std::memory_order_relaxed);
  stats_.bytes_out.fetch_add(info.stats.bytes_sent, std::memory_order_relaxed);
  stats_.frames_in.fetch_add(info.stats.frames_received, std::memory_order_relaxed);
  stats_.frames_out.fetch_add(info.stats.frames_sent, std::memory_order_relaxed);

  RELAY_LOG_INFO("[" + format_connection_id(conn->get_id()) + "] Connection closed (" +
                 error_code_name(info.reason) + ", was " + state_name(info.previous) + ")");
  if (on_disconnect)
    on_disconnect(conn, info);
}

void Server::handle_connection_io(const ConnPtr& conn, const pollfd& pfd) {
  if (conn->is_closed() || pfd.revents == 0)
    return;

  if (pfd.revents & POLLIN) {
    Status read = conn->handle_read();
    if (!read.has_value()) {
      ErrorCode code = read.get_error();
      if (code == ErrorCode::kConnectionClosed) {
        conn->terminate(code);
      } else if (code == ErrorCode::kSocketError && !conn->is_closed()) {
        conn->fail(code, "read failed");
      }
      // Frame-level errors were already reported by the connection
    }
  }

  if (!conn->is_closed() && (pfd.revents & POLLOUT)) {
    Status written = conn->handle_write();
    if (!written.has_value() && !conn->is_closed())
      conn->fail(written.get_error(), "write failed");
  }

  if (conn->is_closed())
    return;
  if (pfd.revents & POLLERR) {
    conn->fail(ErrorCode::kSocketError, "socket error");
  } else if ((pfd.revents & POLLHUP) && !(pfd.revents & POLLIN)) {
    conn->terminate(ErrorCode::kConnectionClosed);
  }
}

void Server::enforce_timeouts() {
  uint64_t heartbeat_timeout = config_.effective_heartbeat_timeout_ms();
  for (const auto& conn : connections_.snapshot()) {
    if (conn->is_close_timed_out(config_.close_timeout_ms)) {
      RELAY_LOG_DEBUG("[" + format_connection_id(conn->get_id()) + "] close timeout elapsed");
      conn->terminate(ErrorCode::kConnectionClosed);
    } else if (heartbeat_timeout > 0 && conn->is_writable() && conn->idle_ms() > heartbeat_timeout) {
      stats_.heartbeat_timeouts.fetch_add(1, std::memory_order_relaxed);
      conn->fail(ErrorCode::kHeartbeatTimeout,
                 "No activity for " + std::to_string(conn->idle_ms()) + "ms");
    }
  }
}

void Server::sweep_closed() {
  size_t removed = connections_.remove_closed();
  if (removed > 0) {
    RELAY_LOG_DEBUG("swept " + std::to_string(removed) + " closed connection(s), " +
                    std::to_string(connections_.count()) + " active");
  }
}

void Server::drain_and_close() {
  connections_.close_all();

  // Give pending TX a bounded chance to flush before the sockets go away
  auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.close_timeout_ms);
  while (std::chrono::steady_clock::now() < deadline) {
    poll_fds_.clear();
    poll_conns_.clear();
    for (const auto& conn : connections_.snapshot()) {
      if (!conn->is_closed() && conn->has_data_to_send()) {
        poll_fds_.push_back({conn->get_fd(), POLLOUT, 0});
        poll_conns_.push_back(conn);
      }
    }
    if (poll_fds_.empty())
      break;
    if (::poll(poll_fds_.data(), static_cast<nfds_t>(poll_fds_.size()), config_.poll_timeout_ms) < 0 &&
        errno != EINTR)
      break;
    for (size_t i = 0; i < poll_conns_.size(); ++i) {
      handle_connection_io(poll_conns_[i], poll_fds_[i]);
    }
  }

  connections_.terminate_all(ErrorCode::kConnectionClosed);
  sweep_closed();
}

void Server::print_stats() const {
  auto uptime_s = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - started_at_)
                      .count();
  uint64_t frames_in = stats_.frames_in.load();
  char rate[32];
  std::snprintf(rate, sizeof(rate), "%.2f",
                uptime_s > 0 ? static_cast<double>(frames_in) / static_cast<double>(uptime_s) : 0.0);

  RELAY_LOG_INFO("=== Relay server stats ===");
  RELAY_LOG_INFO("uptime: " + std::to_string(uptime_s) + "s");
  RELAY_LOG_INFO("connections: total=" + std::to_string(stats_.total_connections.load()) +
                 " active=" + std::to_string(stats_.active_connections.load()) +
                 " rejected=" + std::to_string(stats_.rejected_connections.load()));
  RELAY_LOG_INFO("rooms: " + std::to_string(stats_.room_count.load()));
  RELAY_LOG_INFO("frames: in=" + std::to_string(frames_in) + " out=" + std::to_string(stats_.frames_out.load()) +
                 " (" + rate + " in/s)");
  RELAY_LOG_INFO("bytes: in=" + std::to_string(stats_.bytes_in.load()) +
                 " out=" + std::to_string(stats_.bytes_out.load()));
  RELAY_LOG_INFO("errors: protocol=" + std::to_string(stats_.protocol_errors.load()) +
                 " application=" + std::to_string(stats_.application_errors.load()) +
                 " transport=" + std::to_string(stats_.transport_errors.load()) +
                 " internal=" + std::to_string(stats_.internal_errors.load()));
  RELAY_LOG_INFO("backpressure events: " + std::to_string(stats_.backpressure_events.load()) +
                 ", heartbeat timeouts: " + std::to_string(stats_.heartbeat_timeouts.load()) +
                 ", max poll latency: " + std::to_string(stats_.max_poll_latency_us.load()) + "us");
}

void Server::apply_tcp_tuning(int fd) {
  const TcpTuning& tuning = config_.tcp;

  if (tuning.tcp_nodelay)
    set_option(fd, IPPROTO_TCP, TCP_NODELAY, 1, "TCP_NODELAY");

#ifdef TCP_QUICKACK
  if (tuning.tcp_quickack)
    set_option(fd, IPPROTO_TCP, TCP_QUICKACK, 1, "TCP_QUICKACK");
#endif

  if (tuning.so_keepalive) {
    set_option(fd, SOL_SOCKET, SO_KEEPALIVE, 1, "SO_KEEPALIVE");
#ifdef TCP_KEEPIDLE
    set_option(fd, IPPROTO_TCP, TCP_KEEPIDLE, tuning.keepalive_idle_s, "TCP_KEEPIDLE");
#endif
#ifdef TCP_KEEPINTVL
    set_option(fd, IPPROTO_TCP, TCP_KEEPINTVL, tuning.keepalive_interval_s, "TCP_KEEPINTVL");
#endif
#ifdef TCP_KEEPCNT
    set_option(fd, IPPROTO_TCP, TCP_KEEPCNT, tuning.keepalive_count, "TCP_KEEPCNT");
#endif
  }
}

}  // namespace relay
