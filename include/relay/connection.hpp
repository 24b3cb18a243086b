#ifndef RELAY_CONNECTION_HPP_
#define RELAY_CONNECTION_HPP_

#include "buffer.hpp"
#include "connection_state.hpp"
#include "frame.hpp"
#include "message_sink.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <chrono>
#include <functional>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <string>
#include <string_view>

namespace relay {

struct ConnectionStats {
  uint64_t bytes_sent = 0;      // bytes handed to the transport, queued ones included
  uint64_t bytes_received = 0;
  uint64_t frames_sent = 0;
  uint64_t frames_received = 0;
};

struct CloseInfo {
  ErrorCode reason = ErrorCode::kOk;  // kOk for a requested close, else the cause
  ConnectionState previous = ConnectionState::kOpen;
  ConnectionStats stats;
};

// ============================================================================
// Connection - Manages socket, buffers, and lifecycle state
// ============================================================================

class Connection : public MessageSink, public std::enable_shared_from_this<Connection> {
 public:
  static constexpr size_t kReadChunkSize = 16384;
  static constexpr size_t kDefaultMaxPendingTx = 16 * 1024 * 1024;

  using ConnPtr = std::shared_ptr<Connection>;
  using SteadyClock = std::chrono::steady_clock;

  Connection(ConnectionId id, sockpp::tcp_socket&& sock);
  Connection(ConnectionId id, int fd);
  ~Connection() override;

  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  // INIT -> OPEN; fires on_open. Must be called once the owner has bound callbacks.
  void open();

  // --- Reactor I/O ---

  // Readable event. Returns error(kConnectionClosed) on peer EOF and
  // error(kSocketError) on a socket failure; the caller terminates. Frame
  // errors are returned too, after fail() has already acted on them.
  Status handle_read();

  // Writable event: flushes pending TX bytes.
  Status handle_write();

  // --- User API ---

  // Accepted only in OPEN and DRAINING; otherwise error(kNotWritable), no side effect.
  Status send(proto::MessageType type, const proto::Payload& payload = proto::Payload{});
  Status send(proto::MessageType type, const proto::Payload& payload, uint8_t flags);

  // Sends an already encoded frame.
  Status send_raw(const proto::Bytes& frame);

  // ERROR frame carrying {"code": <name>, "message": detail}.
  Status send_error(ErrorCode code, std::string_view detail);

  // Graceful close: OPEN/DRAINING -> CLOSING, flush, then shut down the write side.
  void close(ErrorCode reason = ErrorCode::kOk);

  // Report an error and react according to its kind (protocol: ERROR frame
  // then close; application: ERROR frame only; transport/internal: terminate).
  void fail(ErrorCode code, std::string_view detail);

  // Socket is gone: any non-terminal state -> CLOSED. on_close fires once.
  void terminate(ErrorCode reason);

  // --- MessageSink ---

  ConnectionId sink_id() const override { return id_; }
  Status deliver(proto::MessageType type, const proto::Payload& payload) override { return send(type, payload); }

  // --- Getters ---

  ConnectionId get_id() const { return id_; }
  ConnectionState get_state() const { return ops_->state; }
  bool is_closed() const { return get_state() == ConnectionState::kClosed; }
  bool is_writable() const {
    return get_state() == ConnectionState::kOpen || get_state() == ConnectionState::kDraining;
  }
  int get_fd() const { return socket_.handle(); }
  bool has_data_to_send() const { return !tx_buffer_.empty(); }
  size_t pending_tx_bytes() const { return tx_buffer_.size(); }
  size_t buffered_rx_bytes() const { return rx_buffer_.size(); }
  const ConnectionStats& stats() const { return stats_; }
  ErrorCode close_reason() const { return close_reason_; }

  void set_max_pending_tx(size_t bytes) { max_pending_tx_ = bytes; }

  // --- Timers ---

  uint64_t idle_ms() const { return elapsed_ms(last_activity_); }
  uint64_t heartbeat_age_ms() const { return elapsed_ms(last_heartbeat_); }
  bool is_close_timed_out(uint64_t timeout_ms) const {
    return get_state() == ConnectionState::kClosing && elapsed_ms(closing_at_) > timeout_ms;
  }

  // --- Callbacks ---

  std::function<void(const ConnPtr&)> on_open;
  std::function<void(const ConnPtr&, const proto::ParsedMessage&)> on_frame;
  std::function<void(const ConnPtr&)> on_heartbeat;
  std::function<void(const ConnPtr&, ConnectionState, ConnectionState)> on_state_change;
  std::function<void(const ConnPtr&, const CloseInfo&)> on_close;
  std::function<void(const ConnPtr&, ErrorKind, ErrorCode, std::string_view)> on_error;
  std::function<void(const ConnPtr&)> on_backpressure;
  std::function<void(const ConnPtr&)> on_drain;

  // --- Internal API (public to avoid friend, used by state handlers) ---

  // Throws InvariantViolation for any pair outside the transition table.
  void transition_to_state(ConnectionState next);
  Status parse_frames();
  Status write_frame(const proto::Bytes& frame);
  Status begin_close();

 private:
  ConnectionId id_;
  sockpp::tcp_socket socket_;
  ByteBuffer rx_buffer_;
  ByteBuffer tx_buffer_;
  const StateOps* ops_;
  ConnectionStats stats_;
  ErrorCode close_reason_ = ErrorCode::kOk;
  size_t max_pending_tx_ = kDefaultMaxPendingTx;
  bool close_notified_ = false;
  bool write_shutdown_ = false;

  using TimePoint = SteadyClock::time_point;
  TimePoint last_activity_ = SteadyClock::now();
  TimePoint last_heartbeat_ = SteadyClock::now();
  TimePoint closing_at_{};

  static uint64_t elapsed_ms(TimePoint since) {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - since).count());
  }

  void make_non_blocking();
  void shutdown_write();
  std::string log_prefix() const;
};

}  // namespace relay

#endif  // RELAY_CONNECTION_HPP_
