#include "relay/connection.hpp"

#include "relay/log.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/uio.h>
#include <unistd.h>

namespace relay {

// ============================================================================
// Transition table
// ============================================================================

const char* state_name(ConnectionState state) {
  switch (state) {
    case ConnectionState::kInit: return "INIT";
    case ConnectionState::kOpen: return "OPEN";
    case ConnectionState::kDraining: return "DRAINING";
    case ConnectionState::kClosing: return "CLOSING";
    case ConnectionState::kClosed: return "CLOSED";
  }
  return "UNKNOWN";
}

bool is_transition_allowed(ConnectionState from, ConnectionState to) {
  switch (from) {
    case ConnectionState::kInit:
      return to == ConnectionState::kOpen;
    case ConnectionState::kOpen:
      return to == ConnectionState::kDraining || to == ConnectionState::kClosing || to == ConnectionState::kClosed;
    case ConnectionState::kDraining:
      return to == ConnectionState::kOpen || to == ConnectionState::kClosing || to == ConnectionState::kClosed;
    case ConnectionState::kClosing:
      return to == ConnectionState::kClosed;
    case ConnectionState::kClosed:
      return false;
  }
  return false;
}

// ============================================================================
// State handler functions
// ============================================================================

namespace detail {

inline Status not_writable(Connection&, const proto::Bytes&) { return Status::error(ErrorCode::kNotWritable); }

inline Status init_on_data(Connection&) { return Status::error(ErrorCode::kInvalidState); }

inline Status init_on_close(Connection&) { return Status::error(ErrorCode::kInvalidState); }

inline Status active_on_data(Connection& conn) { return conn.parse_frames(); }

inline Status active_on_send(Connection& conn, const proto::Bytes& frame) { return conn.write_frame(frame); }

inline Status active_on_close(Connection& conn) { return conn.begin_close(); }

// CLOSING and CLOSED silently discard whatever the peer still sends.
inline Status discard_on_data(Connection&) { return Status::success(); }

inline Status closing_on_close(Connection&) { return Status::success(); }

inline Status closed_on_close(Connection&) { return Status::error(ErrorCode::kConnectionClosed); }

}  // namespace detail

// State operation tables (const, zero allocation)
static const StateOps kInitOps = {ConnectionState::kInit, false, detail::init_on_data, detail::not_writable,
                                  detail::init_on_close};
static const StateOps kOpenOps = {ConnectionState::kOpen, true, detail::active_on_data, detail::active_on_send,
                                  detail::active_on_close};
static const StateOps kDrainingOps = {ConnectionState::kDraining, true, detail::active_on_data,
                                      detail::active_on_send, detail::active_on_close};
static const StateOps kClosingOps = {ConnectionState::kClosing, false, detail::discard_on_data,
                                     detail::not_writable, detail::closing_on_close};
static const StateOps kClosedOps = {ConnectionState::kClosed, false, detail::discard_on_data, detail::not_writable,
                                    detail::closed_on_close};

const StateOps& state_ops(ConnectionState state) {
  switch (state) {
    case ConnectionState::kInit: return kInitOps;
    case ConnectionState::kOpen: return kOpenOps;
    case ConnectionState::kDraining: return kDrainingOps;
    case ConnectionState::kClosing: return kClosingOps;
    case ConnectionState::kClosed: return kClosedOps;
  }
  return kClosedOps;
}

// ============================================================================
// Connection implementation
// ============================================================================

Connection::Connection(ConnectionId id, sockpp::tcp_socket&& sock)
    : id_(id), socket_(std::move(sock)), ops_(&kInitOps) {
  make_non_blocking();
}

Connection::Connection(ConnectionId id, int fd) : id_(id), socket_(fd), ops_(&kInitOps) { make_non_blocking(); }

// Partial writes and the DRAINING state depend on it
void Connection::make_non_blocking() {
  if (!socket_.set_non_blocking(true))
    RELAY_LOG_WARN(log_prefix() + " failed to set O_NONBLOCK: " + std::strerror(errno));
}

Connection::~Connection() {
  if (socket_.is_open())
    socket_.close();
}

void Connection::open() {
  transition_to_state(ConnectionState::kOpen);
  if (on_open)
    on_open(shared_from_this());
}

Status Connection::handle_read() {
  if (!socket_.is_open())
    return Status::error(ErrorCode::kConnectionClosed);

  uint8_t* dst = rx_buffer_.prepare(kReadChunkSize);
  ssize_t n = ::read(socket_.handle(), dst, kReadChunkSize);

  if (n > 0) {
    stats_.bytes_received += static_cast<uint64_t>(n);
    last_activity_ = SteadyClock::now();
    if (!ops_->accepts_input) {
      return Status::success();  // not committed: dropped
    }
    rx_buffer_.commit(static_cast<size_t>(n));
    return ops_->on_data(*this);
  }
  if (n == 0) {
    return Status::error(ErrorCode::kConnectionClosed);
  }
  int err = errno;
  if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) {
    return Status::success();
  }
  RELAY_LOG_DEBUG(log_prefix() + " read error: " + std::strerror(err));
  return Status::error(ErrorCode::kSocketError);
}

Status Connection::handle_write() {
  if (tx_buffer_.empty()) {
    if (get_state() == ConnectionState::kClosing)
      shutdown_write();
    return Status::success();
  }

  struct iovec iov[1];
  size_t iov_count = tx_buffer_.fill_iovec(iov, 1);
  ssize_t n = ::writev(socket_.handle(), iov, static_cast<int>(iov_count));
  if (n < 0) {
    int err = errno;
    if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR)
      return Status::success();
    RELAY_LOG_DEBUG(log_prefix() + " write error: " + std::strerror(err));
    return Status::error(ErrorCode::kSocketError);
  }

  tx_buffer_.advance(static_cast<size_t>(n));
  if (tx_buffer_.empty()) {
    if (get_state() == ConnectionState::kDraining) {
      transition_to_state(ConnectionState::kOpen);
      RELAY_LOG_DEBUG(log_prefix() + " backpressure relieved");
      if (on_drain)
        on_drain(shared_from_this());
    } else if (get_state() == ConnectionState::kClosing) {
      shutdown_write();
    }
  }
  return Status::success();
}

// The writable check comes first so a closed connection never pays for encoding.
Status Connection::send(proto::MessageType type, const proto::Payload& payload) {
  if (!is_writable())
    return Status::error(ErrorCode::kNotWritable);
  return send_raw(proto::encode_frame(type, payload));
}

Status Connection::send(proto::MessageType type, const proto::Payload& payload, uint8_t flags) {
  if (!is_writable())
    return Status::error(ErrorCode::kNotWritable);
  return send_raw(proto::encode_frame(type, payload, flags));
}

Status Connection::send_raw(const proto::Bytes& frame) { return ops_->on_send(*this, frame); }

Status Connection::send_error(ErrorCode code, std::string_view detail) {
  nlohmann::json body = {{"code", error_code_name(code)}, {"message", std::string(detail)}};
  return send(proto::MessageType::kError, proto::Payload(std::in_place_type<nlohmann::json>, std::move(body)));
}

void Connection::close(ErrorCode reason) {
  if (get_state() == ConnectionState::kInit || get_state() == ConnectionState::kClosing || is_closed())
    return;
  close_reason_ = reason;
  Status res = ops_->on_close(*this);
  if (!res.has_value()) {
    RELAY_LOG_DEBUG(log_prefix() + " close rejected: " + error_code_name(res.get_error()));
  }
}

void Connection::fail(ErrorCode code, std::string_view detail) {
  ErrorKind kind = error_kind(code);
  std::string line = log_prefix() + " " + error_kind_name(kind) + " error " + error_code_name(code) + ": " +
                     std::string(detail);
  if (kind == ErrorKind::kApplication || kind == ErrorKind::kProtocol) {
    RELAY_LOG_WARN(line);
  } else {
    RELAY_LOG_ERROR(line);
  }

  auto self = shared_from_this();
  if (on_error)
    on_error(self, kind, code, detail);

  switch (kind) {
    case ErrorKind::kApplication: {
      Status sent = send_error(code, detail);
      if (!sent.has_value()) {
        RELAY_LOG_DEBUG(log_prefix() + " ERROR frame not sent: " + error_code_name(sent.get_error()));
      }
      break;
    }
    case ErrorKind::kProtocol: {
      Status sent = send_error(code, detail);
      if (!sent.has_value()) {
        RELAY_LOG_DEBUG(log_prefix() + " ERROR frame not sent: " + error_code_name(sent.get_error()));
      }
      close(code);
      break;
    }
    default:
      terminate(code);
      break;
  }
}

void Connection::terminate(ErrorCode reason) {
  if (is_closed())
    return;
  if (socket_.is_open())
    socket_.close();
  if (get_state() == ConnectionState::kInit)
    return;  // never opened: nobody is listening yet

  // A graceful close keeps the reason it was requested with.
  if (get_state() != ConnectionState::kClosing && close_reason_ == ErrorCode::kOk)
    close_reason_ = reason;
  ConnectionState previous = get_state();
  transition_to_state(ConnectionState::kClosed);

  if (close_notified_)
    return;
  close_notified_ = true;
  RELAY_LOG_DEBUG(log_prefix() + " closed (sent=" + std::to_string(stats_.bytes_sent) +
                  "B, received=" + std::to_string(stats_.bytes_received) + "B)");
  if (on_close) {
    CloseInfo info;
    info.reason = close_reason_;
    info.previous = previous;
    info.stats = stats_;
    on_close(shared_from_this(), info);
  }
}

void Connection::transition_to_state(ConnectionState next) {
  ConnectionState current = get_state();
  if (!is_transition_allowed(current, next)) {
    RELAY_THROW(InvariantViolation(std::string("Invalid state transition: ") + state_name(current) + " -> " +
                                   state_name(next)));
  }

  ops_ = &state_ops(next);
  if (next == ConnectionState::kClosing)
    closing_at_ = SteadyClock::now();

  RELAY_LOG_DEBUG(log_prefix() + " state " + state_name(current) + " -> " + state_name(next));
  if (on_state_change)
    on_state_change(shared_from_this(), current, next);
}

Status Connection::parse_frames() {
  if (rx_buffer_.size() > proto::kMaxFrameSize) {
    fail(ErrorCode::kFrameTooLarge, "Receive buffer exceeded limit: " + std::to_string(rx_buffer_.size()) + " bytes");
    return Status::error(ErrorCode::kFrameTooLarge);
  }

  // Callbacks may close this connection; stop as soon as input is no longer accepted.
  while (ops_->accepts_input) {
    auto extracted = proto::extract_frame(rx_buffer_.view());
    if (!extracted.has_value()) {
      ErrorCode code = extracted.get_error();
      rx_buffer_.clear();  // stream is desynchronized
      fail(code, code == ErrorCode::kFrameTooLarge ? "Declared frame length exceeds maximum frame size"
                                                   : "Declared frame length is shorter than the frame header");
      return Status::error(code);
    }
    const proto::Extraction& ex = extracted.value();
    if (ex.status == proto::ExtractStatus::kNeedMore)
      break;

    auto decoded = proto::decode_frame(ex.frame);
    rx_buffer_.advance(ex.consumed);
    if (!decoded.has_value()) {
      rx_buffer_.clear();
      fail(decoded.get_error(), "Payload is flagged UTF8_JSON but is not valid UTF-8 JSON");
      return Status::error(decoded.get_error());
    }

    ++stats_.frames_received;
    const proto::ParsedMessage& msg = decoded.value();
    auto self = shared_from_this();
    if (msg.type == static_cast<uint8_t>(proto::MessageType::kHeartbeat)) {
      last_heartbeat_ = SteadyClock::now();
      if (on_heartbeat)
        on_heartbeat(self);
    }
    if (on_frame)
      on_frame(self, msg);
  }
  return Status::success();
}

Status Connection::write_frame(const proto::Bytes& frame) {
  if (frame.size() > proto::kMaxFrameSize)
    return Status::error(ErrorCode::kFrameTooLarge);

  size_t written = 0;
  if (tx_buffer_.empty()) {
    ssize_t n = ::send(socket_.handle(), frame.data(), frame.size(), MSG_NOSIGNAL);
    if (n < 0) {
      int err = errno;
      if (err != EAGAIN && err != EWOULDBLOCK && err != EINTR) {
        fail(ErrorCode::kSocketError, std::string("send failed: ") + std::strerror(err));
        return Status::error(ErrorCode::kSocketError);
      }
    } else {
      written = static_cast<size_t>(n);
    }
  }

  size_t rest = frame.size() - written;
  if (rest > 0) {
    if (tx_buffer_.size() + rest > max_pending_tx_) {
      fail(ErrorCode::kSlowConsumer, "Pending outbound bytes exceed " + std::to_string(max_pending_tx_));
      return Status::error(ErrorCode::kSlowConsumer);
    }
    tx_buffer_.append(frame.data() + written, rest);
    if (get_state() == ConnectionState::kOpen) {
      transition_to_state(ConnectionState::kDraining);
      RELAY_LOG_DEBUG(log_prefix() + " backpressure detected (" + std::to_string(tx_buffer_.size()) + "B pending)");
      if (on_backpressure)
        on_backpressure(shared_from_this());
    }
  }

  stats_.bytes_sent += frame.size();
  ++stats_.frames_sent;
  return Status::success();
}

Status Connection::begin_close() {
  transition_to_state(ConnectionState::kClosing);
  if (tx_buffer_.empty())
    shutdown_write();
  return Status::success();
}

void Connection::shutdown_write() {
  if (write_shutdown_ || !socket_.is_open())
    return;
  write_shutdown_ = true;
  if (::shutdown(socket_.handle(), SHUT_WR) < 0) {
    RELAY_LOG_DEBUG(log_prefix() + " shutdown failed: " + std::strerror(errno));
  }
}

std::string Connection::log_prefix() const { return "[" + format_connection_id(id_) + "]"; }

}  // namespace relay
