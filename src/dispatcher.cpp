#include "relay/dispatcher.hpp"

#include "relay/log.hpp"

#include <exception>
#include <string>

namespace relay {

Status Dispatcher::validate(const proto::ParsedMessage& msg) {
  if (msg.version != proto::kProtocolVersion)
    return Status::error(ErrorCode::kUnsupportedVersion);
  if ((msg.flags & proto::kReservedFlagMask) != 0)
    return Status::error(ErrorCode::kInvalidFlags);
  if (!proto::is_known_message_type(msg.type))
    return Status::error(ErrorCode::kUnknownMessageType);
  return Status::success();
}

void Dispatcher::set_handler(proto::MessageType type, Handler handler) {
  handlers_[static_cast<uint8_t>(type)] = std::move(handler);
}

bool Dispatcher::has_handler(proto::MessageType type) const {
  return static_cast<bool>(handlers_[static_cast<uint8_t>(type)]);
}

Status Dispatcher::dispatch(const ConnPtr& conn, const proto::ParsedMessage& msg) {
  Status valid = validate(msg);
  if (!valid.has_value()) {
    ErrorCode code = valid.get_error();
    std::string detail = error_code_description(code);
    if (code == ErrorCode::kUnsupportedVersion) {
      detail += " " + std::to_string(msg.version);
    } else if (code == ErrorCode::kUnknownMessageType) {
      detail += " " + std::to_string(msg.type);
    }
    conn->fail(code, detail);
    return valid;
  }

  const Handler& handler = handlers_[msg.type];
  if (!handler) {
    conn->fail(ErrorCode::kUnsupportedMessage,
               std::string(proto::message_type_name(msg.type)) + ": " +
                   error_code_description(ErrorCode::kUnsupportedMessage));
    return Status::error(ErrorCode::kUnsupportedMessage);
  }

  Status result = Status::success();
  try {
    result = handler(conn, msg);
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("[" + format_connection_id(conn->get_id()) + "] " + proto::message_type_name(msg.type) +
                    " handler threw: " + e.what());
    if (conn->on_error)
      conn->on_error(conn, ErrorKind::kInternal, ErrorCode::kInternalError, e.what());
    Status sent = conn->send_error(ErrorCode::kInternalError, error_code_description(ErrorCode::kInternalError));
    if (!sent.has_value()) {
      RELAY_LOG_DEBUG("[" + format_connection_id(conn->get_id()) + "] ERROR frame not sent: " +
                      error_code_name(sent.get_error()));
    }
    return Status::error(ErrorCode::kInternalError);
  }

  if (!result.has_value()) {
    ErrorCode code = result.get_error();
    if (error_kind(code) == ErrorKind::kApplication && conn->is_writable()) {
      conn->fail(code, std::string(proto::message_type_name(msg.type)) + ": " + error_code_description(code));
    } else {
      // Transport failures have already been acted on by the connection.
      RELAY_LOG_DEBUG("[" + format_connection_id(conn->get_id()) + "] " + proto::message_type_name(msg.type) +
                      " handler returned " + error_code_name(code));
    }
  }
  return result;
}

}  // namespace relay
