#include "relay/vocabulary.hpp"

namespace relay {

const char* error_code_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "OK";
    case ErrorCode::kInvalidLength: return "INVALID_LENGTH";
    case ErrorCode::kFrameTooLarge: return "FRAME_TOO_LARGE";
    case ErrorCode::kUnsupportedVersion: return "UNSUPPORTED_VERSION";
    case ErrorCode::kUnknownMessageType: return "UNKNOWN_MESSAGE_TYPE";
    case ErrorCode::kInvalidFlags: return "INVALID_FLAGS";
    case ErrorCode::kInvalidJson: return "INVALID_JSON";
    case ErrorCode::kInvalidRoomName: return "INVALID_ROOM_NAME";
    case ErrorCode::kRoomNotFound: return "ROOM_NOT_FOUND";
    case ErrorCode::kNotInRoom: return "NOT_IN_ROOM";
    case ErrorCode::kMissingContent: return "MISSING_CONTENT";
    case ErrorCode::kInvalidPayload: return "INVALID_PAYLOAD";
    case ErrorCode::kUnsupportedMessage: return "UNSUPPORTED_MESSAGE";
    case ErrorCode::kNotWritable: return "NOT_WRITABLE";
    case ErrorCode::kSocketError: return "SOCKET_ERROR";
    case ErrorCode::kConnectionClosed: return "CONNECTION_CLOSED";
    case ErrorCode::kSlowConsumer: return "SLOW_CONSUMER";
    case ErrorCode::kHeartbeatTimeout: return "HEARTBEAT_TIMEOUT";
    case ErrorCode::kMaxConnectionsExceeded: return "MAX_CONNECTIONS";
    case ErrorCode::kInvalidConfig: return "INVALID_CONFIG";
    case ErrorCode::kInvalidState: return "INVALID_STATE";
    case ErrorCode::kInternalError: return "INTERNAL_ERROR";
  }
  return "INTERNAL_ERROR";
}

const char* error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNone: return "none";
    case ErrorKind::kProtocol: return "protocol";
    case ErrorKind::kApplication: return "application";
    case ErrorKind::kTransport: return "transport";
    case ErrorKind::kInternal: return "internal";
  }
  return "internal";
}

const char* error_code_description(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "Success";
    case ErrorCode::kInvalidLength: return "Frame length is shorter than the frame header";
    case ErrorCode::kFrameTooLarge: return "Frame exceeds the maximum frame size";
    case ErrorCode::kUnsupportedVersion: return "Unsupported protocol version";
    case ErrorCode::kUnknownMessageType: return "Unknown message type";
    case ErrorCode::kInvalidFlags: return "Reserved flag bits are set";
    case ErrorCode::kInvalidJson: return "Payload is not valid UTF-8 JSON";
    case ErrorCode::kInvalidRoomName: return "Room name must be 1-64 characters";
    case ErrorCode::kRoomNotFound: return "Room does not exist";
    case ErrorCode::kNotInRoom: return "You are not in this room";
    case ErrorCode::kMissingContent: return "Message content required";
    case ErrorCode::kInvalidPayload: return "Payload must be a JSON object";
    case ErrorCode::kUnsupportedMessage: return "Message type is not handled by this server";
    case ErrorCode::kNotWritable: return "Connection is not writable";
    case ErrorCode::kSocketError: return "Socket error";
    case ErrorCode::kConnectionClosed: return "Connection closed";
    case ErrorCode::kSlowConsumer: return "Outbound backlog limit exceeded";
    case ErrorCode::kHeartbeatTimeout: return "No heartbeat received in time";
    case ErrorCode::kMaxConnectionsExceeded: return "Server is at its connection limit";
    case ErrorCode::kInvalidConfig: return "Invalid configuration value";
    case ErrorCode::kInvalidState: return "Operation not valid in the current state";
    case ErrorCode::kInternalError: return "Internal server error";
  }
  return "Internal server error";
}

}  // namespace relay
