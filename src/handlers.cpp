#include "relay/handlers.hpp"

#include "relay/log.hpp"

#include <chrono>
#include <string>

namespace relay {

namespace {

using ConnPtr = Dispatcher::ConnPtr;
using nlohmann::json;

proto::Payload make_json(json body) { return proto::Payload(std::in_place_type<json>, std::move(body)); }

std::string tag(const ConnPtr& conn) { return "[" + format_connection_id(conn->get_id()) + "]"; }

int64_t now_unix_ms() {
  return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                  std::chrono::system_clock::now().time_since_epoch())
                                  .count());
}

// JOIN_ROOM, LEAVE_ROOM and MESSAGE carry a JSON object with a string "room".
expected<std::string, ErrorCode> room_field(const proto::ParsedMessage& msg) {
  if (!msg.is_json() || !msg.json().is_object())
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidPayload);
  auto it = msg.json().find("room");
  if (it == msg.json().end() || !it->is_string())
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidRoomName);
  return validate_room_name(it->get_ref<const std::string&>());
}

Status handle_hello(const ConnPtr& conn, const proto::ParsedMessage& msg) {
  std::string user = "anonymous";
  if (msg.is_json()) {
    const json& body = msg.json();
    if (!body.is_object())
      return Status::error(ErrorCode::kInvalidPayload);
    auto it = body.find("userId");
    if (it != body.end() && it->is_string() && !it->get_ref<const std::string&>().empty())
      user = it->get<std::string>();
  } else if (msg.has_payload()) {
    return Status::error(ErrorCode::kInvalidPayload);
  }

  RELAY_LOG_INFO(tag(conn) + " HELLO from user: " + user);
  return conn->send(proto::MessageType::kHello,
                    make_json({{"status", "connected"},
                               {"connectionId", format_connection_id(conn->get_id())},
                               {"serverVersion", kServerVersion}}));
}

Status handle_join(RoomRegistry& rooms, const ConnPtr& conn, const proto::ParsedMessage& msg) {
  auto name = room_field(msg);
  if (!name.has_value())
    return Status::error(name.get_error());

  auto joined = rooms.join(conn, name.value());
  if (!joined.has_value())
    return Status::error(joined.get_error());

  const std::string& room = joined.value();
  auto entry = rooms.get_room(room);
  size_t members = entry ? entry->member_count() : 0;
  RELAY_LOG_INFO(tag(conn) + " joined room: " + room);
  return conn->send(proto::MessageType::kJoinRoom,
                    make_json({{"status", "joined"}, {"room", room}, {"members", members}}));
}

Status handle_leave(RoomRegistry& rooms, const ConnPtr& conn, const proto::ParsedMessage& msg) {
  auto name = room_field(msg);
  if (!name.has_value())
    return Status::error(name.get_error());

  const std::string& room = name.value();
  rooms.leave(conn->get_id(), room);
  RELAY_LOG_INFO(tag(conn) + " left room: " + room);
  return conn->send(proto::MessageType::kLeaveRoom, make_json({{"status", "left"}, {"room", room}}));
}

Status handle_message(RoomRegistry& rooms, const ConnPtr& conn, const proto::ParsedMessage& msg) {
  auto name = room_field(msg);
  if (!name.has_value())
    return Status::error(name.get_error());

  auto content = msg.json().find("content");
  if (content == msg.json().end())
    return Status::error(ErrorCode::kMissingContent);

  const std::string& room = name.value();
  auto entry = rooms.get_room(room);
  if (!entry)
    return Status::error(ErrorCode::kRoomNotFound);
  if (!entry->has_member(conn->get_id()))
    return Status::error(ErrorCode::kNotInRoom);

  json body = {{"room", room},
               {"from", format_connection_id(conn->get_id())},
               {"content", *content},
               {"timestamp", now_unix_ms()}};
  auto sent = rooms.broadcast(room, make_json(std::move(body)), conn->get_id());
  if (!sent.has_value())
    return Status::error(sent.get_error());

  RELAY_LOG_DEBUG(tag(conn) + " message to room " + room + " (" + std::to_string(sent.value().delivered) +
                  " delivered, " + std::to_string(sent.value().failed) + " failed)");
  return Status::success();
}

Status handle_heartbeat(const ConnPtr&, const proto::ParsedMessage&) {
  // last_heartbeat was refreshed by the connection before dispatch.
  return Status::success();
}

Status handle_client_error(const ConnPtr& conn, const proto::ParsedMessage& msg) {
  std::string detail = msg.is_json() ? msg.json().dump() : std::string("<non-JSON payload>");
  RELAY_LOG_WARN(tag(conn) + " client reported error: " + detail);
  return Status::success();
}

}  // namespace

void register_default_handlers(Dispatcher& dispatcher, RoomRegistry& rooms) {
  dispatcher.set_handler(proto::MessageType::kHello, handle_hello);
  dispatcher.set_handler(proto::MessageType::kJoinRoom, [&rooms](const ConnPtr& conn, const proto::ParsedMessage& msg) {
    return handle_join(rooms, conn, msg);
  });
  dispatcher.set_handler(proto::MessageType::kLeaveRoom,
                         [&rooms](const ConnPtr& conn, const proto::ParsedMessage& msg) {
                           return handle_leave(rooms, conn, msg);
                         });
  dispatcher.set_handler(proto::MessageType::kMessage, [&rooms](const ConnPtr& conn, const proto::ParsedMessage& msg) {
    return handle_message(rooms, conn, msg);
  });
  dispatcher.set_handler(proto::MessageType::kHeartbeat, handle_heartbeat);
  dispatcher.set_handler(proto::MessageType::kError, handle_client_error);
}

}  // namespace relay
