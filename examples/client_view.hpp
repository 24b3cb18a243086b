// Rendering of server frames for relay_client.

#ifndef RELAY_EXAMPLES_CLIENT_VIEW_HPP_
#define RELAY_EXAMPLES_CLIENT_VIEW_HPP_

#include "relay/frame.hpp"

#include <string>

namespace relay {
namespace client {

// Text of a field; non-string values are rendered as JSON so a malformed
// frame never throws.
inline std::string field(const nlohmann::json& body, const char* key, const char* fallback) {
  auto it = body.find(key);
  if (it == body.end())
    return fallback;
  return it->is_string() ? it->get<std::string>() : it->dump();
}

inline std::string format_message(const nlohmann::json& body) {
  std::string room = "[" + field(body, "room", "") + "] ";
  std::string kind = field(body, "type", "");
  if (kind == "userJoined")
    return room + field(body, "connectionId", "?") + " joined the room";
  if (kind == "userLeft")
    return room + field(body, "connectionId", "?") + " left the room";
  return room + field(body, "from", "?") + ": " + field(body, "content", "null");
}

inline std::string format_frame(const proto::ParsedMessage& msg) {
  if (msg.type == static_cast<uint8_t>(proto::MessageType::kMessage) && msg.is_json() && msg.json().is_object())
    return format_message(msg.json());

  std::string line = std::string(proto::message_type_name(msg.type)) + ": ";
  if (msg.is_json()) {
    line += msg.json().dump();
  } else if (msg.is_bytes()) {
    line += "<" + std::to_string(msg.bytes().size()) + " bytes>";
  }
  return line;
}

}  // namespace client
}  // namespace relay

#endif  // RELAY_EXAMPLES_CLIENT_VIEW_HPP_
