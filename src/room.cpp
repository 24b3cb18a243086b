#include "relay/room.hpp"

#include "relay/log.hpp"

#include <exception>

namespace relay {

bool Room::join(const MemberPtr& member) {
  ConnectionId id = member->sink_id();
  if (!members_.emplace(id, member).second)
    return false;
  notify("userJoined", id);
  return true;
}

bool Room::leave(ConnectionId id) {
  if (members_.erase(id) == 0)
    return false;
  notify("userLeft", id);
  return true;
}

void Room::notify(const char* event, ConnectionId subject) {
  nlohmann::json body = {{"type", event}, {"room", name_}, {"connectionId", format_connection_id(subject)}};
  broadcast(proto::Payload(std::in_place_type<nlohmann::json>, std::move(body)), subject);
}

BroadcastResult Room::broadcast(const proto::Payload& payload, std::optional<ConnectionId> exclude) const {
  std::vector<MemberPtr> targets;
  targets.reserve(members_.size());
  for (const auto& entry : members_) {
    if (exclude && entry.first == *exclude)
      continue;
    targets.push_back(entry.second);
  }

  BroadcastResult result;
  for (const auto& member : targets) {
    try {
      Status sent = member->deliver(proto::MessageType::kMessage, payload);
      if (sent.has_value()) {
        ++result.delivered;
      } else {
        ++result.failed;
        RELAY_LOG_WARN("room '" + name_ + "': delivery to " + format_connection_id(member->sink_id()) +
                       " failed: " + error_code_name(sent.get_error()));
      }
    } catch (const std::exception& e) {
      ++result.failed;
      RELAY_LOG_WARN("room '" + name_ + "': delivery to " + format_connection_id(member->sink_id()) +
                     " threw: " + e.what());
    }
  }
  return result;
}

Status Room::send_to(ConnectionId id, const proto::Payload& payload) const {
  auto it = members_.find(id);
  if (it == members_.end())
    return Status::error(ErrorCode::kNotInRoom);
  return it->second->deliver(proto::MessageType::kMessage, payload);
}

std::vector<ConnectionId> Room::member_ids() const {
  std::vector<ConnectionId> ids;
  ids.reserve(members_.size());
  for (const auto& entry : members_)
    ids.push_back(entry.first);  // std::map keeps them sorted
  return ids;
}

}  // namespace relay
