#include "relay/room_registry.hpp"

#include "relay/log.hpp"

namespace relay {

namespace {

bool is_ascii_space(char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v'; }

size_t count_code_points(std::string_view s) {
  size_t n = 0;
  for (char c : s) {
    if ((static_cast<uint8_t>(c) & 0xC0) != 0x80)
      ++n;
  }
  return n;
}

// Lookups see the same key join() stored.
std::string_view trim_room_name(std::string_view raw) {
  size_t begin = 0;
  size_t end = raw.size();
  while (begin < end && is_ascii_space(raw[begin]))
    ++begin;
  while (end > begin && is_ascii_space(raw[end - 1]))
    --end;
  return raw.substr(begin, end - begin);
}

}  // namespace

expected<std::string, ErrorCode> validate_room_name(std::string_view raw) {
  std::string_view name = trim_room_name(raw);
  size_t length = count_code_points(name);
  if (length == 0 || length > kMaxRoomNameLength)
    return expected<std::string, ErrorCode>::error(ErrorCode::kInvalidRoomName);
  return expected<std::string, ErrorCode>::success(std::string(name));
}

expected<std::string, ErrorCode> RoomRegistry::join(const Room::MemberPtr& member, std::string_view name) {
  auto valid = validate_room_name(name);
  if (!valid.has_value())
    return valid;
  const std::string& room_name = valid.value();

  RoomPtr room;
  auto it = rooms_.find(room_name);
  if (it == rooms_.end()) {
    room = std::make_shared<Room>(room_name);
    rooms_.emplace(room_name, room);
    RELAY_LOG_DEBUG("room '" + room_name + "' created");
  } else {
    room = it->second;
  }

  memberships_[member->sink_id()].insert(room_name);
  if (room->join(member)) {
    RELAY_LOG_DEBUG(format_connection_id(member->sink_id()) + " joined '" + room_name + "' (" +
                    std::to_string(room->member_count()) + " members)");
  }
  return valid;
}

void RoomRegistry::leave(ConnectionId id, std::string_view name) {
  auto it = rooms_.find(trim_room_name(name));
  if (it == rooms_.end())
    return;
  RoomPtr room = it->second;  // keeps the room alive through notifications
  std::string room_name = room->name();

  auto idx = memberships_.find(id);
  if (idx != memberships_.end()) {
    idx->second.erase(room_name);
    if (idx->second.empty())
      memberships_.erase(idx);
  }

  if (room->leave(id)) {
    RELAY_LOG_DEBUG(format_connection_id(id) + " left '" + room_name + "'");
  }

  // A notification may already have emptied and erased the room.
  auto current = rooms_.find(room_name);
  if (room->empty() && current != rooms_.end() && current->second == room) {
    rooms_.erase(current);
    RELAY_LOG_DEBUG("room '" + room_name + "' deleted");
  }
}

expected<BroadcastResult, ErrorCode> RoomRegistry::broadcast(std::string_view name, const proto::Payload& payload,
                                                             std::optional<ConnectionId> exclude) {
  auto it = rooms_.find(trim_room_name(name));
  if (it == rooms_.end())
    return expected<BroadcastResult, ErrorCode>::error(ErrorCode::kRoomNotFound);
  RoomPtr room = it->second;
  return expected<BroadcastResult, ErrorCode>::success(room->broadcast(payload, exclude));
}

void RoomRegistry::leave_all(ConnectionId id) {
  auto idx = memberships_.find(id);
  if (idx == memberships_.end())
    return;
  // leave() edits the index entry; iterate a copy.
  std::set<std::string> names = idx->second;
  for (const auto& name : names)
    leave(id, name);
}

RoomRegistry::RoomPtr RoomRegistry::get_room(std::string_view name) const {
  auto it = rooms_.find(trim_room_name(name));
  return it == rooms_.end() ? nullptr : it->second;
}

std::vector<std::string> RoomRegistry::rooms_of(ConnectionId id) const {
  auto idx = memberships_.find(id);
  if (idx == memberships_.end())
    return {};
  return std::vector<std::string>(idx->second.begin(), idx->second.end());
}

std::vector<std::string> RoomRegistry::room_names() const {
  std::vector<std::string> names;
  names.reserve(rooms_.size());
  for (const auto& entry : rooms_)
    names.push_back(entry.first);
  return names;
}

bool RoomRegistry::is_member(ConnectionId id, std::string_view name) const {
  auto it = rooms_.find(trim_room_name(name));
  return it != rooms_.end() && it->second->has_member(id);
}

}  // namespace relay
