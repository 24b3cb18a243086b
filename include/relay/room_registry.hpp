#ifndef RELAY_ROOM_REGISTRY_HPP_
#define RELAY_ROOM_REGISTRY_HPP_

#include "room.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace relay {

static constexpr size_t kMaxRoomNameLength = 64;  // UTF-8 code points

// Trims ASCII whitespace and checks the 1..64 code point bound.
expected<std::string, ErrorCode> validate_room_name(std::string_view raw);

// ============================================================================
// RoomRegistry - Rooms by name plus a per-connection reverse index
// ============================================================================
// Owned by the reactor thread; no locking.

class RoomRegistry {
 public:
  using RoomPtr = std::shared_ptr<Room>;

  // Creates the room on first join. Returns the validated room name.
  expected<std::string, ErrorCode> join(const Room::MemberPtr& member, std::string_view name);

  // Every lookup below trims the name the way join() does.

  // No-op when the room or the membership is absent. Empty rooms are deleted.
  void leave(ConnectionId id, std::string_view name);

  expected<BroadcastResult, ErrorCode> broadcast(std::string_view name, const proto::Payload& payload,
                                                 std::optional<ConnectionId> exclude = std::nullopt);

  // Removes the id from every room it belongs to.
  void leave_all(ConnectionId id);

  RoomPtr get_room(std::string_view name) const;
  std::vector<std::string> rooms_of(ConnectionId id) const;
  size_t room_count() const { return rooms_.size(); }
  std::vector<std::string> room_names() const;
  bool is_member(ConnectionId id, std::string_view name) const;

 private:
  std::map<std::string, RoomPtr, std::less<>> rooms_;
  std::map<ConnectionId, std::set<std::string>> memberships_;
};

}  // namespace relay

#endif  // RELAY_ROOM_REGISTRY_HPP_
