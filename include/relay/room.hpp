#ifndef RELAY_ROOM_HPP_
#define RELAY_ROOM_HPP_

#include "frame.hpp"
#include "message_sink.hpp"
#include "vocabulary.hpp"

#include <cstddef>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace relay {

struct BroadcastResult {
  size_t delivered = 0;
  size_t failed = 0;
};

// ============================================================================
// Room - Named set of members with fan-out delivery
// ============================================================================

class Room {
 public:
  using MemberPtr = std::shared_ptr<MessageSink>;

  explicit Room(std::string name) : name_(std::move(name)) {}

  // Returns false if the member was already present (no notification).
  bool join(const MemberPtr& member);

  // Returns false if the id was not a member.
  bool leave(ConnectionId id);

  /**
   * @brief Deliver a MESSAGE frame to every member except `exclude`.
   *
   * Membership is snapshotted on entry: members added while delivering are
   * skipped, members removed while delivering still receive. A member that
   * fails (error return or std::exception) is counted and skipped.
   */
  BroadcastResult broadcast(const proto::Payload& payload,
                            std::optional<ConnectionId> exclude = std::nullopt) const;

  Status send_to(ConnectionId id, const proto::Payload& payload) const;

  bool has_member(ConnectionId id) const { return members_.count(id) != 0; }
  size_t member_count() const { return members_.size(); }
  std::vector<ConnectionId> member_ids() const;
  bool empty() const { return members_.empty(); }
  const std::string& name() const { return name_; }

 private:
  void notify(const char* event, ConnectionId subject);

  std::string name_;
  std::map<ConnectionId, MemberPtr> members_;
};

}  // namespace relay

#endif  // RELAY_ROOM_HPP_
