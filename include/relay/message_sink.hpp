#ifndef RELAY_MESSAGE_SINK_HPP_
#define RELAY_MESSAGE_SINK_HPP_

#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstdint>

#include <string>

namespace relay {

// Stable per-process connection identity, never reused.
using ConnectionId = uint64_t;

// Renders an id the way it appears in payloads and logs ("conn-7").
inline std::string format_connection_id(ConnectionId id) { return "conn-" + std::to_string(id); }

/**
 * @brief Delivery endpoint of a room member.
 *
 * Connection is the production implementation; rooms only ever talk to
 * members through this interface.
 */
class MessageSink {
 public:
  virtual ~MessageSink() = default;

  virtual ConnectionId sink_id() const = 0;

  // Returns error() if the frame was not handed to the transport.
  virtual Status deliver(proto::MessageType type, const proto::Payload& payload) = 0;
};

}  // namespace relay

#endif  // RELAY_MESSAGE_SINK_HPP_
