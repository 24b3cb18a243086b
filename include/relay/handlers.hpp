#ifndef RELAY_HANDLERS_HPP_
#define RELAY_HANDLERS_HPP_

#include "dispatcher.hpp"
#include "room_registry.hpp"

namespace relay {

static constexpr const char* kServerVersion = "1.0.0";

// Binds HELLO, JOIN_ROOM, LEAVE_ROOM, MESSAGE, HEARTBEAT and ERROR handlers.
// rooms must outlive the dispatcher.
void register_default_handlers(Dispatcher& dispatcher, RoomRegistry& rooms);

}  // namespace relay

#endif  // RELAY_HANDLERS_HPP_
