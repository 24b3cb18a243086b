#ifndef RELAY_CONNECTION_STATE_HPP_
#define RELAY_CONNECTION_STATE_HPP_

#include "frame.hpp"
#include "vocabulary.hpp"

#include <cstdint>

namespace relay {

// ============================================================================
// Connection state (function-pointer state machine, no virtual)
// ============================================================================

//   INIT -> OPEN                 construction complete, exactly once
//   OPEN <-> DRAINING            transport send buffer full / flushed
//   OPEN, DRAINING -> CLOSING    graceful shutdown requested
//   OPEN, DRAINING, CLOSING -> CLOSED   socket terminated
enum class ConnectionState : uint8_t {
  kInit,
  kOpen,
  kDraining,
  kClosing,
  kClosed
};

const char* state_name(ConnectionState state);

bool is_transition_allowed(ConnectionState from, ConnectionState to);

class Connection;  // Forward declaration

// State handler function signatures
using StateDataHandler = Status (*)(Connection& conn);
using StateSendHandler = Status (*)(Connection& conn, const proto::Bytes& frame);
using StateCloseHandler = Status (*)(Connection& conn);

// Function pointer table, one const row per state
struct StateOps {
  ConnectionState state;
  bool accepts_input;   // inbound bytes are parsed and emitted
  StateDataHandler on_data;
  StateSendHandler on_send;
  StateCloseHandler on_close;
};

const StateOps& state_ops(ConnectionState state);

}  // namespace relay

#endif  // RELAY_CONNECTION_STATE_HPP_
