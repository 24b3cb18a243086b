#ifndef RELAY_DISPATCHER_HPP_
#define RELAY_DISPATCHER_HPP_

#include "connection.hpp"
#include "frame.hpp"
#include "vocabulary.hpp"

#include <array>
#include <functional>
#include <memory>

namespace relay {

// ============================================================================
// Dispatcher - Validates decoded frames and routes them by message type
// ============================================================================
// Holds no per-connection state.

class Dispatcher {
 public:
  using ConnPtr = std::shared_ptr<Connection>;
  using Handler = std::function<Status(const ConnPtr&, const proto::ParsedMessage&)>;

  // Version, reserved flag bits and message type. All failures are protocol errors.
  static Status validate(const proto::ParsedMessage& msg);

  void set_handler(proto::MessageType type, Handler handler);
  bool has_handler(proto::MessageType type) const;

  /**
   * @brief Validate and route one frame.
   *
   * Protocol violations fail the connection (ERROR frame, then close). A
   * known type without a handler, or a handler returning an application
   * error, produces an ERROR frame and leaves the connection open. A handler
   * throwing std::exception is reported as kInternalError, connection open.
   */
  Status dispatch(const ConnPtr& conn, const proto::ParsedMessage& msg);

 private:
  std::array<Handler, 7> handlers_{};  // indexed by type value 1..6
};

}  // namespace relay

#endif  // RELAY_DISPATCHER_HPP_
