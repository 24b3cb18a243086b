#ifndef RELAY_CONNECTION_REGISTRY_HPP_
#define RELAY_CONNECTION_REGISTRY_HPP_

#include "connection.hpp"

#include <cstdint>

#include <functional>
#include <map>
#include <memory>
#include <sockpp/tcp_socket.h>
#include <vector>

namespace relay {

// ============================================================================
// ConnectionRegistry - Owns every live Connection, keyed by id
// ============================================================================

class ConnectionRegistry {
 public:
  using ConnPtr = std::shared_ptr<Connection>;

  // Called after construction and before open(), so callbacks are bound
  // before on_open can fire.
  std::function<void(const ConnPtr&)> on_created;

  ConnPtr create(sockpp::tcp_socket&& sock);
  ConnPtr create(int fd);

  ConnPtr get(ConnectionId id) const;
  bool contains(ConnectionId id) const { return connections_.count(id) != 0; }
  size_t count() const { return connections_.size(); }

  void for_each(const std::function<void(const ConnPtr&)>& fn) const;

  // Copy of the live set; safe to iterate while callbacks mutate the registry.
  std::vector<ConnPtr> snapshot() const;

  void close_all(ErrorCode reason = ErrorCode::kOk);
  void terminate_all(ErrorCode reason);

  // Drops CLOSED connections. Returns the number removed.
  size_t remove_closed();

  ConnectionId last_id() const { return next_id_ - 1; }

 private:
  ConnPtr adopt(ConnPtr conn);

  ConnectionId next_id_ = 1;
  std::map<ConnectionId, ConnPtr> connections_;
};

}  // namespace relay

#endif  // RELAY_CONNECTION_REGISTRY_HPP_
