#include "relay/connection_registry.hpp"

#include "relay/log.hpp"

namespace relay {

ConnectionRegistry::ConnPtr ConnectionRegistry::create(sockpp::tcp_socket&& sock) {
  return adopt(std::make_shared<Connection>(next_id_++, std::move(sock)));
}

ConnectionRegistry::ConnPtr ConnectionRegistry::create(int fd) {
  return adopt(std::make_shared<Connection>(next_id_++, fd));
}

ConnectionRegistry::ConnPtr ConnectionRegistry::adopt(ConnPtr conn) {
  connections_.emplace(conn->get_id(), conn);
  if (on_created)
    on_created(conn);
  conn->open();
  RELAY_LOG_DEBUG("registered " + format_connection_id(conn->get_id()) + " (" + std::to_string(count()) +
                  " active)");
  return conn;
}

ConnectionRegistry::ConnPtr ConnectionRegistry::get(ConnectionId id) const {
  auto it = connections_.find(id);
  return it == connections_.end() ? nullptr : it->second;
}

void ConnectionRegistry::for_each(const std::function<void(const ConnPtr&)>& fn) const {
  for (const auto& conn : snapshot())
    fn(conn);
}

std::vector<ConnectionRegistry::ConnPtr> ConnectionRegistry::snapshot() const {
  std::vector<ConnPtr> out;
  out.reserve(connections_.size());
  for (const auto& entry : connections_)
    out.push_back(entry.second);
  return out;
}

void ConnectionRegistry::close_all(ErrorCode reason) {
  for (const auto& conn : snapshot())
    conn->close(reason);
}

void ConnectionRegistry::terminate_all(ErrorCode reason) {
  for (const auto& conn : snapshot())
    conn->terminate(reason);
}

size_t ConnectionRegistry::remove_closed() {
  size_t removed = 0;
  for (auto it = connections_.begin(); it != connections_.end();) {
    if (it->second->is_closed()) {
      it = connections_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

}  // namespace relay
