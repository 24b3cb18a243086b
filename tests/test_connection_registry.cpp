#include "relay/connection_registry.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sys/socket.h>
#include <unistd.h>

#include <vector>

using namespace relay;

namespace {

// Returns the local end; the peer end is collected for cleanup
int make_socket(std::vector<int>& peers) {
  int fds[2];
  REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0);
  peers.push_back(fds[1]);
  return fds[0];
}

struct PeerCleanup {
  std::vector<int> fds;
  ~PeerCleanup() {
    for (int fd : fds)
      ::close(fd);
  }
};

}  // namespace

TEST_CASE("ConnectionRegistry - ids start at 1 and increase", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  auto a = registry.create(make_socket(peers.fds));
  auto b = registry.create(make_socket(peers.fds));
  REQUIRE(a->get_id() == 1);
  REQUIRE(b->get_id() == 2);
  REQUIRE(registry.count() == 2);
  REQUIRE(registry.last_id() == 2);
}

TEST_CASE("ConnectionRegistry - on_created runs before open", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  ConnectionState state_at_hook = ConnectionState::kClosed;
  int opened = 0;
  registry.on_created = [&](const ConnectionRegistry::ConnPtr& conn) {
    state_at_hook = conn->get_state();
    conn->on_open = [&](const Connection::ConnPtr&) { ++opened; };
  };

  auto conn = registry.create(make_socket(peers.fds));
  REQUIRE(state_at_hook == ConnectionState::kInit);
  REQUIRE(opened == 1);
  REQUIRE(conn->get_state() == ConnectionState::kOpen);
}

TEST_CASE("ConnectionRegistry - get and contains", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  auto conn = registry.create(make_socket(peers.fds));
  REQUIRE(registry.contains(conn->get_id()));
  REQUIRE(registry.get(conn->get_id()) == conn);
  REQUIRE_FALSE(registry.contains(99));
  REQUIRE(registry.get(99) == nullptr);
}

TEST_CASE("ConnectionRegistry - ids are never reused", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  auto first = registry.create(make_socket(peers.fds));
  first->terminate(ErrorCode::kConnectionClosed);
  REQUIRE(registry.remove_closed() == 1);

  auto second = registry.create(make_socket(peers.fds));
  REQUIRE(second->get_id() == 2);
}

TEST_CASE("ConnectionRegistry - remove_closed sweeps only CLOSED", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  auto a = registry.create(make_socket(peers.fds));
  auto b = registry.create(make_socket(peers.fds));
  auto c = registry.create(make_socket(peers.fds));

  a->terminate(ErrorCode::kConnectionClosed);
  b->close();  // CLOSING stays until the socket is gone

  REQUIRE(registry.remove_closed() == 1);
  REQUIRE(registry.count() == 2);
  REQUIRE_FALSE(registry.contains(a->get_id()));
  REQUIRE(registry.contains(b->get_id()));
  REQUIRE(registry.contains(c->get_id()));
}

TEST_CASE("ConnectionRegistry - close_all and terminate_all", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  int closed = 0;
  registry.on_created = [&](const ConnectionRegistry::ConnPtr& conn) {
    conn->on_close = [&](const Connection::ConnPtr&, const CloseInfo&) { ++closed; };
  };
  for (int i = 0; i < 3; ++i)
    registry.create(make_socket(peers.fds));

  registry.close_all();
  registry.for_each([](const ConnectionRegistry::ConnPtr& conn) {
    REQUIRE(conn->get_state() == ConnectionState::kClosing);
  });
  REQUIRE(closed == 0);

  registry.terminate_all(ErrorCode::kConnectionClosed);
  REQUIRE(closed == 3);
  REQUIRE(registry.remove_closed() == 3);
  REQUIRE(registry.count() == 0);
}

TEST_CASE("ConnectionRegistry - snapshot survives mutation", "[registry]") {
  PeerCleanup peers;
  ConnectionRegistry registry;
  registry.create(make_socket(peers.fds));
  registry.create(make_socket(peers.fds));

  auto snap = registry.snapshot();
  for (const auto& conn : snap)
    conn->terminate(ErrorCode::kConnectionClosed);
  registry.remove_closed();
  REQUIRE(snap.size() == 2);
  REQUIRE(registry.count() == 0);
}
