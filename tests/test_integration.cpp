#include "relay.hpp"

#include <cstring>

#include <arpa/inet.h>
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <netinet/in.h>
#include <poll.h>
#include <string>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace relay;
using nlohmann::json;

// ============================================================================
// Minimal relay test client (raw POSIX socket)
// ============================================================================

class RelayTestClient {
 public:
  RelayTestClient() = default;
  ~RelayTestClient() { disconnect(); }

  bool connect(uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0)
      return false;

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = inet_addr("127.0.0.1");

    if (::connect(fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
      ::close(fd_);
      fd_ = -1;
      return false;
    }
    return true;
  }

  bool send_bytes(const proto::Bytes& bytes) {
    size_t sent = 0;
    while (sent < bytes.size()) {
      ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
      if (n <= 0)
        return false;
      sent += static_cast<size_t>(n);
    }
    return true;
  }

  bool send(proto::MessageType type, json body) {
    return send_bytes(proto::encode_frame(type, proto::Payload(std::in_place_type<json>, std::move(body))));
  }

  bool send_empty(proto::MessageType type) { return send_bytes(proto::encode_frame(type)); }

  // Next frame, or nothing on timeout or EOF (eof() tells which)
  bool recv_frame(proto::ParsedMessage& out, int timeout_ms = 2000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
      auto ex = proto::extract_frame(rx_.view());
      if (!ex.has_value())
        return false;
      if (ex.value().status == proto::ExtractStatus::kFrame) {
        auto decoded = proto::decode_frame(ex.value().frame);
        rx_.advance(ex.value().consumed);
        if (!decoded.has_value())
          return false;
        out = decoded.value();
        return true;
      }

      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
      if (left.count() <= 0)
        return false;
      pollfd pfd = {fd_, POLLIN, 0};
      if (::poll(&pfd, 1, static_cast<int>(left.count())) <= 0)
        return false;
      uint8_t* dst = rx_.prepare(4096);
      ssize_t n = ::recv(fd_, dst, 4096, 0);
      if (n <= 0) {
        eof_ = true;
        return false;
      }
      rx_.commit(static_cast<size_t>(n));
    }
  }

  // Skips frames until one of the given type arrives
  bool recv_type(proto::MessageType type, proto::ParsedMessage& out, int timeout_ms = 2000) {
    while (recv_frame(out, timeout_ms)) {
      if (out.type == static_cast<uint8_t>(type))
        return true;
    }
    return false;
  }

  // True if the server closes the connection within the timeout
  bool wait_eof(int timeout_ms = 2000) {
    proto::ParsedMessage ignored;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!eof_ && std::chrono::steady_clock::now() < deadline) {
      recv_frame(ignored, 100);
    }
    return eof_;
  }

  bool hello(const std::string& user, std::string* connection_id = nullptr) {
    if (!send(proto::MessageType::kHello, {{"userId", user}}))
      return false;
    proto::ParsedMessage reply;
    if (!recv_type(proto::MessageType::kHello, reply))
      return false;
    if (connection_id)
      *connection_id = reply.json()["connectionId"].get<std::string>();
    return reply.json()["status"] == "connected";
  }

  bool join(const std::string& room) {
    if (!send(proto::MessageType::kJoinRoom, {{"room", room}}))
      return false;
    proto::ParsedMessage reply;
    return recv_type(proto::MessageType::kJoinRoom, reply) && reply.json()["status"] == "joined";
  }

  void disconnect() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  bool eof() const { return eof_; }

 private:
  int fd_ = -1;
  bool eof_ = false;
  ByteBuffer rx_;
};

// ============================================================================
// Test helper: run server in background thread
// ============================================================================

static ServerConfig test_config() {
  ServerConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;  // ephemeral
  cfg.poll_timeout_ms = 20;
  cfg.max_connections = 32;
  cfg.close_timeout_ms = 500;
  return cfg;
}

struct ServerFixture {
  Server server;
  std::thread server_thread;

  explicit ServerFixture(const ServerConfig& cfg = test_config()) : server(cfg) {}

  void start() {
    server_thread = std::thread([this]() { server.run(); });
    for (int i = 0; i < 200 && !server.is_running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  void stop() {
    server.stop();
    if (server_thread.joinable()) {
      server_thread.join();
    }
  }

  uint16_t port() const { return server.port(); }

  ~ServerFixture() { stop(); }
};

// ============================================================================
// Integration tests
// ============================================================================

TEST_CASE("Integration - Server start and stop", "[integration]") {
  ServerFixture fixture;
  REQUIRE(fixture.port() != 0);
  fixture.start();
  REQUIRE(fixture.server.is_running());

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  REQUIRE(client.hello("alice"));

  fixture.stop();
  REQUIRE_FALSE(fixture.server.is_running());
  REQUIRE(client.wait_eof());
}

TEST_CASE("Integration - HELLO handshake", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  std::string id;
  REQUIRE(client.hello("alice", &id));
  REQUIRE(id == "conn-1");
}

TEST_CASE("Integration - Room message reaches others but not the sender", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient a;
  RelayTestClient b;
  REQUIRE(a.connect(fixture.port()));
  REQUIRE(b.connect(fixture.port()));
  std::string a_id;
  REQUIRE(a.hello("alice", &a_id));
  REQUIRE(b.hello("bob"));
  REQUIRE(a.join("g"));
  REQUIRE(b.join("g"));

  proto::ParsedMessage joined;
  REQUIRE(a.recv_type(proto::MessageType::kMessage, joined));
  REQUIRE(joined.json()["type"] == "userJoined");

  REQUIRE(a.send(proto::MessageType::kMessage, {{"room", "g"}, {"content", "hi"}}));

  proto::ParsedMessage got;
  REQUIRE(b.recv_type(proto::MessageType::kMessage, got));
  REQUIRE(got.json()["content"] == "hi");
  REQUIRE(got.json()["from"] == a_id);
  REQUIRE(got.json()["room"] == "g");

  proto::ParsedMessage echo;
  REQUIRE_FALSE(a.recv_frame(echo, 200));
}

TEST_CASE("Integration - Frame split into single bytes", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  proto::Bytes frame = proto::encode_frame(proto::MessageType::kHello,
                                           proto::Payload(std::in_place_type<json>, json{{"userId", "slow"}}));
  for (uint8_t b : frame) {
    REQUIRE(client.send_bytes(proto::Bytes{b}));
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  proto::ParsedMessage reply;
  REQUIRE(client.recv_type(proto::MessageType::kHello, reply));
  REQUIRE(reply.json()["status"] == "connected");
}

TEST_CASE("Integration - Batch of coalesced frames", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient a;
  RelayTestClient b;
  REQUIRE(a.connect(fixture.port()));
  REQUIRE(b.connect(fixture.port()));
  REQUIRE(a.join("batch"));
  REQUIRE(b.join("batch"));

  constexpr int kBatchSize = 50;
  proto::Bytes stream;
  for (int i = 0; i < kBatchSize; ++i) {
    proto::Bytes f = proto::encode_frame(
        proto::MessageType::kMessage,
        proto::Payload(std::in_place_type<json>, json{{"room", "batch"}, {"content", i}}));
    stream.insert(stream.end(), f.begin(), f.end());
  }
  REQUIRE(a.send_bytes(stream));

  for (int i = 0; i < kBatchSize; ++i) {
    proto::ParsedMessage got;
    REQUIRE(b.recv_type(proto::MessageType::kMessage, got));
    REQUIRE(got.json()["content"] == i);
  }
}

TEST_CASE("Integration - Protocol violation gets ERROR then close", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  REQUIRE(client.send_empty(static_cast<proto::MessageType>(0x09)));

  proto::ParsedMessage err;
  REQUIRE(client.recv_type(proto::MessageType::kError, err));
  REQUIRE(err.json()["code"] == "UNKNOWN_MESSAGE_TYPE");
  REQUIRE(client.wait_eof());
}

TEST_CASE("Integration - Oversized frame is rejected", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  // Header only: 4 + length exceeds kMaxFrameSize
  uint32_t length = static_cast<uint32_t>(proto::kMaxFrameSize);
  REQUIRE(client.send_bytes(proto::Bytes{static_cast<uint8_t>(length >> 24), static_cast<uint8_t>(length >> 16),
                                         static_cast<uint8_t>(length >> 8), static_cast<uint8_t>(length), 0x01,
                                         0x04, 0x00}));

  proto::ParsedMessage err;
  REQUIRE(client.recv_type(proto::MessageType::kError, err));
  REQUIRE(err.json()["code"] == "FRAME_TOO_LARGE");
  REQUIRE(client.wait_eof());
}

TEST_CASE("Integration - Application error keeps the connection", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient client;
  REQUIRE(client.connect(fixture.port()));
  REQUIRE(client.send(proto::MessageType::kMessage, {{"room", "nowhere"}, {"content", "x"}}));

  proto::ParsedMessage err;
  REQUIRE(client.recv_type(proto::MessageType::kError, err));
  REQUIRE(err.json()["code"] == "ROOM_NOT_FOUND");

  REQUIRE(client.hello("still-here"));
}

TEST_CASE("Integration - Disconnect leaves rooms", "[integration]") {
  ServerFixture fixture;
  fixture.start();

  RelayTestClient a;
  RelayTestClient b;
  REQUIRE(a.connect(fixture.port()));
  REQUIRE(b.connect(fixture.port()));
  std::string a_id;
  REQUIRE(a.hello("alice", &a_id));
  REQUIRE(a.join("g"));
  REQUIRE(b.join("g"));

  a.disconnect();

  proto::ParsedMessage left;
  REQUIRE(b.recv_type(proto::MessageType::kMessage, left));
  REQUIRE(left.json()["type"] == "userLeft");
  REQUIRE(left.json()["connectionId"] == a_id);
}

TEST_CASE("Integration - Connection limit", "[integration]") {
  ServerConfig cfg = test_config();
  cfg.max_connections = 1;
  ServerFixture fixture(cfg);
  fixture.start();

  RelayTestClient first;
  REQUIRE(first.connect(fixture.port()));
  REQUIRE(first.hello("first"));

  RelayTestClient second;
  REQUIRE(second.connect(fixture.port()));
  proto::ParsedMessage err;
  REQUIRE(second.recv_type(proto::MessageType::kError, err));
  REQUIRE(err.json()["code"] == "MAX_CONNECTIONS");
  REQUIRE(second.wait_eof());

  REQUIRE(fixture.server.stats().rejected_connections.load() == 1);
  REQUIRE(first.hello("first-again"));
}

TEST_CASE("Integration - Heartbeat timeout", "[integration]") {
  ServerConfig cfg = test_config();
  cfg.heartbeat_interval_ms = 100;
  cfg.heartbeat_timeout_ms = 300;
  ServerFixture fixture(cfg);
  fixture.start();

  RelayTestClient idle;
  RelayTestClient alive;
  REQUIRE(idle.connect(fixture.port()));
  REQUIRE(alive.connect(fixture.port()));
  REQUIRE(alive.hello("alive"));

  auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(800);
  while (std::chrono::steady_clock::now() < until) {
    REQUIRE(alive.send_empty(proto::MessageType::kHeartbeat));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  REQUIRE(idle.wait_eof(1000));
  REQUIRE(alive.hello("alive-again"));
  REQUIRE(fixture.server.stats().heartbeat_timeouts.load() >= 1);
}

TEST_CASE("Integration - Server restart on the same port", "[integration]") {
  uint16_t port = 0;
  {
    ServerFixture fixture;
    fixture.start();
    port = fixture.port();
    RelayTestClient client;
    REQUIRE(client.connect(port));
    REQUIRE(client.hello("one"));
  }

  ServerConfig cfg = test_config();
  cfg.port = port;
  ServerFixture fixture(cfg);
  fixture.start();
  RelayTestClient client;
  REQUIRE(client.connect(port));
  REQUIRE(client.hello("two"));
}
