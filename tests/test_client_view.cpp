#include "client_view.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace relay;
using nlohmann::json;

namespace {

proto::ParsedMessage message(json body) {
  proto::ParsedMessage msg;
  msg.type = static_cast<uint8_t>(proto::MessageType::kMessage);
  msg.flags = proto::kFlagUtf8Json;
  msg.payload = proto::Payload(std::in_place_type<json>, std::move(body));
  return msg;
}

}  // namespace

TEST_CASE("ClientView - chat message", "[client]") {
  auto line = client::format_frame(
      message({{"room", "g"}, {"from", "conn-1"}, {"content", "hi"}, {"timestamp", 1}}));
  REQUIRE(line == "[g] conn-1: hi");
}

TEST_CASE("ClientView - room notifications", "[client]") {
  REQUIRE(client::format_frame(message({{"type", "userJoined"}, {"room", "g"}, {"connectionId", "conn-2"}})) ==
          "[g] conn-2 joined the room");
  REQUIRE(client::format_frame(message({{"type", "userLeft"}, {"room", "g"}, {"connectionId", "conn-2"}})) ==
          "[g] conn-2 left the room");
}

TEST_CASE("ClientView - non-string fields do not throw", "[client]") {
  json body = {{"room", 7}, {"from", json::array({1, 2})}, {"content", {{"x", 1}}}, {"type", nullptr}};
  std::string line;
  REQUIRE_NOTHROW(line = client::format_frame(message(body)));
  REQUIRE(line == "[7] [1,2]: {\"x\":1}");

  REQUIRE_NOTHROW(client::format_frame(message({{"type", "userJoined"}, {"room", "g"}, {"connectionId", 3}})));
  REQUIRE(client::format_frame(message({{"room", "g"}})) == "[g] ?: null");
}

TEST_CASE("ClientView - other frames", "[client]") {
  proto::ParsedMessage hello;
  hello.type = static_cast<uint8_t>(proto::MessageType::kHello);
  hello.payload = proto::Payload(std::in_place_type<json>, json{{"status", "connected"}});
  REQUIRE(client::format_frame(hello) == "HELLO: {\"status\":\"connected\"}");

  proto::ParsedMessage raw;
  raw.type = static_cast<uint8_t>(proto::MessageType::kMessage);
  raw.payload = proto::Bytes{0x00, 0xFF};
  REQUIRE(client::format_frame(raw) == "MESSAGE: <2 bytes>");

  proto::ParsedMessage beat;
  beat.type = static_cast<uint8_t>(proto::MessageType::kHeartbeat);
  REQUIRE(client::format_frame(beat) == "HEARTBEAT: ");
}
