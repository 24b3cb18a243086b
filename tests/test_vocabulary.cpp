#include "relay/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace relay;

// ============================================================================
// expected<V, E>
// ============================================================================

TEST_CASE("expected - success with value", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::success(42);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == 42);
}

TEST_CASE("expected - error", "[vocabulary]") {
  auto result = expected<int, ErrorCode>::error(ErrorCode::kFrameTooLarge);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kFrameTooLarge);
}

TEST_CASE("expected - bool conversion", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(1);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kSocketError);
  REQUIRE(static_cast<bool>(ok) == true);
  REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("expected - value_or", "[vocabulary]") {
  auto ok = expected<int, ErrorCode>::success(10);
  auto err = expected<int, ErrorCode>::error(ErrorCode::kInvalidConfig);
  REQUIRE(ok.value_or(99) == 10);
  REQUIRE(err.value_or(99) == 99);
}

TEST_CASE("expected - copy and move keep a non-trivial value", "[vocabulary]") {
  auto source = expected<std::string, ErrorCode>::success(std::string("lobby"));
  auto copy = source;
  REQUIRE(copy.has_value());
  REQUIRE(copy.value() == "lobby");

  auto moved = static_cast<expected<std::string, ErrorCode>&&>(source);
  REQUIRE(moved.has_value());
  REQUIRE(moved.value() == "lobby");
}

TEST_CASE("expected<void> - success and error", "[vocabulary]") {
  REQUIRE(Status::success().has_value());

  auto result = Status::error(ErrorCode::kNotWritable);
  REQUIRE(!result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kNotWritable);
}

// ============================================================================
// Error taxonomy
// ============================================================================

TEST_CASE("error_kind - protocol errors", "[vocabulary]") {
  REQUIRE(error_kind(ErrorCode::kInvalidLength) == ErrorKind::kProtocol);
  REQUIRE(error_kind(ErrorCode::kFrameTooLarge) == ErrorKind::kProtocol);
  REQUIRE(error_kind(ErrorCode::kUnsupportedVersion) == ErrorKind::kProtocol);
  REQUIRE(error_kind(ErrorCode::kUnknownMessageType) == ErrorKind::kProtocol);
  REQUIRE(error_kind(ErrorCode::kInvalidFlags) == ErrorKind::kProtocol);
  REQUIRE(error_kind(ErrorCode::kInvalidJson) == ErrorKind::kProtocol);
}

TEST_CASE("error_kind - application errors", "[vocabulary]") {
  REQUIRE(error_kind(ErrorCode::kInvalidRoomName) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kRoomNotFound) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kNotInRoom) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kMissingContent) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kInvalidPayload) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kUnsupportedMessage) == ErrorKind::kApplication);
  REQUIRE(error_kind(ErrorCode::kNotWritable) == ErrorKind::kApplication);
}

TEST_CASE("error_kind - transport and internal errors", "[vocabulary]") {
  REQUIRE(error_kind(ErrorCode::kSocketError) == ErrorKind::kTransport);
  REQUIRE(error_kind(ErrorCode::kConnectionClosed) == ErrorKind::kTransport);
  REQUIRE(error_kind(ErrorCode::kSlowConsumer) == ErrorKind::kTransport);
  REQUIRE(error_kind(ErrorCode::kHeartbeatTimeout) == ErrorKind::kTransport);
  REQUIRE(error_kind(ErrorCode::kMaxConnectionsExceeded) == ErrorKind::kTransport);
  REQUIRE(error_kind(ErrorCode::kInvalidConfig) == ErrorKind::kInternal);
  REQUIRE(error_kind(ErrorCode::kInvalidState) == ErrorKind::kInternal);
  REQUIRE(error_kind(ErrorCode::kInternalError) == ErrorKind::kInternal);
  REQUIRE(error_kind(ErrorCode::kOk) == ErrorKind::kNone);
}

TEST_CASE("error_code_name - wire names", "[vocabulary]") {
  REQUIRE(std::string(error_code_name(ErrorCode::kInvalidLength)) == "INVALID_LENGTH");
  REQUIRE(std::string(error_code_name(ErrorCode::kRoomNotFound)) == "ROOM_NOT_FOUND");
  REQUIRE(std::string(error_code_name(ErrorCode::kSlowConsumer)) == "SLOW_CONSUMER");
  REQUIRE(std::string(error_code_name(ErrorCode::kMaxConnectionsExceeded)) == "MAX_CONNECTIONS");
  REQUIRE(std::string(error_code_name(ErrorCode::kInternalError)) == "INTERNAL_ERROR");
}

TEST_CASE("error_kind_name and description", "[vocabulary]") {
  REQUIRE(std::string(error_kind_name(ErrorKind::kProtocol)) == "protocol");
  REQUIRE(std::string(error_kind_name(ErrorKind::kApplication)) == "application");
  REQUIRE_FALSE(std::string(error_code_description(ErrorCode::kMissingContent)).empty());
}

TEST_CASE("InvariantViolation - is a logic_error", "[vocabulary]") {
  try {
    RELAY_THROW(InvariantViolation("bad transition"));
    FAIL("expected throw");
  } catch (const std::logic_error& e) {
    REQUIRE(std::string(e.what()) == "bad transition");
  }
}
