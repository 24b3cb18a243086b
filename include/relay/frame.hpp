/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file frame.hpp
 * @brief Relay wire protocol: frame codec and incremental stream extractor.
 *
 * Wire layout (all integers big-endian):
 *
 *   | length (4) | version (1) | type (1) | flags (1) | payload (length - 3) |
 *
 * `length` counts the bytes that follow the length field itself.
 */

#ifndef RELAY_FRAME_HPP_
#define RELAY_FRAME_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <nlohmann/json.hpp>
#include <string_view>
#include <variant>
#include <vector>

namespace relay {
namespace proto {

static constexpr uint8_t kProtocolVersion = 1;
static constexpr size_t kLengthFieldSize = 4;
static constexpr size_t kHeaderRemainderSize = 3;  // version + type + flags
static constexpr size_t kHeaderSize = kLengthFieldSize + kHeaderRemainderSize;
static constexpr size_t kMaxFrameSize = 10 * 1024 * 1024;  // length prefix included

enum class MessageType : uint8_t {
  kHello = 0x01,
  kJoinRoom = 0x02,
  kLeaveRoom = 0x03,
  kMessage = 0x04,
  kHeartbeat = 0x05,
  kError = 0x06
};

static constexpr uint8_t kFlagUtf8Json = 0x01;
static constexpr uint8_t kFlagBinary = 0x02;
static constexpr uint8_t kFlagCompressed = 0x04;   // reserved, never produced
static constexpr uint8_t kReservedFlagMask = 0xFC;  // bits 2..7 must be zero

inline bool is_known_message_type(uint8_t type) {
  return type >= static_cast<uint8_t>(MessageType::kHello) && type <= static_cast<uint8_t>(MessageType::kError);
}

const char* message_type_name(uint8_t type);

inline const char* message_type_name(MessageType type) { return message_type_name(static_cast<uint8_t>(type)); }

// ============================================================================
// Payload model
// ============================================================================

using Bytes = std::vector<uint8_t>;

// Decoded payload: nothing, a JSON value (UTF8_JSON), or raw bytes.
using Payload = std::variant<std::monostate, nlohmann::json, Bytes>;

struct ParsedMessage {
  uint8_t version = kProtocolVersion;
  uint8_t type = 0;
  uint8_t flags = 0;
  Payload payload;

  bool has_payload() const { return !std::holds_alternative<std::monostate>(payload); }
  bool is_json() const { return std::holds_alternative<nlohmann::json>(payload); }
  bool is_bytes() const { return std::holds_alternative<Bytes>(payload); }

  const nlohmann::json& json() const { return std::get<nlohmann::json>(payload); }
  const Bytes& bytes() const { return std::get<Bytes>(payload); }
};

// ============================================================================
// Frame (wire-level view)
// ============================================================================

// Views point into the buffer handed to extract_frame().
struct Frame {
  uint32_t length = 0;
  uint8_t version = 0;
  uint8_t type = 0;
  uint8_t flags = 0;
  std::string_view payload;
  std::string_view remainder;  // version + type + flags + payload
};

enum class ExtractStatus : uint8_t { kFrame, kNeedMore };

struct Extraction {
  ExtractStatus status = ExtractStatus::kNeedMore;
  Frame frame;
  std::string_view remaining;  // unconsumed tail of the input
  size_t consumed = 0;
};

// ============================================================================
// Codec
// ============================================================================

// Writes the 7 header bytes (length, version, type, flags) to out.
void encode_frame_header(uint8_t* out, uint8_t type, uint8_t flags, size_t payload_size);

/**
 * @brief Serialize a frame. Flags are derived from the payload alternative:
 *        none -> 0, JSON -> UTF8_JSON, bytes -> BINARY.
 */
Bytes encode_frame(uint8_t type, const Payload& payload = Payload{});

// Same, with flags written verbatim instead of derived.
Bytes encode_frame(uint8_t type, const Payload& payload, uint8_t flags);

inline Bytes encode_frame(MessageType type, const Payload& payload = Payload{}) {
  return encode_frame(static_cast<uint8_t>(type), payload);
}

inline Bytes encode_frame(MessageType type, const Payload& payload, uint8_t flags) {
  return encode_frame(static_cast<uint8_t>(type), payload, flags);
}

/**
 * @brief Decode one frame remainder (the bytes after the length field).
 *
 * Returns kInvalidLength if shorter than the 3-byte header remainder and
 * kInvalidJson if UTF8_JSON is set but the payload is not valid UTF-8 JSON.
 * Version, type and reserved flag bits are not checked here.
 */
expected<ParsedMessage, ErrorCode> decode_frame(std::string_view remainder);

inline expected<ParsedMessage, ErrorCode> decode_frame(const Frame& frame) { return decode_frame(frame.remainder); }

/**
 * @brief Take one complete frame off the front of buffer.
 *
 * Returns kNeedMore until 4 + length bytes are present. A declared length
 * below 3 fails with kInvalidLength; a frame larger than kMaxFrameSize fails
 * with kFrameTooLarge as soon as the length field is readable. Call
 * repeatedly on `remaining` until kNeedMore to drain coalesced frames.
 */
expected<Extraction, ErrorCode> extract_frame(std::string_view buffer);

}  // namespace proto
}  // namespace relay

#endif  // RELAY_FRAME_HPP_
