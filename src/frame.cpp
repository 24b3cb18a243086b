#include "relay/frame.hpp"

#include <cstring>

namespace relay {
namespace proto {

namespace {

uint32_t read_u32_be(const char* p) {
  return (static_cast<uint32_t>(static_cast<uint8_t>(p[0])) << 24) |
         (static_cast<uint32_t>(static_cast<uint8_t>(p[1])) << 16) |
         (static_cast<uint32_t>(static_cast<uint8_t>(p[2])) << 8) |
         static_cast<uint32_t>(static_cast<uint8_t>(p[3]));
}

uint8_t derive_flags(const Payload& payload) {
  if (std::holds_alternative<nlohmann::json>(payload))
    return kFlagUtf8Json;
  if (std::holds_alternative<Bytes>(payload))
    return kFlagBinary;
  return 0;
}

Bytes build_frame(uint8_t type, uint8_t flags, const uint8_t* body, size_t body_len) {
  Bytes frame(kHeaderSize + body_len);
  encode_frame_header(frame.data(), type, flags, body_len);
  if (body_len > 0)
    std::memcpy(frame.data() + kHeaderSize, body, body_len);
  return frame;
}

}  // namespace

const char* message_type_name(uint8_t type) {
  switch (type) {
    case 0x01: return "HELLO";
    case 0x02: return "JOIN_ROOM";
    case 0x03: return "LEAVE_ROOM";
    case 0x04: return "MESSAGE";
    case 0x05: return "HEARTBEAT";
    case 0x06: return "ERROR";
    default: return "UNKNOWN";
  }
}

void encode_frame_header(uint8_t* out, uint8_t type, uint8_t flags, size_t payload_size) {
  uint32_t length = static_cast<uint32_t>(kHeaderRemainderSize + payload_size);
  out[0] = static_cast<uint8_t>((length >> 24) & 0xFF);
  out[1] = static_cast<uint8_t>((length >> 16) & 0xFF);
  out[2] = static_cast<uint8_t>((length >> 8) & 0xFF);
  out[3] = static_cast<uint8_t>(length & 0xFF);
  out[4] = kProtocolVersion;
  out[5] = type;
  out[6] = flags;
}

Bytes encode_frame(uint8_t type, const Payload& payload) { return encode_frame(type, payload, derive_flags(payload)); }

Bytes encode_frame(uint8_t type, const Payload& payload, uint8_t flags) {
  if (const auto* bytes = std::get_if<Bytes>(&payload)) {
    return build_frame(type, flags, bytes->data(), bytes->size());
  }
  if (const auto* value = std::get_if<nlohmann::json>(&payload)) {
    // Invalid UTF-8 inside strings is replaced rather than thrown.
    std::string text = value->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return build_frame(type, flags, reinterpret_cast<const uint8_t*>(text.data()), text.size());
  }
  return build_frame(type, flags, nullptr, 0);
}

expected<ParsedMessage, ErrorCode> decode_frame(std::string_view remainder) {
  if (remainder.size() < kHeaderRemainderSize) {
    return expected<ParsedMessage, ErrorCode>::error(ErrorCode::kInvalidLength);
  }

  ParsedMessage msg;
  msg.version = static_cast<uint8_t>(remainder[0]);
  msg.type = static_cast<uint8_t>(remainder[1]);
  msg.flags = static_cast<uint8_t>(remainder[2]);

  std::string_view body = remainder.substr(kHeaderRemainderSize);
  if (body.empty()) {
    return expected<ParsedMessage, ErrorCode>::success(std::move(msg));
  }

  if (msg.flags & kFlagUtf8Json) {
    // Non-throwing parse: a discarded value marks malformed JSON or UTF-8.
    nlohmann::json value = nlohmann::json::parse(body.begin(), body.end(), nullptr, false);
    if (value.is_discarded()) {
      return expected<ParsedMessage, ErrorCode>::error(ErrorCode::kInvalidJson);
    }
    msg.payload.emplace<nlohmann::json>(std::move(value));
  } else {
    // BINARY, or no recognized encoding: keep the raw bytes
    msg.payload.emplace<Bytes>(body.begin(), body.end());
  }
  return expected<ParsedMessage, ErrorCode>::success(std::move(msg));
}

expected<Extraction, ErrorCode> extract_frame(std::string_view buffer) {
  Extraction out;
  if (buffer.size() < kLengthFieldSize) {
    out.remaining = buffer;
    return expected<Extraction, ErrorCode>::success(out);
  }

  uint32_t length = read_u32_be(buffer.data());
  if (length < kHeaderRemainderSize) {
    return expected<Extraction, ErrorCode>::error(ErrorCode::kInvalidLength);
  }

  size_t total = kLengthFieldSize + static_cast<size_t>(length);
  if (total > kMaxFrameSize) {
    return expected<Extraction, ErrorCode>::error(ErrorCode::kFrameTooLarge);
  }

  if (buffer.size() < total) {
    out.remaining = buffer;
    return expected<Extraction, ErrorCode>::success(out);
  }

  out.status = ExtractStatus::kFrame;
  out.frame.length = length;
  out.frame.remainder = buffer.substr(kLengthFieldSize, length);
  out.frame.version = static_cast<uint8_t>(out.frame.remainder[0]);
  out.frame.type = static_cast<uint8_t>(out.frame.remainder[1]);
  out.frame.flags = static_cast<uint8_t>(out.frame.remainder[2]);
  out.frame.payload = out.frame.remainder.substr(kHeaderRemainderSize);
  out.remaining = buffer.substr(total);
  out.consumed = total;
  return expected<Extraction, ErrorCode>::success(out);
}

}  // namespace proto
}  // namespace relay
