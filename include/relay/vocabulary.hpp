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
 * @file vocabulary.hpp
 * @brief Vocabulary types for relay: ErrorCode taxonomy, expected<V, E>,
 *        InvariantViolation.
 */

#ifndef RELAY_VOCABULARY_HPP_
#define RELAY_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define RELAY_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define RELAY_THROW(ex)           \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

#ifndef RELAY_ASSERT
#define RELAY_ASSERT(cond) ((void)(cond))
#endif

namespace relay {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,

  // Protocol errors: ERROR frame, then the connection is closed
  kInvalidLength = 10,
  kFrameTooLarge = 11,
  kUnsupportedVersion = 12,
  kUnknownMessageType = 13,
  kInvalidFlags = 14,
  kInvalidJson = 15,

  // Application errors: ERROR frame, connection stays open
  kInvalidRoomName = 30,
  kRoomNotFound = 31,
  kNotInRoom = 32,
  kMissingContent = 33,
  kInvalidPayload = 34,
  kUnsupportedMessage = 35,
  kNotWritable = 36,

  // Transport errors: logged, connection is terminated
  kSocketError = 50,
  kConnectionClosed = 51,
  kSlowConsumer = 52,
  kHeartbeatTimeout = 53,
  kMaxConnectionsExceeded = 54,

  kInvalidConfig = 70,
  kInvalidState = 71,
  kInternalError = 255
};

enum class ErrorKind : uint8_t {
  kNone,
  kProtocol,
  kApplication,
  kTransport,
  kInternal
};

constexpr ErrorKind error_kind(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return ErrorKind::kNone;
    case ErrorCode::kInvalidLength:
    case ErrorCode::kFrameTooLarge:
    case ErrorCode::kUnsupportedVersion:
    case ErrorCode::kUnknownMessageType:
    case ErrorCode::kInvalidFlags:
    case ErrorCode::kInvalidJson:
      return ErrorKind::kProtocol;
    case ErrorCode::kInvalidRoomName:
    case ErrorCode::kRoomNotFound:
    case ErrorCode::kNotInRoom:
    case ErrorCode::kMissingContent:
    case ErrorCode::kInvalidPayload:
    case ErrorCode::kUnsupportedMessage:
    case ErrorCode::kNotWritable:
      return ErrorKind::kApplication;
    case ErrorCode::kSocketError:
    case ErrorCode::kConnectionClosed:
    case ErrorCode::kSlowConsumer:
    case ErrorCode::kHeartbeatTimeout:
    case ErrorCode::kMaxConnectionsExceeded:
      return ErrorKind::kTransport;
    default:
      return ErrorKind::kInternal;
  }
}

/// Stable machine-readable name, carried in the "code" field of ERROR frames.
const char* error_code_name(ErrorCode code) noexcept;

const char* error_kind_name(ErrorKind kind) noexcept;

// Human-readable sentence for logs and the "message" field of ERROR frames.
const char* error_code_description(ErrorCode code) noexcept;

/**
 * @brief Thrown when the process hits a state that correct code never reaches
 *        (for example an illegal connection state transition).
 */
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& val) {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    RELAY_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    RELAY_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    RELAY_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const { return has_value_ ? value() : default_val; }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    RELAY_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

using Status = expected<void, ErrorCode>;

}  // namespace relay

#endif  // RELAY_VOCABULARY_HPP_
