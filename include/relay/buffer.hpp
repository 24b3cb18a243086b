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
 * @file buffer.hpp
 * @brief ByteBuffer: growable byte arena with a read cursor.
 *
 * One ByteBuffer backs each connection's accumulation (RX) buffer and its
 * pending outbound (TX) bytes. Consumed bytes are dropped by advancing the
 * read cursor; the live region is moved to the front only when the tail has
 * no room left, so each byte is shifted at most a bounded number of times.
 */

#ifndef RELAY_BUFFER_HPP_
#define RELAY_BUFFER_HPP_

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <algorithm>
#include <string_view>
#include <sys/uio.h>  // iovec
#include <vector>

namespace relay {

class ByteBuffer {
 public:
  static constexpr size_t kInitialCapacity = 4096;

  explicit ByteBuffer(size_t initial_capacity = kInitialCapacity) : storage_(initial_capacity) {}

  // Append bytes at the tail, growing the arena when needed
  void append(const uint8_t* data, size_t len) {
    if (len == 0)
      return;
    std::memcpy(prepare(len), data, len);
    commit(len);
  }

  void append(std::string_view data) { append(reinterpret_cast<const uint8_t*>(data.data()), data.size()); }

  // Writable region of at least len bytes at the tail (for direct read())
  uint8_t* prepare(size_t len) {
    if (storage_.size() - write_idx_ < len) {
      compact();
      if (storage_.size() - write_idx_ < len) {
        storage_.resize(std::max(storage_.size() * 2, write_idx_ + len));
      }
    }
    return storage_.data() + write_idx_;
  }

  // Mark len bytes of the prepared region as readable
  void commit(size_t len) { write_idx_ = std::min(write_idx_ + len, storage_.size()); }

  // Read data from buffer without removing
  size_t peek(uint8_t* data, size_t max_len) const {
    size_t len = std::min(max_len, size());
    if (len > 0)
      std::memcpy(data, storage_.data() + read_idx_, len);
    return len;
  }

  // Remove data from the front
  void advance(size_t len) {
    read_idx_ += std::min(len, size());
    if (read_idx_ == write_idx_) {
      read_idx_ = 0;
      write_idx_ = 0;
    }
  }

  size_t size() const { return write_idx_ - read_idx_; }

  size_t capacity() const { return storage_.size(); }

  bool empty() const { return read_idx_ == write_idx_; }

  void clear() {
    read_idx_ = 0;
    write_idx_ = 0;
  }

  // Readable bytes; invalidated by the next prepare()/append()
  std::string_view view() const {
    if (empty())
      return {};
    return std::string_view(reinterpret_cast<const char*>(storage_.data() + read_idx_), size());
  }

  // Fill iovec for writev; the live region is always contiguous
  size_t fill_iovec(struct iovec* iov, size_t max_iov) const {
    if (empty() || max_iov == 0)
      return 0;
    iov[0].iov_base = const_cast<uint8_t*>(storage_.data() + read_idx_);
    iov[0].iov_len = size();
    return 1;
  }

 private:
  // Move the live region to the front of the arena
  void compact() {
    if (read_idx_ == 0)
      return;
    size_t live = size();
    if (live > 0)
      std::memmove(storage_.data(), storage_.data() + read_idx_, live);
    read_idx_ = 0;
    write_idx_ = live;
  }

  std::vector<uint8_t> storage_;
  size_t read_idx_ = 0;
  size_t write_idx_ = 0;
};

}  // namespace relay

#endif  // RELAY_BUFFER_HPP_
