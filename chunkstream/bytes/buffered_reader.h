// Copyright 2026 Google LLC
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.


#ifndef CHUNKSTREAM_BYTES_BUFFERED_READER_H_
#define CHUNKSTREAM_BYTES_BUFFERED_READER_H_

#include <stddef.h>

#include <memory>
#include <utility>

#include "absl/types/optional.h"
#include "chunkstream/base/object.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/buffer_options.h"
#include "chunkstream/bytes/reader.h"

namespace chunkstream {

// Base of readers whose source copies bytes into memory supplied by the
// caller, the way `read()` does. The source is asked for about
// `buffer_size()` bytes per refill; bytes not yet consumed are shifted to the
// front of the buffer first.
class BufferedReader : public Reader {
 protected:
  explicit BufferedReader(Closed) noexcept : Reader(kClosed) {}
  explicit BufferedReader(
      BufferOptions buffer_options = BufferOptions()) noexcept
      : buffer_options_(buffer_options) {}

  BufferedReader(BufferedReader&& that) noexcept;
  BufferedReader& operator=(BufferedReader&& that) noexcept;

  void Done() override;

  // Once the source is known to end at `*exact_size`, no refill reads past
  // it and `Pull()` beyond it reports the end without calling
  // `ReadInternal()`.
  void set_exact_size(absl::optional<Position> exact_size) {
    exact_size_ = exact_size;
  }

  // Copies between `min_length` and `max_length` bytes from the source,
  // starting at `limit_pos()`, to `dest`, and advances `limit_pos()` by the
  // number copied. Fewer than `min_length` bytes may be copied only when
  // returning `false`. Must not touch the window.
  //
  // Preconditions:
  //   `0 < min_length <= max_length`
  //   `ok()`
  virtual bool ReadInternal(size_t min_length, size_t max_length,
                            char* dest) = 0;

  bool PullSlow(size_t min_length) override;

 private:
  // Moves the `available()` unread bytes to the front of a buffer with room
  // for `capacity` bytes, and points the window at them.
  void PrepareBuffer(size_t capacity);

  BufferOptions buffer_options_;
  absl::optional<Position> exact_size_;
  // Pulled bytes are kept from `buffer_.get()` onwards.
  std::unique_ptr<char[]> buffer_;
  size_t capacity_ = 0;
};

// Implementation details follow.

inline BufferedReader::BufferedReader(BufferedReader&& that) noexcept
    : Reader(static_cast<Reader&&>(that)),
      buffer_options_(that.buffer_options_),
      exact_size_(std::exchange(that.exact_size_, absl::nullopt)),
      buffer_(std::move(that.buffer_)),
      capacity_(std::exchange(that.capacity_, 0)) {}

inline BufferedReader& BufferedReader::operator=(
    BufferedReader&& that) noexcept {
  Reader::operator=(static_cast<Reader&&>(that));
  buffer_options_ = that.buffer_options_;
  exact_size_ = std::exchange(that.exact_size_, absl::nullopt);
  buffer_ = std::move(that.buffer_);
  capacity_ = std::exchange(that.capacity_, 0);
  return *this;
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_BUFFERED_READER_H_
