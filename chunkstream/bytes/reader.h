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


#ifndef CHUNKSTREAM_BYTES_READER_H_
#define CHUNKSTREAM_BYTES_READER_H_

#include <stddef.h>

#include <limits>
#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/object.h"
#include "chunkstream/base/types.h"

namespace chunkstream {

// A `Reader` pulls bytes from a source into a window of memory and lets its
// caller consume them from there. Subclasses decide where the window lives:
// over a string held in memory, over a buffer refilled from a file descriptor
// or a `std::istream`, or over the output of a decompressor.
//
// Only sequential reading is supported. `pos()` counts the bytes consumed
// since the beginning of the source.
//
// A source without a local counterpart, such as an object-storage download,
// is plugged in by deriving from `BufferedReader`.
class Reader : public Object {
 public:
  // Makes at least `min_length` bytes available at `cursor()`, pulling from
  // the source when the window holds fewer. Consumes nothing.
  //
  // When the source ends early the window keeps everything that remained.
  //
  // Return values:
  //  * `true`                 - success (`available() >= min_length`)
  //  * `false` (when `ok()`)  - source ends (`available() < min_length`)
  //  * `false` (when `!ok()`) - failure (`available() < min_length`)
  bool Pull(size_t min_length = 1);

  // The window: `available()` bytes starting at `cursor()`. Any non-const
  // call may move it.
  const char* cursor() const { return cursor_; }
  size_t available() const { return static_cast<size_t>(limit_ - cursor_); }

  // Consumes `length` bytes of the window.
  //
  // Precondition: `length <= available()`
  void move_cursor(size_t length);

  // Replaces `dest` with the next `length` bytes.
  //
  // Memory for `dest` grows with what the source delivers, never with
  // `length` itself.
  //
  // If `length_read != nullptr`, `*length_read` receives the number of bytes
  // consumed, also when the result is `false`.
  //
  // Return values:
  //  * `true`                 - success (`length` bytes read)
  //  * `false` (when `ok()`)  - source ends (fewer bytes read)
  //  * `false` (when `!ok()`) - failure (fewer bytes read)
  bool Read(size_t length, std::string& dest, size_t* length_read = nullptr);

  // Fails the `Reader` with `absl::InvalidArgumentError()` unless the source
  // has nothing left.
  void VerifyEnd();

  // `VerifyEnd()` followed by `Close()`. Returns what `Close()` returns.
  bool VerifyEndAndClose();

  // Position of `cursor()` in the source.
  Position pos() const;

  // Position of the end of the window in the source.
  Position limit_pos() const { return limit_pos_; }

 protected:
  explicit Reader(Closed) noexcept : Object(kClosed) {}
  Reader() noexcept {}

  Reader(Reader&& that) noexcept;
  Reader& operator=(Reader&& that) noexcept;

  // Drops the window. Overrides must call `Reader::Done()`.
  void Done() override;

  // Appends the position, as "at byte N", while the `Reader` is open.
  ABSL_ATTRIBUTE_COLD absl::Status AnnotateStatusImpl(
      absl::Status status) override;

  // Fails with `absl::ResourceExhaustedError()`. Returns `false`.
  ABSL_ATTRIBUTE_COLD bool FailOverflow();

  // Default: fails if `Pull()` still finds data.
  virtual void VerifyEndImpl();

  // Refills the window so that it holds at least `min_length` bytes.
  //
  // Precondition: `available() < min_length`
  virtual bool PullSlow(size_t min_length) = 0;

  // Points the window at `length` bytes starting at `data`. `limit_pos()` is
  // left alone.
  void set_buffer(const char* data = nullptr, size_t length = 0);

  // Advances `limit_pos()` by `length`.
  void move_limit_pos(Position length);

 private:
  bool ReadSlow(size_t length, std::string& dest);

  const char* cursor_ = nullptr;
  const char* limit_ = nullptr;
  // Invariant: `limit_pos_ >= available()`
  Position limit_pos_ = 0;
};

// Implementation details follow.

inline Reader::Reader(Reader&& that) noexcept
    : Object(static_cast<Object&&>(that)),
      cursor_(std::exchange(that.cursor_, nullptr)),
      limit_(std::exchange(that.limit_, nullptr)),
      limit_pos_(std::exchange(that.limit_pos_, 0)) {}

inline Reader& Reader::operator=(Reader&& that) noexcept {
  Object::operator=(static_cast<Object&&>(that));
  cursor_ = std::exchange(that.cursor_, nullptr);
  limit_ = std::exchange(that.limit_, nullptr);
  limit_pos_ = std::exchange(that.limit_pos_, 0);
  return *this;
}

inline bool Reader::Pull(size_t min_length) {
  if (ABSL_PREDICT_TRUE(available() >= min_length)) return true;
  const bool pulled = PullSlow(min_length);
  CHUNKSTREAM_ASSERT(!pulled || available() >= min_length)
      << "Reader::PullSlow() reported success with too little data";
  return pulled;
}

inline void Reader::move_cursor(size_t length) {
  CHUNKSTREAM_ASSERT_LE(length, available())
      << "Reader::move_cursor() past the window";
  cursor_ += length;
}

inline void Reader::VerifyEnd() { VerifyEndImpl(); }

inline bool Reader::VerifyEndAndClose() {
  VerifyEnd();
  return Close();
}

inline Position Reader::pos() const {
  CHUNKSTREAM_ASSERT_GE(limit_pos_, available())
      << "Reader window starts before the source";
  return limit_pos_ - available();
}

inline void Reader::set_buffer(const char* data, size_t length) {
  cursor_ = data;
  limit_ = data + length;
}

inline void Reader::move_limit_pos(Position length) {
  CHUNKSTREAM_ASSERT_LE(length,
                        std::numeric_limits<Position>::max() - limit_pos_)
      << "Reader::move_limit_pos() overflows";
  limit_pos_ += length;
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_READER_H_
