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


#include "chunkstream/bytes/buffered_reader.h"

#include <stddef.h>

#include <cstring>
#include <memory>

#include "absl/base/optimization.h"
#include "absl/types/optional.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/reader.h"

namespace chunkstream {

void BufferedReader::Done() {
  Reader::Done();
  buffer_.reset();
  capacity_ = 0;
}

void BufferedReader::PrepareBuffer(size_t capacity) {
  const size_t kept = available();
  if (capacity > capacity_) {
    std::unique_ptr<char[]> grown(new char[capacity]);
    if (kept > 0) std::memcpy(grown.get(), cursor(), kept);
    buffer_ = std::move(grown);
    capacity_ = capacity;
  } else if (kept > 0 && cursor() != buffer_.get()) {
    std::memmove(buffer_.get(), cursor(), kept);
  }
  set_buffer(buffer_.get(), kept);
}

bool BufferedReader::PullSlow(size_t min_length) {
  CHUNKSTREAM_ASSERT_LT(available(), min_length)
      << "BufferedReader::PullSlow() called with enough data";
  if (ABSL_PREDICT_FALSE(!ok())) return false;
  const size_t kept = available();
  size_t max_length =
      UnsignedMax(min_length, buffer_options_.buffer_size()) - kept;
  if (exact_size_ != absl::nullopt) {
    if (limit_pos() >= *exact_size_) return false;
    max_length = UnsignedMin(max_length, *exact_size_ - limit_pos());
  }
  PrepareBuffer(kept + max_length);
  const Position limit_pos_before = limit_pos();
  const bool read_ok =
      ReadInternal(UnsignedMin(min_length - kept, max_length), max_length,
                   buffer_.get() + kept);
  const size_t length_read = IntCast<size_t>(limit_pos() - limit_pos_before);
  CHUNKSTREAM_ASSERT_LE(length_read, max_length)
      << "BufferedReader::ReadInternal() overran its destination";
  // Whatever arrived before a failure or the end stays readable.
  set_buffer(buffer_.get(), kept + length_read);
  return read_ok && available() >= min_length;
}

}  // namespace chunkstream
