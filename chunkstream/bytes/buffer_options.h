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


#ifndef CHUNKSTREAM_BYTES_BUFFER_OPTIONS_H_
#define CHUNKSTREAM_BYTES_BUFFER_OPTIONS_H_

#include <stddef.h>

#include <utility>

#include "chunkstream/base/assert.h"

namespace chunkstream {

// How much a `BufferedReader` asks its source for at a time.
class BufferOptions {
 public:
  static constexpr size_t kDefaultBufferSize = size_t{64} << 10;

  BufferOptions() noexcept {}

  // Bytes requested from the source per refill. A single `Pull()` asking for
  // more gets a larger refill.
  //
  // Default: `kDefaultBufferSize` (64K)
  BufferOptions& set_buffer_size(size_t buffer_size) & {
    CHUNKSTREAM_CHECK_GT(buffer_size, 0u) << "Zero buffer size";
    buffer_size_ = buffer_size;
    return *this;
  }
  BufferOptions&& set_buffer_size(size_t buffer_size) && {
    return std::move(set_buffer_size(buffer_size));
  }
  size_t buffer_size() const { return buffer_size_; }

 private:
  size_t buffer_size_ = kDefaultBufferSize;
};

// Adds `set_buffer_size()` to the `Options` of a buffered reader. `Options`
// derives from `BufferOptionsBase<Options>`.
template <typename Options>
class BufferOptionsBase {
 public:
  Options& set_buffer_size(size_t buffer_size) & {
    buffer_options_.set_buffer_size(buffer_size);
    return static_cast<Options&>(*this);
  }
  Options&& set_buffer_size(size_t buffer_size) && {
    return std::move(set_buffer_size(buffer_size));
  }
  size_t buffer_size() const { return buffer_options_.buffer_size(); }

  const BufferOptions& buffer_options() const { return buffer_options_; }

 protected:
  BufferOptionsBase() = default;
  BufferOptionsBase(const BufferOptionsBase&) = default;
  BufferOptionsBase& operator=(const BufferOptionsBase&) = default;
  ~BufferOptionsBase() = default;

 private:
  BufferOptions buffer_options_;
};

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_BUFFER_OPTIONS_H_
