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


#ifndef CHUNKSTREAM_ENDIAN_ENDIAN_READING_H_
#define CHUNKSTREAM_ENDIAN_ENDIAN_READING_H_

#include <stdint.h>

#include "absl/base/optimization.h"
#include "chunkstream/bytes/reader.h"

namespace chunkstream {

// Decodes the big-endian `uint32_t` stored in `src[0..3]`.
inline uint32_t DecodeBigEndian32(const char* src) {
  const auto byte = [src](int index) {
    return uint32_t{static_cast<unsigned char>(src[index])};
  };
  return byte(0) << 24 | byte(1) << 16 | byte(2) << 8 | byte(3);
}

// Reads a big-endian `uint32_t` from `src`.
//
// Return values:
//  * `true`                 - success (`dest` is set)
//  * `false` (when `ok()`)  - fewer than 4 bytes remain (nothing consumed)
//  * `false` (when `!ok()`) - failure (nothing consumed)
inline bool ReadBigEndian32(Reader& src, uint32_t& dest) {
  if (ABSL_PREDICT_FALSE(!src.Pull(4))) return false;
  dest = DecodeBigEndian32(src.cursor());
  src.move_cursor(4);
  return true;
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_ENDIAN_ENDIAN_READING_H_
