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


#ifndef CHUNKSTREAM_ENDIAN_ENDIAN_WRITING_H_
#define CHUNKSTREAM_ENDIAN_ENDIAN_WRITING_H_

#include <stdint.h>

namespace chunkstream {

// Stores `value` big-endian in `dest[0..3]`.
inline void EncodeBigEndian32(uint32_t value, char* dest) {
  for (int index = 3; index >= 0; --index) {
    dest[index] = static_cast<char>(static_cast<unsigned char>(value & 0xff));
    value >>= 8;
  }
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_ENDIAN_ENDIAN_WRITING_H_
