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

#include "chunkstream/records/frame_writing.h"

#include <stdint.h>

#include <limits>
#include <string>

#include "absl/strings/string_view.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/endian/endian_writing.h"
#include "chunkstream/records/chunk_record.h"

namespace chunkstream {

void AppendFrame(absl::string_view payload, std::string& dest) {
  CHUNKSTREAM_CHECK_LE(payload.size(), std::numeric_limits<uint32_t>::max())
      << "Failed precondition of AppendFrame(): payload too long";
  char length[sizeof(uint32_t)];
  EncodeBigEndian32(IntCast<uint32_t>(payload.size()), length);
  dest.append(length, sizeof(length));
  dest.append(payload.data(), payload.size());
}

void AppendChunkRecord(const ChunkRecord& record, bool includes_keys,
                       std::string& dest) {
  if (includes_keys) AppendFrame(record.key.value_or(std::string()), dest);
  AppendFrame(record.value, dest);
}

}  // namespace chunkstream
