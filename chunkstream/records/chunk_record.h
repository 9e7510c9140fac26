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

#ifndef CHUNKSTREAM_RECORDS_CHUNK_RECORD_H_
#define CHUNKSTREAM_RECORDS_CHUNK_RECORD_H_

#include <stdint.h>

#include <ostream>
#include <string>

#include "absl/types/optional.h"

namespace chunkstream {

// A logical record reconstructed from a chunk.
//
// `key` is present iff the chunk was decoded with keys. A present key may be
// empty.
struct ChunkRecord {
  friend bool operator==(const ChunkRecord& a, const ChunkRecord& b) {
    return a.topic == b.topic && a.partition == b.partition &&
           a.offset == b.offset && a.key == b.key && a.value == b.value;
  }
  friend bool operator!=(const ChunkRecord& a, const ChunkRecord& b) {
    return !(a == b);
  }

  // Writes the position of the record and its escaped contents, for test
  // failures and tools.
  friend std::ostream& operator<<(std::ostream& out, const ChunkRecord& record);

  std::string topic;
  uint32_t partition = 0;
  uint64_t offset = 0;
  absl::optional<std::string> key;
  std::string value;
};

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_CHUNK_RECORD_H_
