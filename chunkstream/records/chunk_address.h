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

#ifndef CHUNKSTREAM_RECORDS_CHUNK_ADDRESS_H_
#define CHUNKSTREAM_RECORDS_CHUNK_ADDRESS_H_

#include <stdint.h>

#include <ostream>
#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace chunkstream {

// Addressing metadata of a chunk file, parsed from its name.
//
// A chunk name has the form `<topic>-<partition>-<start_offset>.gz`, where
// `<partition>` has exactly 5 decimal digits and `<start_offset>` has exactly
// 12 decimal digits, both zero padded. The name may be preceded by a path; the
// topic is then taken from the last path component.
struct ChunkAddress {
  friend bool operator==(const ChunkAddress& a, const ChunkAddress& b) {
    return a.topic == b.topic && a.partition == b.partition &&
           a.start_offset == b.start_offset;
  }
  friend bool operator!=(const ChunkAddress& a, const ChunkAddress& b) {
    return !(a == b);
  }

  // Writes `topic-partition:start_offset`.
  friend std::ostream& operator<<(std::ostream& out,
                                  const ChunkAddress& address);

  std::string topic;
  uint32_t partition = 0;
  // Logical offset of the first record in the chunk.
  uint64_t start_offset = 0;
};

// Parses a chunk identifier, e.g. "orders-00003-000000001024.gz" or
// "archive/2024/orders-00003-000000001024.gz".
//
// Returns `absl::InvalidArgumentError()` if `identifier` does not match the
// chunk name grammar as a whole.
absl::StatusOr<ChunkAddress> ParseChunkAddress(absl::string_view identifier);

// Returns only the partition of a chunk identifier, e.g. for routing chunks to
// consumers before any of them is read.
//
// Fails like `ParseChunkAddress()`.
absl::StatusOr<uint32_t> ExtractPartition(absl::string_view identifier);

// Formats the chunk name of `address`, the inverse of `ParseChunkAddress()`.
//
// Returns `absl::OutOfRangeError()` if the partition or the start offset do not
// fit in their fixed width fields, and `absl::InvalidArgumentError()` if the
// topic is empty or contains '/'.
absl::StatusOr<std::string> FormatChunkName(const ChunkAddress& address);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_CHUNK_ADDRESS_H_
