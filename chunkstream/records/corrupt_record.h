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

#ifndef CHUNKSTREAM_RECORDS_CORRUPT_RECORD_H_
#define CHUNKSTREAM_RECORDS_CORRUPT_RECORD_H_

#include <stdint.h>

#include <ostream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"

namespace chunkstream {

// How the framing of a record was found to be inconsistent.
enum class CorruptionKind {
  // The stream ended within the 4 bytes of a length prefix, or right after a
  // length prefix announcing a non-empty payload.
  kTruncatedLengthPrefix = 1,
  // The stream ended within a payload, before the number of bytes announced by
  // its length prefix.
  kTruncatedPayload = 2,
  // The stream ended after a key frame, before its value frame.
  kMissingValueFrame = 3,
};

// Returns a human readable name of `kind`, e.g. "truncated length prefix".
absl::string_view CorruptionKindName(CorruptionKind kind);

// Identifies the record whose framing is inconsistent.
struct CorruptRecord {
  friend bool operator==(const CorruptRecord& a, const CorruptRecord& b) {
    return a.topic == b.topic && a.partition == b.partition &&
           a.offset == b.offset && a.kind == b.kind;
  }
  friend bool operator!=(const CorruptRecord& a, const CorruptRecord& b) {
    return !(a == b);
  }

  friend std::ostream& operator<<(std::ostream& out,
                                  const CorruptRecord& corrupt_record);

  std::string topic;
  uint32_t partition = 0;
  // Logical offset of the record which could not be decoded.
  uint64_t offset = 0;
  CorruptionKind kind = CorruptionKind::kTruncatedPayload;
};

// Returns an `absl::DataLossError()` with message
// "Corrupt record at <topic>-<partition>:<offset>", annotated with the kind of
// corruption, and carrying `corrupt_record` as a payload.
absl::Status CorruptRecordError(const CorruptRecord& corrupt_record);

// Recovers the `CorruptRecord` carried by a status returned by
// `CorruptRecordError()`, possibly annotated since then.
//
// Returns `absl::nullopt` if `status` does not carry it.
absl::optional<CorruptRecord> GetCorruptRecord(const absl::Status& status);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_CORRUPT_RECORD_H_
