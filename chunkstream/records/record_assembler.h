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

#ifndef CHUNKSTREAM_RECORDS_RECORD_ASSEMBLER_H_
#define CHUNKSTREAM_RECORDS_RECORD_ASSEMBLER_H_

#include <stdint.h>

#include "absl/status/status.h"
#include "absl/types/optional.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record.h"

namespace chunkstream {

// Reads the frames of one record from `src` and combines them with `address`
// and `offset` into `dest`.
//
// With `includes_keys`, a record is a key frame followed by a value frame.
// Otherwise a record is a single value frame and the key stays absent.
//
// Return values:
//  * `absl::OkStatus()`, `dest` set      - a record was read
//  * `absl::OkStatus()`, `dest` empty    - `src` ended cleanly before the
//                                          record
//  * `absl::DataLossError()`             - the framing is inconsistent,
//                                          `GetCorruptRecord()` tells where
//                                          and how
//  * other failed status                 - `src` failed
//
// On failure `dest` is empty: a partial record is never returned.
absl::Status AssembleRecord(Reader& src, const ChunkAddress& address,
                            uint64_t offset, bool includes_keys,
                            absl::optional<ChunkRecord>& dest);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_RECORD_ASSEMBLER_H_
