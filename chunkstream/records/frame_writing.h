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

#ifndef CHUNKSTREAM_RECORDS_FRAME_WRITING_H_
#define CHUNKSTREAM_RECORDS_FRAME_WRITING_H_

#include <string>

#include "absl/strings/string_view.h"
#include "chunkstream/records/chunk_record.h"

namespace chunkstream {

// Appends a frame holding `payload` to `dest`: a 4-byte big-endian length
// followed by `payload`.
//
// Precondition: `payload.size() <= std::numeric_limits<uint32_t>::max()`
void AppendFrame(absl::string_view payload, std::string& dest);

// Appends the frames of `record` to `dest`, in the layout expected by a
// `ChunkRecordReader` with the given `includes_keys`.
//
// With `includes_keys`, an absent key is written as an empty key frame. Without
// `includes_keys`, the key is not written.
void AppendChunkRecord(const ChunkRecord& record, bool includes_keys,
                       std::string& dest);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_FRAME_WRITING_H_
