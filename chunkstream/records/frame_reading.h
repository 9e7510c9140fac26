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

#ifndef CHUNKSTREAM_RECORDS_FRAME_READING_H_
#define CHUNKSTREAM_RECORDS_FRAME_READING_H_

#include <ostream>
#include <string>

#include "chunkstream/bytes/reader.h"

namespace chunkstream {

// Outcome of `ReadFrame()`.
enum class FrameResult {
  // A frame was read.
  kFrame,
  // The source ended cleanly before the frame, i.e. at a frame boundary.
  kEnd,
  // The source ended after 1 to 3 bytes of the length prefix, or right after
  // a length prefix announcing a non-empty payload.
  kTruncatedLengthPrefix,
  // The source ended within the payload, after some but not all of the
  // announced bytes.
  kTruncatedPayload,
  // The source failed; `src.status()` explains why.
  kSourceFailed,
};

std::ostream& operator<<(std::ostream& out, FrameResult result);

// Reads a single frame: a 4-byte big-endian unsigned length `L` followed by
// exactly `L` bytes of payload. A zero length frame has an empty payload.
//
// On `FrameResult::kFrame`, `dest` is set to the payload. Otherwise `dest` is
// undefined, and the position of `src` is undefined too unless the result is
// `FrameResult::kEnd`.
FrameResult ReadFrame(Reader& src, std::string& dest);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_FRAME_READING_H_
