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

#include "chunkstream/records/frame_reading.h"

#include <stddef.h>
#include <stdint.h>

#include <ostream>
#include <string>

#include "absl/base/optimization.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/endian/endian_reading.h"

namespace chunkstream {

std::ostream& operator<<(std::ostream& out, FrameResult result) {
  switch (result) {
    case FrameResult::kFrame:
      return out << "frame";
    case FrameResult::kEnd:
      return out << "end";
    case FrameResult::kTruncatedLengthPrefix:
      return out << "truncated length prefix";
    case FrameResult::kTruncatedPayload:
      return out << "truncated payload";
    case FrameResult::kSourceFailed:
      return out << "source failed";
  }
  return out << "unknown frame result " << static_cast<int>(result);
}

FrameResult ReadFrame(Reader& src, std::string& dest) {
  uint32_t length;
  if (ABSL_PREDICT_FALSE(!ReadBigEndian32(src, length))) {
    if (ABSL_PREDICT_FALSE(!src.ok())) return FrameResult::kSourceFailed;
    // All remaining data are available after `Pull()` returned `false`.
    return src.available() == 0 ? FrameResult::kEnd
                                : FrameResult::kTruncatedLengthPrefix;
  }
  size_t length_read;
  if (ABSL_PREDICT_FALSE(!src.Read(length, dest, &length_read))) {
    if (ABSL_PREDICT_FALSE(!src.ok())) return FrameResult::kSourceFailed;
    // A length prefix followed by no payload byte counts as a truncated length
    // prefix.
    return length_read == 0 ? FrameResult::kTruncatedLengthPrefix
                            : FrameResult::kTruncatedPayload;
  }
  return FrameResult::kFrame;
}

}  // namespace chunkstream
