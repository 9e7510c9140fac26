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

#include "chunkstream/records/record_assembler.h"

#include <stdint.h>

#include <string>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/status.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record.h"
#include "chunkstream/records/corrupt_record.h"
#include "chunkstream/records/frame_reading.h"

namespace chunkstream {

namespace {

ABSL_ATTRIBUTE_COLD absl::Status CorruptionStatus(Reader& src,
                                                  const ChunkAddress& address,
                                                  uint64_t offset,
                                                  CorruptionKind kind) {
  return src.AnnotateStatus(CorruptRecordError(
      CorruptRecord{address.topic, address.partition, offset, kind}));
}

ABSL_ATTRIBUTE_COLD absl::Status FrameFailure(Reader& src,
                                              const ChunkAddress& address,
                                              uint64_t offset,
                                              FrameResult result) {
  switch (result) {
    case FrameResult::kTruncatedLengthPrefix:
      return CorruptionStatus(src, address, offset,
                              CorruptionKind::kTruncatedLengthPrefix);
    case FrameResult::kTruncatedPayload:
      return CorruptionStatus(src, address, offset,
                              CorruptionKind::kTruncatedPayload);
    case FrameResult::kSourceFailed:
      return Annotate(src.status(),
                      absl::StrCat("reading record at ", address.topic, "-",
                                   address.partition, ":", offset));
    case FrameResult::kFrame:
    case FrameResult::kEnd:
      break;
  }
  CHUNKSTREAM_CHECK_UNREACHABLE() << "Not a frame failure: " << result;
}

}  // namespace

absl::Status AssembleRecord(Reader& src, const ChunkAddress& address,
                            uint64_t offset, bool includes_keys,
                            absl::optional<ChunkRecord>& dest) {
  dest = absl::nullopt;
  std::string key;
  if (includes_keys) {
    const FrameResult key_result = ReadFrame(src, key);
    if (key_result == FrameResult::kEnd) return absl::OkStatus();
    if (ABSL_PREDICT_FALSE(key_result != FrameResult::kFrame)) {
      return FrameFailure(src, address, offset, key_result);
    }
  }
  std::string value;
  const FrameResult value_result = ReadFrame(src, value);
  if (value_result == FrameResult::kEnd) {
    if (!includes_keys) return absl::OkStatus();
    return CorruptionStatus(src, address, offset,
                            CorruptionKind::kMissingValueFrame);
  }
  if (ABSL_PREDICT_FALSE(value_result != FrameResult::kFrame)) {
    return FrameFailure(src, address, offset, value_result);
  }
  ChunkRecord& record = dest.emplace();
  record.topic = address.topic;
  record.partition = address.partition;
  record.offset = offset;
  if (includes_keys) record.key = std::move(key);
  record.value = std::move(value);
  return absl::OkStatus();
}

}  // namespace chunkstream
