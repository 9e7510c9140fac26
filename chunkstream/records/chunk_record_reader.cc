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

#include "chunkstream/records/chunk_record_reader.h"

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record.h"
#include "chunkstream/records/record_assembler.h"

namespace chunkstream {

void ChunkRecordReaderBase::Initialize(Reader* src, ChunkAddress&& address,
                                       bool includes_keys) {
  CHUNKSTREAM_ASSERT(src != nullptr)
      << "Failed precondition of ChunkRecordReader: null Reader pointer";
  address_ = std::move(address);
  includes_keys_ = includes_keys;
  next_offset_ = address_.start_offset;
  if (ABSL_PREDICT_FALSE(!src->ok()) && src->available() == 0) {
    FailWithoutAnnotation(src->status());
  }
}

void ChunkRecordReaderBase::Initialize(Reader* src,
                                       absl::string_view identifier,
                                       bool includes_keys) {
  absl::StatusOr<ChunkAddress> address = ParseChunkAddress(identifier);
  if (ABSL_PREDICT_FALSE(!address.ok())) {
    includes_keys_ = includes_keys;
    Fail(std::move(address).status());
    return;
  }
  Initialize(src, *std::move(address), includes_keys);
}

void ChunkRecordReaderBase::Done() { lookahead_ = absl::nullopt; }

ChunkRecordReaderBase::State ChunkRecordReaderBase::state() const {
  if (ABSL_PREDICT_FALSE(!not_failed())) return State::kFailed;
  if (exhausted_ || !is_open()) return State::kExhausted;
  return State::kReady;
}

inline bool ChunkRecordReaderBase::PullRecord() {
  if (lookahead_ != absl::nullopt) return true;
  if (ABSL_PREDICT_FALSE(!ok()) || exhausted_) return false;
  absl::Status status = AssembleRecord(*SrcReader(), address_, next_offset_,
                                       includes_keys_, lookahead_);
  if (ABSL_PREDICT_FALSE(!status.ok())) {
    return FailWithoutAnnotation(std::move(status));
  }
  if (lookahead_ == absl::nullopt) {
    exhausted_ = true;
    return false;
  }
  return true;
}

bool ChunkRecordReaderBase::ReadRecord(ChunkRecord& record) {
  if (ABSL_PREDICT_FALSE(!PullRecord())) return false;
  record = *std::move(lookahead_);
  lookahead_ = absl::nullopt;
  ++next_offset_;
  return true;
}

bool ChunkRecordReaderBase::PeekRecord(const ChunkRecord*& record) {
  if (ABSL_PREDICT_FALSE(!PullRecord())) return false;
  record = &*lookahead_;
  return true;
}

bool ChunkRecordReaderBase::HasNext() { return PullRecord(); }

}  // namespace chunkstream
