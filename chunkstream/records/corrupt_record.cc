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

#include "chunkstream/records/corrupt_record.h"

#include <stdint.h>

#include <ostream>
#include <string>
#include <vector>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/cord.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/status.h"

namespace chunkstream {

namespace {

constexpr absl::string_view kCorruptRecordTypeUrl = "chunkstream/CorruptRecord";

}  // namespace

absl::string_view CorruptionKindName(CorruptionKind kind) {
  switch (kind) {
    case CorruptionKind::kTruncatedLengthPrefix:
      return "truncated length prefix";
    case CorruptionKind::kTruncatedPayload:
      return "truncated payload";
    case CorruptionKind::kMissingValueFrame:
      return "missing value frame";
  }
  CHUNKSTREAM_CHECK_UNREACHABLE()
      << "Unknown corruption kind: " << static_cast<int>(kind);
}

std::ostream& operator<<(std::ostream& out,
                         const CorruptRecord& corrupt_record) {
  return out << CorruptionKindName(corrupt_record.kind) << " at "
             << corrupt_record.topic << "-" << corrupt_record.partition << ":"
             << corrupt_record.offset;
}

absl::Status CorruptRecordError(const CorruptRecord& corrupt_record) {
  absl::Status status = Annotate(
      absl::DataLossError(absl::StrCat(
          "Corrupt record at ", corrupt_record.topic, "-",
          corrupt_record.partition, ":", corrupt_record.offset)),
      CorruptionKindName(corrupt_record.kind));
  // The topic is last because it may contain spaces.
  status.SetPayload(
      kCorruptRecordTypeUrl,
      absl::Cord(absl::StrCat(static_cast<int>(corrupt_record.kind), " ",
                              corrupt_record.partition, " ",
                              corrupt_record.offset, " ",
                              corrupt_record.topic)));
  return status;
}

absl::optional<CorruptRecord> GetCorruptRecord(const absl::Status& status) {
  const absl::optional<absl::Cord> payload =
      status.GetPayload(kCorruptRecordTypeUrl);
  if (payload == absl::nullopt) return absl::nullopt;
  const std::string flat(*payload);
  const std::vector<absl::string_view> fields =
      absl::StrSplit(flat, absl::MaxSplits(' ', 3));
  if (ABSL_PREDICT_FALSE(fields.size() != 4)) return absl::nullopt;
  int kind;
  CorruptRecord corrupt_record;
  if (ABSL_PREDICT_FALSE(
          !absl::SimpleAtoi(fields[0], &kind) ||
          kind < static_cast<int>(CorruptionKind::kTruncatedLengthPrefix) ||
          kind > static_cast<int>(CorruptionKind::kMissingValueFrame) ||
          !absl::SimpleAtoi(fields[1], &corrupt_record.partition) ||
          !absl::SimpleAtoi(fields[2], &corrupt_record.offset))) {
    return absl::nullopt;
  }
  corrupt_record.kind = static_cast<CorruptionKind>(kind);
  corrupt_record.topic = std::string(fields[3]);
  return corrupt_record;
}

}  // namespace chunkstream
