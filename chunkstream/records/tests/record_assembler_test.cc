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

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/bytes/string_reader.h"
#include "chunkstream/bytes/tests/test_utils.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record.h"
#include "chunkstream/records/corrupt_record.h"
#include "chunkstream/records/frame_writing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;
using ::testing::Optional;

const ChunkAddress kAddress{"orders", 3, 5};

TEST(AssembleRecordTest, KeyAndValue) {
  const ChunkAddress address{"t", 0, 5};
  StringReader<> src(absl::string_view("\x00\x00\x00\x03" "foo"
                                       "\x00\x00\x00\x01" "v",
                                       12));
  absl::optional<ChunkRecord> record;
  ASSERT_TRUE(AssembleRecord(src, address, 5, true, record).ok());
  ASSERT_NE(record, absl::nullopt);
  EXPECT_EQ(record->topic, "t");
  EXPECT_EQ(record->partition, 0u);
  EXPECT_EQ(record->offset, 5u);
  EXPECT_THAT(record->key, Optional(std::string("foo")));
  EXPECT_EQ(record->value, "v");

  EXPECT_TRUE(AssembleRecord(src, address, 6, true, record).ok());
  EXPECT_EQ(record, absl::nullopt);
}

TEST(AssembleRecordTest, ValueOnlyLeavesKeyAbsent) {
  std::string data;
  AppendFrame("foo", data);
  AppendFrame("v", data);
  StringReader<> src(data);
  absl::optional<ChunkRecord> record;
  ASSERT_TRUE(AssembleRecord(src, kAddress, 5, false, record).ok());
  ASSERT_NE(record, absl::nullopt);
  EXPECT_EQ(record->key, absl::nullopt);
  EXPECT_EQ(record->value, "foo");
  ASSERT_TRUE(AssembleRecord(src, kAddress, 6, false, record).ok());
  ASSERT_NE(record, absl::nullopt);
  EXPECT_EQ(record->offset, 6u);
  EXPECT_EQ(record->value, "v");
}

TEST(AssembleRecordTest, EmptyKeyIsPresent) {
  std::string data;
  AppendFrame("", data);
  AppendFrame("value", data);
  StringReader<> src(data);
  absl::optional<ChunkRecord> record;
  ASSERT_TRUE(AssembleRecord(src, kAddress, 0, true, record).ok());
  ASSERT_NE(record, absl::nullopt);
  EXPECT_THAT(record->key, Optional(std::string()));
}

TEST(AssembleRecordTest, MissingValueFrame) {
  std::string data;
  AppendFrame("lonely key", data);
  StringReader<> src(data);
  absl::optional<ChunkRecord> record = ChunkRecord();
  const absl::Status status = AssembleRecord(src, kAddress, 9, true, record);
  EXPECT_EQ(record, absl::nullopt);
  EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss);
  EXPECT_THAT(status.message(), HasSubstr("Corrupt record at orders-3:9"));
  EXPECT_THAT(status.message(), HasSubstr("missing value frame"));
  EXPECT_THAT(GetCorruptRecord(status),
              Optional(CorruptRecord{"orders", 3, 9,
                                     CorruptionKind::kMissingValueFrame}));
}

TEST(AssembleRecordTest, TruncatedValuePayload) {
  std::string data;
  AppendFrame("key", data);
  data.append("\x00\x00\x00\x08" "abc", 7);
  StringReader<> src(data);
  absl::optional<ChunkRecord> record;
  const absl::Status status = AssembleRecord(src, kAddress, 7, true, record);
  EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss);
  EXPECT_THAT(status.message(), HasSubstr("truncated payload"));
  EXPECT_THAT(GetCorruptRecord(status),
              Optional(CorruptRecord{"orders", 3, 7,
                                     CorruptionKind::kTruncatedPayload}));
}

TEST(AssembleRecordTest, TruncatedKeyLengthPrefix) {
  StringReader<> src(absl::string_view("\x00\x00", 2));
  absl::optional<ChunkRecord> record;
  const absl::Status status = AssembleRecord(src, kAddress, 5, true, record);
  EXPECT_EQ(status.code(), absl::StatusCode::kDataLoss);
  EXPECT_THAT(status.message(), HasSubstr("truncated length prefix"));
  EXPECT_THAT(status.message(), HasSubstr("at byte"));
  const absl::optional<CorruptRecord> corrupt_record =
      GetCorruptRecord(status);
  ASSERT_NE(corrupt_record, absl::nullopt);
  EXPECT_EQ(corrupt_record->kind, CorruptionKind::kTruncatedLengthPrefix);
  EXPECT_EQ(corrupt_record->offset, 5u);
}

TEST(AssembleRecordTest, KeyLengthPrefixWithoutPayload) {
  StringReader<> src(absl::string_view("\x00\x00\x00\x03", 4));
  absl::optional<ChunkRecord> record;
  const absl::Status status = AssembleRecord(src, kAddress, 5, true, record);
  EXPECT_EQ(record, absl::nullopt);
  EXPECT_THAT(GetCorruptRecord(status),
              Optional(CorruptRecord{"orders", 3, 5,
                                     CorruptionKind::kTruncatedLengthPrefix}));
}

TEST(AssembleRecordTest, SourceFailureIsNotCorruption) {
  std::string data;
  AppendFrame("key", data);
  FailingReader src(data, absl::UnavailableError("connection reset"));
  absl::optional<ChunkRecord> record;
  const absl::Status status = AssembleRecord(src, kAddress, 11, true, record);
  EXPECT_EQ(record, absl::nullopt);
  EXPECT_EQ(status.code(), absl::StatusCode::kUnavailable);
  EXPECT_THAT(status.message(), HasSubstr("connection reset"));
  EXPECT_THAT(status.message(), HasSubstr("reading record at orders-3:11"));
  EXPECT_EQ(GetCorruptRecord(status), absl::nullopt);
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
