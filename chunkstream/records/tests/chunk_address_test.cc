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

#include "chunkstream/records/chunk_address.h"

#include <stdint.h>

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

TEST(ParseChunkAddressTest, PlainName) {
  const absl::StatusOr<ChunkAddress> address =
      ParseChunkAddress("orders-00003-000000001024.gz");
  ASSERT_TRUE(address.ok()) << address.status();
  EXPECT_EQ(address->topic, "orders");
  EXPECT_EQ(address->partition, 3u);
  EXPECT_EQ(address->start_offset, 1024u);
}

TEST(ParseChunkAddressTest, TopicIsLastPathComponent) {
  const absl::StatusOr<ChunkAddress> address =
      ParseChunkAddress("a/b/my-topic-00000-000000000000.gz");
  ASSERT_TRUE(address.ok()) << address.status();
  EXPECT_EQ(*address, (ChunkAddress{"my-topic", 0, 0}));
}

TEST(ParseChunkAddressTest, TopicWithDashesAndDigits) {
  const absl::StatusOr<ChunkAddress> address =
      ParseChunkAddress("bucket/events-12345-2-99999-999999999999.gz");
  ASSERT_TRUE(address.ok()) << address.status();
  EXPECT_EQ(address->topic, "events-12345-2");
  EXPECT_EQ(address->partition, 99999u);
  EXPECT_EQ(address->start_offset, uint64_t{999999999999});
}

TEST(ParseChunkAddressTest, TopicWithArbitraryBytes) {
  const absl::StatusOr<ChunkAddress> latin1 =
      ParseChunkAddress("dir/t\xffx-00001-000000000001.gz");
  ASSERT_TRUE(latin1.ok()) << latin1.status();
  EXPECT_EQ(latin1->topic, "t\xffx");
  EXPECT_EQ(latin1->partition, 1u);

  const absl::StatusOr<ChunkAddress> utf8 =
      ParseChunkAddress("caf\xc3\xa9-00002-000000000003.gz");
  ASSERT_TRUE(utf8.ok()) << utf8.status();
  EXPECT_EQ(utf8->topic, "caf\xc3\xa9");

  const absl::StatusOr<ChunkAddress> newline =
      ParseChunkAddress("a\nb/c\nd-00004-000000000005.gz");
  ASSERT_TRUE(newline.ok()) << newline.status();
  EXPECT_EQ(newline->topic, "c\nd");
}

TEST(ParseChunkAddressTest, RejectsMalformedNames) {
  for (const char* identifier : {
           "",
           "orders-00003-000000001024",          // No extension.
           "orders-00003-000000001024.gz.tmp",   // Suffix not at the end.
           "orders-3-000000001024.gz",           // Short partition.
           "orders-000003-000000001024.gz",      // Long partition.
           "orders-00003-1024.gz",               // Short offset.
           "orders-00003-0000000001024.gz",      // Long offset.
           "-00003-000000001024.gz",             // Empty topic.
           "dir/-00003-000000001024.gz",         // Empty topic after path.
           "orders-0000a-000000001024.gz",       // Non-digit.
           "orders_00003_000000001024.gz",       // Wrong separators.
           "orders-00003-000000001024.gzip",     // Wrong extension.
           "orders-00003-000000001024.gz/",      // Trailing slash.
           "prefix orders-00003-000000001024.gz suffix",
       }) {
    const absl::StatusOr<ChunkAddress> address = ParseChunkAddress(identifier);
    EXPECT_FALSE(address.ok()) << identifier;
    EXPECT_EQ(address.status().code(), absl::StatusCode::kInvalidArgument)
        << identifier;
    EXPECT_THAT(std::string(address.status().message()),
                StartsWith("Not a valid chunk name: "))
        << identifier;
  }
}

TEST(ExtractPartitionTest, ReturnsPartition) {
  const absl::StatusOr<uint32_t> partition =
      ExtractPartition("x/orders-00042-000000000007.gz");
  ASSERT_TRUE(partition.ok()) << partition.status();
  EXPECT_EQ(*partition, 42u);
}

TEST(ExtractPartitionTest, RejectsMalformedName) {
  const absl::StatusOr<uint32_t> partition = ExtractPartition("orders.gz");
  EXPECT_EQ(partition.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(partition.status().message(), HasSubstr("orders.gz"));
}

TEST(FormatChunkNameTest, ZeroPadsFields) {
  const absl::StatusOr<std::string> name =
      FormatChunkName(ChunkAddress{"orders", 3, 1024});
  ASSERT_TRUE(name.ok()) << name.status();
  EXPECT_EQ(*name, "orders-00003-000000001024.gz");
}

TEST(FormatChunkNameTest, AcceptedByParser) {
  const ChunkAddress address{"clicks-v2", 12, 987654321};
  const absl::StatusOr<std::string> name = FormatChunkName(address);
  ASSERT_TRUE(name.ok()) << name.status();
  const absl::StatusOr<ChunkAddress> parsed = ParseChunkAddress(*name);
  ASSERT_TRUE(parsed.ok()) << parsed.status();
  EXPECT_EQ(*parsed, address);
}

TEST(FormatChunkNameTest, RejectsUnrepresentableAddresses) {
  EXPECT_EQ(FormatChunkName(ChunkAddress{"t", 100000, 0}).status().code(),
            absl::StatusCode::kOutOfRange);
  EXPECT_EQ(
      FormatChunkName(ChunkAddress{"t", 0, 1000000000000}).status().code(),
      absl::StatusCode::kOutOfRange);
  EXPECT_EQ(FormatChunkName(ChunkAddress{"", 0, 0}).status().code(),
            absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(FormatChunkName(ChunkAddress{"a/b", 0, 0}).status().code(),
            absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
