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

#include "chunkstream/bytes/string_reader.h"

#include <stddef.h>

#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/bytes/tests/test_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;

TEST(StringReaderTest, ReadsWholeSource) {
  StringReader<> reader("abcdef");
  std::string dest;
  ASSERT_TRUE(reader.Read(4, dest));
  EXPECT_EQ(dest, "abcd");
  EXPECT_EQ(reader.pos(), 4u);
  ASSERT_TRUE(reader.Read(2, dest));
  EXPECT_EQ(dest, "ef");
  EXPECT_FALSE(reader.Pull());
  EXPECT_TRUE(reader.ok());
  EXPECT_TRUE(reader.VerifyEndAndClose());
}

TEST(StringReaderTest, ShortReadAtEnd) {
  StringReader<> reader("abc");
  std::string dest;
  size_t length_read;
  EXPECT_FALSE(reader.Read(5, dest, &length_read));
  EXPECT_TRUE(reader.ok());
  EXPECT_EQ(dest, "abc");
  EXPECT_EQ(length_read, 3u);
}

TEST(StringReaderTest, OwnedStringSurvivesMove) {
  StringReader<std::string> reader(std::string("0123456789"));
  std::string dest;
  ASSERT_TRUE(reader.Read(1, dest));
  EXPECT_EQ(dest, "0");
  StringReader<std::string> moved = std::move(reader);
  EXPECT_FALSE(reader.is_open());
  EXPECT_EQ(moved.pos(), 1u);
  ASSERT_TRUE(moved.Read(9, dest));
  EXPECT_EQ(dest, "123456789");
}

TEST(StringReaderTest, VerifyEndFailsBeforeEnd) {
  StringReader<> reader("ab");
  EXPECT_FALSE(reader.VerifyEndAndClose());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(reader.status().message(), HasSubstr("End of data expected"));
}

TEST(StringReaderTest, ClosedReaderReportsClosed) {
  StringReader<> reader("ab");
  ASSERT_TRUE(reader.Close());
  EXPECT_FALSE(reader.Pull());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kFailedPrecondition);
}

TEST(SlowStringReaderTest, ReadsAcrossPulls) {
  SlowStringReader reader(std::string("hello world"));
  std::string dest;
  ASSERT_TRUE(reader.Read(5, dest));
  EXPECT_EQ(dest, "hello");
  ASSERT_TRUE(reader.Pull(3));
  EXPECT_EQ(absl::string_view(reader.cursor(), 3), " wo");
  ASSERT_TRUE(reader.Read(6, dest));
  EXPECT_EQ(dest, " world");
  EXPECT_FALSE(reader.Pull());
  EXPECT_TRUE(reader.ok());
}

TEST(FailingReaderTest, FailureIsAnnotatedWithPosition) {
  FailingReader reader("abc", absl::UnavailableError("connection reset"));
  std::string dest;
  EXPECT_FALSE(reader.Read(10, dest));
  EXPECT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnavailable);
  EXPECT_THAT(reader.status().message(), HasSubstr("connection reset"));
  EXPECT_THAT(reader.status().message(), HasSubstr("at byte"));
  EXPECT_EQ(dest, "abc");
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
