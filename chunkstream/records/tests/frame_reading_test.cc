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

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "chunkstream/bytes/string_reader.h"
#include "chunkstream/bytes/tests/test_utils.h"
#include "chunkstream/records/frame_writing.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;

TEST(ReadFrameTest, ReadsConsecutiveFrames) {
  std::string data;
  AppendFrame("foo", data);
  AppendFrame("", data);
  AppendFrame("bar baz", data);
  StringReader<> src(data);
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, "foo");
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, "");
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, "bar baz");
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kEnd);
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kEnd);
  EXPECT_TRUE(src.ok());
}

TEST(ReadFrameTest, LengthPrefixIsBigEndian) {
  const std::string data("\x00\x00\x01\x02", 4);
  const std::string payload(0x102, 'x');
  StringReader<std::string> src(data + payload);
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, payload);
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kEnd);
}

TEST(ReadFrameTest, EmptySourceEndsCleanly) {
  StringReader<> src("");
  std::string frame;
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kEnd);
  EXPECT_TRUE(src.ok());
}

TEST(ReadFrameTest, TruncatedLengthPrefix) {
  for (absl::string_view data : {absl::string_view("\x00", 1),
                                 absl::string_view("\x00\x00", 2),
                                 absl::string_view("\x00\x00\x00", 3)}) {
    StringReader<> src(data);
    std::string frame;
    EXPECT_EQ(ReadFrame(src, frame), FrameResult::kTruncatedLengthPrefix)
        << data.size();
    EXPECT_TRUE(src.ok());
  }
}

TEST(ReadFrameTest, LengthPrefixWithoutPayload) {
  std::string data;
  AppendFrame("complete", data);
  data.append("\x00\x00\x00\x04", 4);
  StringReader<> src(data);
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kTruncatedLengthPrefix);
  EXPECT_TRUE(src.ok());
}

TEST(ReadFrameTest, TruncatedPayload) {
  std::string data;
  AppendFrame("complete", data);
  data.append("\x00\x00\x00\x0a" "short", 9);
  StringReader<> src(data);
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kTruncatedPayload);
  EXPECT_TRUE(src.ok());
}

TEST(ReadFrameTest, ReadsAcrossPulls) {
  std::string data;
  AppendFrame("first", data);
  AppendFrame(std::string(100, 'y'), data);
  SlowStringReader src(data);
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, "first");
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, std::string(100, 'y'));
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kEnd);
}

TEST(ReadFrameTest, SourceFailureInLengthPrefix) {
  FailingReader src(std::string("\x00\x00", 2),
                    absl::UnavailableError("connection reset"));
  std::string frame;
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kSourceFailed);
  EXPECT_EQ(src.status().code(), absl::StatusCode::kUnavailable);
}

TEST(ReadFrameTest, SourceFailureInPayload) {
  FailingReader src(std::string("\x00\x00\x00\x05" "ab", 6),
                    absl::UnavailableError("connection reset"));
  std::string frame;
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kSourceFailed);
  EXPECT_EQ(src.status().code(), absl::StatusCode::kUnavailable);
  EXPECT_THAT(src.status().message(), HasSubstr("connection reset"));
}

TEST(ReadFrameTest, SourceFailureAtFrameBoundary) {
  std::string data;
  AppendFrame("ok", data);
  FailingReader src(data, absl::UnavailableError("connection reset"));
  std::string frame;
  ASSERT_EQ(ReadFrame(src, frame), FrameResult::kFrame);
  EXPECT_EQ(frame, "ok");
  EXPECT_EQ(ReadFrame(src, frame), FrameResult::kSourceFailed);
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
