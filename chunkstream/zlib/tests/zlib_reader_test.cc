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

#include "chunkstream/zlib/zlib_reader.h"

#include <stddef.h>

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "chunkstream/bytes/string_reader.h"
#include "chunkstream/bytes/tests/test_utils.h"
#include "chunkstream/zlib/tests/test_utils.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;

ZlibReaderBase::Options GzipOptions() {
  return ZlibReaderBase::Options().set_header(ZlibReaderBase::Header::kGzip);
}

std::string SampleText() {
  std::string text;
  for (int i = 0; i < 1000; ++i) absl::StrAppend(&text, "line ", i, "\n");
  return text;
}

TEST(ZlibReaderTest, DecompressesGzip) {
  const std::string text = SampleText();
  const std::string compressed = GzipCompress(text);
  ZlibReader reader(StringReader<std::string>(compressed), GzipOptions());
  std::string dest;
  ASSERT_TRUE(reader.Read(text.size(), dest)) << reader.status();
  EXPECT_EQ(dest, text);
  EXPECT_FALSE(reader.Pull());
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_TRUE(reader.VerifyEndAndClose()) << reader.status();
}

TEST(ZlibReaderTest, DetectsGzipHeader) {
  const std::string text = SampleText();
  const std::string compressed = GzipCompress(text);
  StringReader<> src(compressed);
  ZlibReader<> reader(&src);
  std::string dest;
  ASSERT_TRUE(reader.Read(text.size(), dest)) << reader.status();
  EXPECT_EQ(dest, text);
  EXPECT_TRUE(reader.Close()) << reader.status();
  // A borrowed source is not closed.
  EXPECT_TRUE(src.is_open());
}

TEST(ZlibReaderTest, ReadsThroughSlowSource) {
  const std::string text = SampleText();
  ZlibReader reader(SlowStringReader(GzipCompress(text)), GzipOptions());
  std::string dest;
  ASSERT_TRUE(reader.Read(text.size(), dest)) << reader.status();
  EXPECT_EQ(dest, text);
  EXPECT_TRUE(reader.VerifyEndAndClose()) << reader.status();
}

TEST(ZlibReaderTest, SmallOutputBuffer) {
  const std::string text = SampleText();
  ZlibReader reader(StringReader<std::string>(GzipCompress(text)),
                    GzipOptions().set_buffer_size(7));
  std::string dest;
  ASSERT_TRUE(reader.Read(text.size(), dest)) << reader.status();
  EXPECT_EQ(dest, text);
  EXPECT_TRUE(reader.VerifyEndAndClose()) << reader.status();
}

TEST(ZlibReaderTest, ConcatenatedMembers) {
  const std::string compressed =
      absl::StrCat(GzipCompress("first;"), GzipCompress("second"));
  ZlibReader reader(StringReader<std::string>(compressed),
                    GzipOptions().set_concatenate(true));
  std::string dest;
  EXPECT_FALSE(reader.Read(100, dest));
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ(dest, "first;second");
}

TEST(ZlibReaderTest, ZeroPaddingAfterLastMember) {
  const std::string compressed =
      absl::StrCat(GzipCompress("first;"), GzipCompress("second"),
                   std::string(8, '\0'));
  ZlibReader reader(StringReader<std::string>(compressed),
                    GzipOptions().set_concatenate(true));
  std::string dest;
  EXPECT_FALSE(reader.Read(100, dest));
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ(dest, "first;second");
  EXPECT_FALSE(reader.Pull());
  EXPECT_TRUE(reader.Close()) << reader.status();
}

TEST(ZlibReaderTest, CutHeaderAfterLastMember) {
  const std::string second = GzipCompress("second");
  const std::string compressed =
      absl::StrCat(GzipCompress("first"), second.substr(0, 3));
  ZlibReader reader(StringReader<std::string>(compressed),
                    GzipOptions().set_concatenate(true));
  std::string dest;
  EXPECT_FALSE(reader.Read(100, dest));
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ(dest, "first");
}

TEST(ZlibReaderTest, PaddingAfterSingleStreamFailsVerifyEnd) {
  const std::string compressed =
      absl::StrCat(GzipCompress("only"), std::string(8, '\0'));
  ZlibReader reader(StringReader<std::string>(compressed), GzipOptions());
  std::string dest;
  EXPECT_FALSE(reader.Read(100, dest));
  EXPECT_EQ(dest, "only");
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_FALSE(reader.VerifyEndAndClose());
}

TEST(ZlibReaderTest, TruncatedStreamFails) {
  const std::string text = SampleText();
  const std::string compressed = GzipCompress(text);
  ZlibReader reader(
      StringReader<std::string>(compressed.substr(0, compressed.size() / 2)),
      GzipOptions());
  std::string dest;
  EXPECT_FALSE(reader.Read(text.size(), dest));
  EXPECT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(reader.status().message(),
              HasSubstr("Truncated Zlib-compressed stream"));
  // Data decompressed before the truncation were returned.
  EXPECT_GT(dest.size(), 0u);
  EXPECT_LT(dest.size(), text.size());
  EXPECT_FALSE(reader.Close());
}

TEST(ZlibReaderTest, TruncatedStreamFailsWhenConcatenating) {
  const std::string compressed = GzipCompress(SampleText());
  ZlibReader reader(
      StringReader<std::string>(compressed.substr(0, compressed.size() - 3)),
      GzipOptions().set_concatenate(true));
  std::string dest;
  EXPECT_FALSE(reader.Read(1 << 20, dest));
  EXPECT_FALSE(reader.ok());
  EXPECT_THAT(reader.status().message(),
              HasSubstr("Truncated Zlib-compressed stream"));
}

TEST(ZlibReaderTest, CorruptDataFails) {
  std::string compressed = GzipCompress(SampleText());
  // Damage the deflate data after the 10-byte gzip header.
  for (size_t i = 10; i < 30; ++i) compressed[i] = '\xff';
  ZlibReader reader(StringReader<std::string>(compressed), GzipOptions());
  std::string dest;
  EXPECT_FALSE(reader.Read(1 << 20, dest));
  EXPECT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kInvalidArgument);
  EXPECT_THAT(reader.status().message(), HasSubstr("inflate() failed"));
}

TEST(ZlibReaderTest, FailingSourcePropagates) {
  const std::string compressed = GzipCompress(SampleText());
  ZlibReader reader(FailingReader(compressed.substr(0, 20),
                                  absl::UnavailableError("connection reset")),
                    GzipOptions());
  std::string dest;
  EXPECT_FALSE(reader.Read(1 << 20, dest));
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kUnavailable);
  EXPECT_THAT(reader.status().message(), HasSubstr("connection reset"));
  EXPECT_THAT(reader.status().message(), HasSubstr("at uncompressed byte"));
}

TEST(ZlibReaderTest, NotCompressedFails) {
  ZlibReader reader(StringReader<std::string>("plain text, not compressed"),
                    GzipOptions());
  std::string dest;
  EXPECT_FALSE(reader.Read(10, dest));
  EXPECT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kInvalidArgument);
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
