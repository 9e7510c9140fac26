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

#include "chunkstream/bytes/fd_reader.h"

#include <fcntl.h>
#include <unistd.h>

#include <cstdio>
#include <fstream>
#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "chunkstream/bytes/fd_handle.h"
#include "chunkstream/bytes/istream_reader.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace chunkstream {
namespace tests {
namespace {

using ::testing::HasSubstr;

std::string WriteTempFile(absl::string_view name, absl::string_view contents) {
  const std::string filename = absl::StrCat(::testing::TempDir(), "/", name);
  std::ofstream out(filename, std::ios::binary | std::ios::trunc);
  out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
  out.close();
  EXPECT_TRUE(out.good()) << "Writing " << filename << " failed";
  return filename;
}

TEST(FdReaderTest, ReadsFileByName) {
  const std::string filename = WriteTempFile("fd_reader_by_name", "contents");
  FdReader<> reader(filename);
  ASSERT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ(reader.filename(), filename);
  std::string dest;
  ASSERT_TRUE(reader.Read(8, dest)) << reader.status();
  EXPECT_EQ(dest, "contents");
  EXPECT_TRUE(reader.VerifyEndAndClose()) << reader.status();
}

TEST(FdReaderTest, MissingFileFails) {
  const std::string filename =
      absl::StrCat(::testing::TempDir(), "/fd_reader_missing_file");
  std::remove(filename.c_str());
  FdReader<> reader(filename);
  EXPECT_FALSE(reader.ok());
  EXPECT_EQ(reader.status().code(), absl::StatusCode::kNotFound);
  EXPECT_THAT(reader.status().message(), HasSubstr("open() failed"));
  EXPECT_THAT(reader.status().message(), HasSubstr(filename));
  EXPECT_FALSE(reader.Close());
}

TEST(FdReaderTest, UnownedFdStaysOpen) {
  const std::string filename = WriteTempFile("fd_reader_unowned", "xyz");
  const int fd = open(filename.c_str(), O_RDONLY | O_CLOEXEC);
  ASSERT_GE(fd, 0);
  {
    FdReader<UnownedFd> reader{UnownedFd(fd)};
    EXPECT_EQ(reader.filename(), absl::StrCat("/proc/self/fd/", fd));
    std::string dest;
    ASSERT_TRUE(reader.Read(3, dest)) << reader.status();
    EXPECT_EQ(dest, "xyz");
    EXPECT_TRUE(reader.Close()) << reader.status();
  }
  EXPECT_NE(fcntl(fd, F_GETFD), -1);
  close(fd);
}

TEST(FdReaderTest, OwnedFdIsClosed) {
  const std::string filename = WriteTempFile("fd_reader_owned", "xyz");
  const int fd = open(filename.c_str(), O_RDONLY | O_CLOEXEC);
  ASSERT_GE(fd, 0);
  FdReader<> reader(OwnedFd(fd),
                    FdReaderBase::Options().set_assumed_filename("data"));
  EXPECT_EQ(reader.filename(), "data");
  EXPECT_TRUE(reader.Close()) << reader.status();
  EXPECT_EQ(fcntl(fd, F_GETFD), -1);
}

TEST(IStreamReaderTest, ReadsStreamUntilEnd) {
  const std::string filename = WriteTempFile("istream_reader", "0123456789");
  std::ifstream stream(filename, std::ios::binary);
  IStreamReader<std::istream*> reader(&stream);
  std::string dest;
  ASSERT_TRUE(reader.Read(4, dest)) << reader.status();
  EXPECT_EQ(dest, "0123");
  EXPECT_FALSE(reader.Read(10, dest));
  EXPECT_TRUE(reader.ok()) << reader.status();
  EXPECT_EQ(dest, "456789");
  EXPECT_TRUE(reader.Close());
}

TEST(IStreamReaderTest, OwnedStream) {
  const std::string filename = WriteTempFile("istream_reader_owned", "abc");
  IStreamReader reader(std::ifstream(filename, std::ios::binary));
  std::string dest;
  ASSERT_TRUE(reader.Read(3, dest)) << reader.status();
  EXPECT_EQ(dest, "abc");
  EXPECT_TRUE(reader.VerifyEndAndClose()) << reader.status();
}

TEST(IStreamReaderTest, FailedStreamFails) {
  std::ifstream stream(
      absl::StrCat(::testing::TempDir(), "/istream_reader_missing_file"));
  IStreamReader<std::istream*> reader(&stream);
  EXPECT_FALSE(reader.ok());
  EXPECT_THAT(reader.status().message(), HasSubstr("istream::istream()"));
}

}  // namespace
}  // namespace tests
}  // namespace chunkstream
