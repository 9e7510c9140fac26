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

#ifndef CHUNKSTREAM_ZLIB_TESTS_TEST_UTILS_H_
#define CHUNKSTREAM_ZLIB_TESTS_TEST_UTILS_H_

#include <string>

#include "absl/strings/string_view.h"
#include "gtest/gtest.h"
#include "zlib.h"

namespace chunkstream {
namespace tests {

// Compresses `src` as a single gzip member.
inline std::string GzipCompress(absl::string_view src) {
  z_stream stream{};
  // 16 added to the window log selects the gzip header.
  EXPECT_EQ(deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                         MAX_WBITS + 16, 8, Z_DEFAULT_STRATEGY),
            Z_OK);
  std::string dest(deflateBound(&stream, static_cast<uLong>(src.size())), '\0');
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(src.data()));
  stream.avail_in = static_cast<uInt>(src.size());
  stream.next_out = reinterpret_cast<Bytef*>(&dest[0]);
  stream.avail_out = static_cast<uInt>(dest.size());
  EXPECT_EQ(deflate(&stream, Z_FINISH), Z_STREAM_END);
  dest.resize(stream.total_out);
  EXPECT_EQ(deflateEnd(&stream), Z_OK);
  return dest;
}

}  // namespace tests
}  // namespace chunkstream

#endif  // CHUNKSTREAM_ZLIB_TESTS_TEST_UTILS_H_
