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

#include <ostream>
#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/assert.h"
#include "re2/re2.h"

namespace chunkstream {

namespace {

constexpr uint32_t kMaxPartition = 99999;
constexpr uint64_t kMaxStartOffset = 999999999999;

// The topic is lazy so that it stops at the last "-PPPPP-OOOOOOOOOOOO.gz"
// suffix, and it cannot contain '/' so that it starts after the last '/'.
// Names are matched byte by byte, not as UTF-8.
const RE2& ChunkNamePattern() {
  static const RE2* const kPattern = [] {
    RE2::Options options;
    options.set_encoding(RE2::Options::EncodingLatin1);
    options.set_dot_nl(true);
    return new RE2(R"re((?:.*/)?([^/]+?)-(\d{5})-(\d{12})\.gz)re", options);
  }();
  return *kPattern;
}

}  // namespace

std::ostream& operator<<(std::ostream& out, const ChunkAddress& address) {
  return out << address.topic << '-' << address.partition << ':'
             << address.start_offset;
}

absl::StatusOr<ChunkAddress> ParseChunkAddress(absl::string_view identifier) {
  re2::StringPiece topic, partition, start_offset;
  if (ABSL_PREDICT_FALSE(!RE2::FullMatch(
          re2::StringPiece(identifier.data(), identifier.size()),
          ChunkNamePattern(), &topic, &partition, &start_offset))) {
    return absl::InvalidArgumentError(
        absl::StrCat("Not a valid chunk name: ", identifier));
  }
  ChunkAddress address;
  address.topic.assign(topic.data(), topic.size());
  // The fields consist of a fixed number of digits, so they always fit.
  CHUNKSTREAM_CHECK(absl::SimpleAtoi(
      absl::string_view(partition.data(), partition.size()),
      &address.partition))
      << "Unparsable partition in " << identifier;
  CHUNKSTREAM_CHECK(absl::SimpleAtoi(
      absl::string_view(start_offset.data(), start_offset.size()),
      &address.start_offset))
      << "Unparsable start offset in " << identifier;
  return address;
}

absl::StatusOr<uint32_t> ExtractPartition(absl::string_view identifier) {
  absl::StatusOr<ChunkAddress> address = ParseChunkAddress(identifier);
  if (ABSL_PREDICT_FALSE(!address.ok())) return address.status();
  return address->partition;
}

absl::StatusOr<std::string> FormatChunkName(const ChunkAddress& address) {
  if (ABSL_PREDICT_FALSE(address.topic.empty())) {
    return absl::InvalidArgumentError("Empty topic in a chunk name");
  }
  if (ABSL_PREDICT_FALSE(address.topic.find('/') != std::string::npos)) {
    return absl::InvalidArgumentError(
        absl::StrCat("Topic contains '/': ", address.topic));
  }
  if (ABSL_PREDICT_FALSE(address.partition > kMaxPartition)) {
    return absl::OutOfRangeError(absl::StrCat(
        "Partition does not fit in a chunk name: ", address.partition));
  }
  if (ABSL_PREDICT_FALSE(address.start_offset > kMaxStartOffset)) {
    return absl::OutOfRangeError(absl::StrCat(
        "Start offset does not fit in a chunk name: ", address.start_offset));
  }
  return absl::StrFormat("%s-%05u-%012u.gz", address.topic, address.partition,
                         address.start_offset);
}

}  // namespace chunkstream
