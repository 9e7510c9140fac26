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


#include "chunkstream/bytes/reader.h"

#include <stddef.h>

#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/status.h"
#include "chunkstream/base/types.h"

namespace chunkstream {

void Reader::Done() {
  limit_pos_ = pos();
  set_buffer();
}

absl::Status Reader::AnnotateStatusImpl(absl::Status status) {
  if (!is_open()) return status;
  return Annotate(status, absl::StrCat("at byte ", pos()));
}

bool Reader::FailOverflow() {
  return Fail(absl::ResourceExhaustedError("Reader position overflow"));
}

void Reader::VerifyEndImpl() {
  if (ABSL_PREDICT_TRUE(!Pull())) return;
  Fail(absl::InvalidArgumentError("End of data expected"));
}

bool Reader::Read(size_t length, std::string& dest, size_t* length_read) {
  const Position start = pos();
  bool read_ok;
  if (ABSL_PREDICT_TRUE(length <= available())) {
    // An empty window may have a null `cursor()`.
    if (length == 0) {
      dest.clear();
    } else {
      dest.assign(cursor(), length);
      move_cursor(length);
    }
    read_ok = true;
  } else {
    dest.clear();
    read_ok = ReadSlow(length, dest);
  }
  if (length_read != nullptr) *length_read = IntCast<size_t>(pos() - start);
  return read_ok;
}

bool Reader::ReadSlow(size_t length, std::string& dest) {
  CHUNKSTREAM_CHECK_LE(length, dest.max_size())
      << "Reader::Read() into a string: length too large";
  for (;;) {
    const size_t chunk = UnsignedMin(length, available());
    if (chunk > 0) {
      dest.append(cursor(), chunk);
      move_cursor(chunk);
      length -= chunk;
    }
    if (length == 0) return true;
    if (ABSL_PREDICT_FALSE(!PullSlow(1))) return false;
  }
}

}  // namespace chunkstream
