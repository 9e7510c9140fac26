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


#include "chunkstream/bytes/istream_reader.h"

#include <stddef.h>

#include <cerrno>
#include <ios>
#include <istream>
#include <limits>
#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/buffered_reader.h"

namespace chunkstream {

void IStreamReaderBase::CheckStream(std::istream& src) {
  // A stream that could not be opened arrives with `failbit` set.
  if (ABSL_PREDICT_FALSE(src.fail())) {
    FailOperation("istream::istream()");
    return;
  }
  src.clear(src.rdstate() & ~std::ios_base::eofbit);
}

bool IStreamReaderBase::FailOperation(absl::string_view operation) {
  // Streams keep the cause to themselves. `errno` is the best guess.
  const int error_number = errno;
  std::string message = absl::StrCat(operation, " failed");
  if (error_number == 0) return Fail(absl::UnknownError(message));
  return Fail(absl::ErrnoToStatus(error_number, message));
}

bool IStreamReaderBase::ReadInternal(size_t min_length, size_t max_length,
                                     char* dest) {
  constexpr Position kMaxStreamPosition =
      Position{std::numeric_limits<std::streamoff>::max()};
  if (ABSL_PREDICT_FALSE(limit_pos() >= kMaxStreamPosition)) {
    return FailOverflow();
  }
  std::istream& src = *SrcStream();
  const size_t request = UnsignedMin(
      max_length, kMaxStreamPosition - limit_pos(),
      IntCast<size_t>(std::numeric_limits<std::streamsize>::max()));
  errno = 0;
  src.read(dest, IntCast<std::streamsize>(request));
  const size_t received = IntCast<size_t>(src.gcount());
  move_limit_pos(received);
  if (ABSL_PREDICT_TRUE(!src.fail())) return received >= min_length;
  if (ABSL_PREDICT_FALSE(src.bad())) return FailOperation("istream::read()");
  // A short read met the end of the stream.
  src.clear(src.rdstate() & ~(std::ios_base::eofbit | std::ios_base::failbit));
  set_exact_size(limit_pos());
  return received >= min_length;
}

}  // namespace chunkstream
