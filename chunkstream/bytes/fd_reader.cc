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

#include <errno.h>
#include <fcntl.h>
#include <stddef.h>
#include <sys/types.h>
#include <unistd.h>

#include <limits>
#include <string>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/status.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/buffered_reader.h"

namespace chunkstream {

namespace {

// `read()` cannot go past the largest `off_t`.
constexpr Position kMaxFdPosition = Position{std::numeric_limits<off_t>::max()};

}  // namespace

void FdReaderBase::NameSuppliedFd(int src, const Options& options) {
  CHUNKSTREAM_ASSERT_GE(src, 0) << "FdReader given a negative fd";
  if (options.assumed_filename() != absl::nullopt) {
    filename_ = *options.assumed_filename();
    return;
  }
  filename_ = src == 0 ? std::string("/dev/stdin")
                       : absl::StrCat("/proc/self/fd/", src);
}

int FdReaderBase::OpenFile(absl::string_view filename,
                           const Options& options) {
  filename_ = std::string(filename);
  int fd;
  do {
    fd = open(filename_.c_str(), O_RDONLY | O_CLOEXEC);
  } while (fd < 0 && errno == EINTR);
  if (ABSL_PREDICT_FALSE(fd < 0)) {
    FailOperation("open()");
    return -1;
  }
  if (options.assumed_filename() != absl::nullopt) {
    filename_ = *options.assumed_filename();
  }
  return fd;
}

bool FdReaderBase::FailOperation(absl::string_view operation) {
  const int error_number = errno;
  return Fail(
      absl::ErrnoToStatus(error_number, absl::StrCat(operation, " failed")));
}

absl::Status FdReaderBase::AnnotateStatusImpl(absl::Status status) {
  return BufferedReader::AnnotateStatusImpl(
      Annotate(status, absl::StrCat("reading ", filename_)));
}

bool FdReaderBase::ReadInternal(size_t min_length, size_t max_length,
                                char* dest) {
  size_t total = 0;
  while (total < min_length) {
    if (ABSL_PREDICT_FALSE(limit_pos() >= kMaxFdPosition)) {
      return FailOverflow();
    }
    const size_t request =
        UnsignedMin(max_length - total, kMaxFdPosition - limit_pos());
    const ssize_t result = read(SrcFd(), dest + total, request);
    if (ABSL_PREDICT_FALSE(result < 0)) {
      if (errno == EINTR) continue;
      return FailOperation("read()");
    }
    // Zero means the file ends here.
    if (result == 0) return false;
    move_limit_pos(IntCast<size_t>(result));
    total += IntCast<size_t>(result);
  }
  return true;
}

}  // namespace chunkstream
