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

#include "chunkstream/bytes/fd_handle.h"

#include <errno.h>
#include <unistd.h>

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace chunkstream {

OwnedFd& OwnedFd::operator=(OwnedFd&& that) noexcept {
  // A failure of closing the previous fd cannot be reported here.
  Close().IgnoreError();
  fd_ = that.Release();
  return *this;
}

OwnedFd::~OwnedFd() { Close().IgnoreError(); }

absl::Status OwnedFd::Close() {
  const int fd = Release();
  if (fd < 0) return absl::OkStatus();
  // After `close()` fails with `EINTR` the fd is closed anyway on Linux, so it
  // must not be retried.
  if (ABSL_PREDICT_FALSE(close(fd) < 0) && errno != EINTR) {
    return absl::ErrnoToStatus(errno, "close() failed");
  }
  return absl::OkStatus();
}

}  // namespace chunkstream
