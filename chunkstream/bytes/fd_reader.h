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


#ifndef CHUNKSTREAM_BYTES_FD_READER_H_
#define CHUNKSTREAM_BYTES_FD_READER_H_

#include <stddef.h>

#include <string>
#include <type_traits>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/base/dependency.h"
#include "chunkstream/base/object.h"
#include "chunkstream/bytes/buffer_options.h"
#include "chunkstream/bytes/buffered_reader.h"
#include "chunkstream/bytes/fd_handle.h"

namespace chunkstream {

class FdReaderBase : public BufferedReader {
 public:
  class Options : public BufferOptionsBase<Options> {
   public:
    Options() noexcept {}

    // Name used in failure messages and returned by `filename()`, in place
    // of the opened path or the one derived from the fd.
    //
    // Default: `absl::nullopt`
    Options& set_assumed_filename(
        absl::optional<std::string> assumed_filename) & {
      assumed_filename_ = std::move(assumed_filename);
      return *this;
    }
    Options&& set_assumed_filename(
        absl::optional<std::string> assumed_filename) && {
      return std::move(set_assumed_filename(std::move(assumed_filename)));
    }
    const absl::optional<std::string>& assumed_filename() const {
      return assumed_filename_;
    }

   private:
    absl::optional<std::string> assumed_filename_;
  };

  // The fd being read. An owned fd becomes -1 after `Close()`.
  virtual int SrcFd() const = 0;

  // The opened path, the assumed filename, or "/proc/self/fd/<fd>" for an fd
  // supplied by the caller ("/dev/stdin" for fd 0).
  const std::string& filename() const { return filename_; }

 protected:
  explicit FdReaderBase(Closed) noexcept : BufferedReader(kClosed) {}
  explicit FdReaderBase(const Options& options)
      : BufferedReader(options.buffer_options()) {}

  FdReaderBase(FdReaderBase&& that) noexcept
      : BufferedReader(static_cast<BufferedReader&&>(that)),
        filename_(std::move(that.filename_)) {}
  FdReaderBase& operator=(FdReaderBase&& that) noexcept {
    BufferedReader::operator=(static_cast<BufferedReader&&>(that));
    filename_ = std::move(that.filename_);
    return *this;
  }

  void NameSuppliedFd(int src, const Options& options);

  // Opens `filename` read-only. Returns the fd, or -1 after failing.
  int OpenFile(absl::string_view filename, const Options& options);

  // Fails with the status for `errno`, as "<operation> failed".
  ABSL_ATTRIBUTE_COLD bool FailOperation(absl::string_view operation);
  ABSL_ATTRIBUTE_COLD absl::Status AnnotateStatusImpl(
      absl::Status status) override;
  bool ReadInternal(size_t min_length, size_t max_length, char* dest) override;

 private:
  std::string filename_;
};

// Reads from a file descriptor, starting at its current offset.
//
// `Src` is `OwnedFd` (the default; closed by `Close()`) or `UnownedFd`
// (left open). A borrowed fd must stay open while the reader is used.
template <typename Src = OwnedFd>
class FdReader : public FdReaderBase {
 public:
  explicit FdReader(Closed) noexcept : FdReaderBase(kClosed) {}

  explicit FdReader(Src src, Options options = Options())
      : FdReaderBase(options), src_(std::move(src)) {
    NameSuppliedFd(src_.get(), options);
  }

  // Opens `filename`. Only for an owned fd.
  template <typename DependentSrc = Src,
            std::enable_if_t<std::is_same<DependentSrc, OwnedFd>::value,
                             int> = 0>
  explicit FdReader(absl::string_view filename, Options options = Options())
      : FdReaderBase(options) {
    const int fd = OpenFile(filename, options);
    if (ABSL_PREDICT_TRUE(fd >= 0)) src_.Reset(OwnedFd(fd));
  }

  FdReader(FdReader&& that) noexcept
      : FdReaderBase(static_cast<FdReaderBase&&>(that)),
        src_(std::move(that.src_)) {}
  FdReader& operator=(FdReader&& that) noexcept {
    FdReaderBase::operator=(static_cast<FdReaderBase&&>(that));
    src_ = std::move(that.src_);
    return *this;
  }

  Src& src() { return src_.manager(); }
  const Src& src() const { return src_.manager(); }
  int SrcFd() const override { return src_.get(); }

 protected:
  void Done() override;

 private:
  Dependency<int, Src> src_;
};

explicit FdReader(Closed) -> FdReader<>;

// Implementation details follow.

template <typename Src>
void FdReader<Src>::Done() {
  FdReaderBase::Done();
  if constexpr (Dependency<int, Src>::kIsOwning) {
    if (!src_.IsOwning()) return;
    absl::Status status = src_.manager().Close();
    if (ABSL_PREDICT_FALSE(!status.ok())) Fail(std::move(status));
  }
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_FD_READER_H_
