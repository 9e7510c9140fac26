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


#ifndef CHUNKSTREAM_BYTES_ISTREAM_READER_H_
#define CHUNKSTREAM_BYTES_ISTREAM_READER_H_

#include <stddef.h>

#include <istream>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/dependency.h"
#include "chunkstream/base/object.h"
#include "chunkstream/bytes/buffer_options.h"
#include "chunkstream/bytes/buffered_reader.h"

namespace chunkstream {

class IStreamReaderBase : public BufferedReader {
 public:
  class Options : public BufferOptionsBase<Options> {
   public:
    Options() noexcept {}
  };

  // The stream being read. Still valid after `Close()`.
  virtual std::istream* SrcStream() const = 0;

 protected:
  explicit IStreamReaderBase(Closed) noexcept : BufferedReader(kClosed) {}
  explicit IStreamReaderBase(const Options& options)
      : BufferedReader(options.buffer_options()) {}

  IStreamReaderBase(IStreamReaderBase&& that) noexcept
      : BufferedReader(static_cast<BufferedReader&&>(that)) {}
  IStreamReaderBase& operator=(IStreamReaderBase&& that) noexcept {
    BufferedReader::operator=(static_cast<BufferedReader&&>(that));
    return *this;
  }

  // Fails unless `src` is usable.
  void CheckStream(std::istream& src);

  ABSL_ATTRIBUTE_COLD bool FailOperation(absl::string_view operation);

  bool ReadInternal(size_t min_length, size_t max_length, char* dest) override;
};

// Reads a `std::istream` from its current position to its end.
//
// `Src` is `std::istream*` (borrowed, the default) or a stream held by value
// such as `std::ifstream` (owned). CTAD deduces `Src` from the argument.
//
// Every refill asks the stream for a full buffer, so an interactive stream
// would block. Nobody else may use the stream while the reader does.
template <typename Src = std::istream*>
class IStreamReader : public IStreamReaderBase {
 public:
  explicit IStreamReader(Closed) noexcept : IStreamReaderBase(kClosed) {}

  explicit IStreamReader(Src src, Options options = Options())
      : IStreamReaderBase(options), src_(std::move(src)) {
    CheckStream(*src_.get());
  }

  IStreamReader(IStreamReader&& that) noexcept
      : IStreamReaderBase(static_cast<IStreamReaderBase&&>(that)),
        src_(std::move(that.src_)) {}
  IStreamReader& operator=(IStreamReader&& that) noexcept {
    IStreamReaderBase::operator=(static_cast<IStreamReaderBase&&>(that));
    src_ = std::move(that.src_);
    return *this;
  }

  Src& src() { return src_.manager(); }
  const Src& src() const { return src_.manager(); }
  std::istream* SrcStream() const override { return src_.get(); }

 private:
  Dependency<std::istream*, Src> src_;
};

explicit IStreamReader(Closed) -> IStreamReader<>;
template <typename Src>
explicit IStreamReader(Src src, IStreamReaderBase::Options options =
                                    IStreamReaderBase::Options())
    -> IStreamReader<Src>;

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_ISTREAM_READER_H_
