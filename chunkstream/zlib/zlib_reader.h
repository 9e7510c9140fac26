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


#ifndef CHUNKSTREAM_ZLIB_ZLIB_READER_H_
#define CHUNKSTREAM_ZLIB_ZLIB_READER_H_

#include <stddef.h>

#include <memory>
#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/dependency.h"
#include "chunkstream/base/object.h"
#include "chunkstream/bytes/buffer_options.h"
#include "chunkstream/bytes/buffered_reader.h"
#include "chunkstream/bytes/reader.h"
#include "zlib.h"

namespace chunkstream {

class ZlibReaderBase : public BufferedReader {
 public:
  // Framing around the deflate data.
  enum class Header {
    kZlib,
    kGzip,
    // Either of the above, recognized by its first bytes.
    kZlibOrGzip,
    // Bare deflate data.
    kRaw,
  };

  class Options : public BufferOptionsBase<Options> {
   public:
    Options() noexcept {}

    // Default: `Header::kZlibOrGzip`
    Options& set_header(Header header) & {
      header_ = header;
      return *this;
    }
    Options&& set_header(Header header) && {
      return std::move(set_header(header));
    }
    Header header() const { return header_; }

    // With `true`, compressed streams following each other (gzip members)
    // decompress to one sequence, and a source holding no stream at all
    // decompresses to nothing. Bytes after a completed stream which do not
    // start another one (zero padding, a cut header) end the sequence
    // cleanly. With `false`, decompression stops at the end of the first
    // stream.
    //
    // Default: `false`
    Options& set_concatenate(bool concatenate) & {
      concatenate_ = concatenate;
      return *this;
    }
    Options&& set_concatenate(bool concatenate) && {
      return std::move(set_concatenate(concatenate));
    }
    bool concatenate() const { return concatenate_; }

   private:
    Header header_ = Header::kZlibOrGzip;
    bool concatenate_ = false;
  };

  // The compressed `Reader`. Still valid after `Close()`.
  virtual Reader* SrcReader() const = 0;

 protected:
  explicit ZlibReaderBase(Closed) noexcept : BufferedReader(kClosed) {}
  explicit ZlibReaderBase(const Options& options)
      : BufferedReader(options.buffer_options()),
        header_(options.header()),
        concatenate_(options.concatenate()) {}

  ZlibReaderBase(ZlibReaderBase&& that) noexcept;
  ZlibReaderBase& operator=(ZlibReaderBase&& that) noexcept;

  // Fails if `src` already failed, else sets up `inflate()`.
  void StartInflating(Reader& src);

  // Adds "at uncompressed byte N" to a status produced by `SrcReader()`.
  ABSL_ATTRIBUTE_COLD absl::Status AnnotateWithUncompressedPos(
      absl::Status status);

  void Done() override;
  ABSL_ATTRIBUTE_COLD absl::Status AnnotateStatusImpl(
      absl::Status status) override;
  bool ReadInternal(size_t min_length, size_t max_length, char* dest) override;

 private:
  struct InflateEnder {
    void operator()(z_stream* stream) const;
  };

  ABSL_ATTRIBUTE_COLD bool FailZlib(absl::string_view operation, int zlib_code);
  // Called when `SrcReader()` has nothing more to offer mid-stream.
  bool SrcEnded(Reader& src);

  Header header_ = Header::kZlibOrGzip;
  bool concatenate_ = false;
  // Whether the current compressed stream has consumed any input. When
  // concatenating, the source may end only between streams.
  bool stream_started_ = false;
  // Whether a stream ended and the current one has not produced output yet.
  bool after_stream_ = false;
  // Reset once a single stream ends without `concatenate_`.
  std::unique_ptr<z_stream, InflateEnder> inflater_;
};

// Decompresses what another `Reader` delivers. Gzip chunk files are read
// through a `ZlibReader<FdReader<>>`.
//
// A compressed stream cut short fails with `absl::InvalidArgumentError()` as
// soon as decompression runs into the cut.
//
// `Src` holds the compressed `Reader`: `Reader*` (borrowed, the default),
// `std::unique_ptr<Reader>` or a reader held by value (both owned, and closed
// by `Close()`). CTAD deduces `Src` from the argument. Nobody else may use
// the compressed `Reader` while this one does.
template <typename Src = Reader*>
class ZlibReader : public ZlibReaderBase {
 public:
  explicit ZlibReader(Closed) noexcept : ZlibReaderBase(kClosed) {}

  explicit ZlibReader(Src src, Options options = Options())
      : ZlibReaderBase(options), src_(std::move(src)) {
    StartInflating(*src_.get());
  }

  ZlibReader(ZlibReader&& that) noexcept
      : ZlibReaderBase(static_cast<ZlibReaderBase&&>(that)),
        src_(std::move(that.src_)) {}
  ZlibReader& operator=(ZlibReader&& that) noexcept {
    ZlibReaderBase::operator=(static_cast<ZlibReaderBase&&>(that));
    src_ = std::move(that.src_);
    return *this;
  }

  Src& src() { return src_.manager(); }
  const Src& src() const { return src_.manager(); }
  Reader* SrcReader() const override { return src_.get(); }

 protected:
  void Done() override;
  void VerifyEndImpl() override;

 private:
  Dependency<Reader*, Src> src_;
};

explicit ZlibReader(Closed) -> ZlibReader<>;
template <typename Src>
explicit ZlibReader(Src src,
                    ZlibReaderBase::Options options = ZlibReaderBase::Options())
    -> ZlibReader<Src>;

// Implementation details follow.

inline ZlibReaderBase::ZlibReaderBase(ZlibReaderBase&& that) noexcept
    : BufferedReader(static_cast<BufferedReader&&>(that)),
      header_(that.header_),
      concatenate_(that.concatenate_),
      stream_started_(that.stream_started_),
      after_stream_(that.after_stream_),
      inflater_(std::move(that.inflater_)) {}

inline ZlibReaderBase& ZlibReaderBase::operator=(
    ZlibReaderBase&& that) noexcept {
  BufferedReader::operator=(static_cast<BufferedReader&&>(that));
  header_ = that.header_;
  concatenate_ = that.concatenate_;
  stream_started_ = that.stream_started_;
  after_stream_ = that.after_stream_;
  inflater_ = std::move(that.inflater_);
  return *this;
}

template <typename Src>
void ZlibReader<Src>::Done() {
  ZlibReaderBase::Done();
  if (!src_.IsOwning()) return;
  if (ABSL_PREDICT_FALSE(!src_->Close())) {
    FailWithoutAnnotation(AnnotateWithUncompressedPos(src_->status()));
  }
}

template <typename Src>
void ZlibReader<Src>::VerifyEndImpl() {
  ZlibReaderBase::VerifyEndImpl();
  if (!src_.IsOwning() || ABSL_PREDICT_FALSE(!ok())) return;
  // Bytes after the compressed data are an error too.
  src_->VerifyEnd();
  if (ABSL_PREDICT_FALSE(!src_->ok())) {
    FailWithoutAnnotation(AnnotateWithUncompressedPos(src_->status()));
  }
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_ZLIB_ZLIB_READER_H_
