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


#include "chunkstream/zlib/zlib_reader.h"

#include <stddef.h>

#include <limits>
#include <memory>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/arithmetic.h"
#include "chunkstream/base/assert.h"
#include "chunkstream/base/status.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/buffered_reader.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/zlib/zlib_error.h"
#include "zconf.h"
#include "zlib.h"

namespace chunkstream {

namespace {

// `windowBits` for `inflateInit2()`: the largest window, plus the header
// selector zlib encodes in the same argument.
int WindowBits(ZlibReaderBase::Header header) {
  switch (header) {
    case ZlibReaderBase::Header::kZlib:
      return MAX_WBITS;
    case ZlibReaderBase::Header::kGzip:
      return MAX_WBITS + 16;
    case ZlibReaderBase::Header::kZlibOrGzip:
      return MAX_WBITS + 32;
    case ZlibReaderBase::Header::kRaw:
      return -MAX_WBITS;
  }
  CHUNKSTREAM_CHECK_UNREACHABLE()
      << "Unknown zlib header: " << static_cast<int>(header);
}

uInt ClampToUInt(size_t length) {
  return IntCast<uInt>(
      UnsignedMin(length, size_t{std::numeric_limits<uInt>::max()}));
}

}  // namespace

void ZlibReaderBase::InflateEnder::operator()(z_stream* stream) const {
  inflateEnd(stream);
  delete stream;
}

void ZlibReaderBase::StartInflating(Reader& src) {
  if (ABSL_PREDICT_FALSE(!src.ok()) && src.available() == 0) {
    FailWithoutAnnotation(AnnotateWithUncompressedPos(src.status()));
    return;
  }
  // Owned by a plain `std::unique_ptr` until `inflateInit2()` succeeds, since
  // `inflateEnd()` must not see a stream which failed to initialize.
  std::unique_ptr<z_stream> stream = std::make_unique<z_stream>();
  const int zlib_code = inflateInit2(stream.get(), WindowBits(header_));
  if (ABSL_PREDICT_FALSE(zlib_code != Z_OK)) {
    Fail(zlib_internal::ZlibErrorToStatus("inflateInit2()", zlib_code,
                                          stream->msg));
    return;
  }
  inflater_.reset(stream.release());
}

void ZlibReaderBase::Done() {
  BufferedReader::Done();
  inflater_.reset();
}

absl::Status ZlibReaderBase::AnnotateStatusImpl(absl::Status status) {
  // The compressed position comes first, then the uncompressed one.
  if (is_open()) status = SrcReader()->AnnotateStatus(std::move(status));
  return AnnotateWithUncompressedPos(std::move(status));
}

absl::Status ZlibReaderBase::AnnotateWithUncompressedPos(absl::Status status) {
  if (!is_open()) return status;
  return Annotate(status, absl::StrCat("at uncompressed byte ", pos()));
}

bool ZlibReaderBase::FailZlib(absl::string_view operation, int zlib_code) {
  return Fail(zlib_internal::ZlibErrorToStatus(operation, zlib_code,
                                               inflater_->msg));
}

bool ZlibReaderBase::SrcEnded(Reader& src) {
  if (ABSL_PREDICT_FALSE(!src.ok())) {
    return FailWithoutAnnotation(AnnotateWithUncompressedPos(src.status()));
  }
  if (concatenate_ && (!stream_started_ || after_stream_)) return false;
  // Compressed sources do not grow, so the stream can never be completed.
  return FailWithoutAnnotation(AnnotateWithUncompressedPos(src.AnnotateStatus(
      absl::InvalidArgumentError("Truncated Zlib-compressed stream"))));
}

bool ZlibReaderBase::ReadInternal(size_t min_length, size_t max_length,
                                  char* dest) {
  if (ABSL_PREDICT_FALSE(inflater_ == nullptr)) return false;
  Reader& src = *SrcReader();
  z_stream& stream = *inflater_;
  max_length = UnsignedMin(max_length,
                           std::numeric_limits<Position>::max() - limit_pos());
  size_t produced = 0;
  while (produced < min_length) {
    stream.next_out = reinterpret_cast<Bytef*>(dest + produced);
    stream.avail_out = ClampToUInt(max_length - produced);
    stream.next_in = const_cast<z_const Bytef*>(
        reinterpret_cast<const Bytef*>(src.cursor()));
    const uInt offered = ClampToUInt(src.available());
    stream.avail_in = offered;
    if (offered > 0) stream_started_ = true;
    const size_t produced_before = produced;
    const int zlib_code = inflate(&stream, Z_NO_FLUSH);
    src.move_cursor(offered - stream.avail_in);
    produced = IntCast<size_t>(reinterpret_cast<char*>(stream.next_out) - dest);
    if (produced > produced_before) after_stream_ = false;

    if (zlib_code == Z_STREAM_END) {
      if (!concatenate_) {
        inflater_.reset();
        move_limit_pos(produced);
        // Later pulls end here without calling `ReadInternal()`.
        set_exact_size(limit_pos());
        return produced >= min_length;
      }
      const int reset_code = inflateReset(&stream);
      if (ABSL_PREDICT_FALSE(reset_code != Z_OK)) {
        move_limit_pos(produced);
        return FailZlib("inflateReset()", reset_code);
      }
      stream_started_ = false;
      after_stream_ = true;
      continue;
    }
    if (zlib_code == Z_DATA_ERROR && after_stream_) {
      // Trailing bytes which are not a stream.
      inflater_.reset();
      move_limit_pos(produced);
      set_exact_size(limit_pos());
      return produced >= min_length;
    }
    if (ABSL_PREDICT_FALSE(zlib_code != Z_OK && zlib_code != Z_BUF_ERROR)) {
      move_limit_pos(produced);
      return FailZlib("inflate()", zlib_code);
    }
    if (produced < min_length && stream.avail_in == 0 &&
        ABSL_PREDICT_FALSE(!src.Pull())) {
      move_limit_pos(produced);
      return SrcEnded(src);
    }
  }
  move_limit_pos(produced);
  return true;
}

}  // namespace chunkstream
