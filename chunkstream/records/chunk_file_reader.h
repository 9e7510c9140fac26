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

#ifndef CHUNKSTREAM_RECORDS_CHUNK_FILE_READER_H_
#define CHUNKSTREAM_RECORDS_CHUNK_FILE_READER_H_

#include <string>
#include <utility>

#include "absl/strings/string_view.h"
#include "chunkstream/base/object.h"
#include "chunkstream/bytes/fd_reader.h"
#include "chunkstream/records/chunk_record_reader.h"
#include "chunkstream/zlib/zlib_reader.h"

namespace chunkstream {

// Reads the records of a gzip-compressed chunk file from the local
// filesystem. The address of the chunk is parsed from the file name.
//
// `Close()` closes the file.
class ChunkFileReader : public ChunkRecordReader<ZlibReader<FdReader<>>> {
 public:
  class Options {
   public:
    Options() noexcept {}

    // See `ChunkRecordReaderBase::Options::set_includes_keys()`.
    //
    // Default: `false`.
    Options& set_includes_keys(bool includes_keys) & {
      includes_keys_ = includes_keys;
      return *this;
    }
    Options&& set_includes_keys(bool includes_keys) && {
      return std::move(set_includes_keys(includes_keys));
    }
    bool includes_keys() const { return includes_keys_; }

    // Options for decompression.
    //
    // Default: gzip header, concatenated gzip members accepted.
    Options& set_zlib_options(ZlibReaderBase::Options zlib_options) & {
      zlib_options_ = std::move(zlib_options);
      return *this;
    }
    Options&& set_zlib_options(ZlibReaderBase::Options zlib_options) && {
      return std::move(set_zlib_options(std::move(zlib_options)));
    }
    const ZlibReaderBase::Options& zlib_options() const {
      return zlib_options_;
    }

    // Options for reading the compressed file.
    //
    // Default: `FdReaderBase::Options()`.
    Options& set_fd_options(FdReaderBase::Options fd_options) & {
      fd_options_ = std::move(fd_options);
      return *this;
    }
    Options&& set_fd_options(FdReaderBase::Options fd_options) && {
      return std::move(set_fd_options(std::move(fd_options)));
    }
    const FdReaderBase::Options& fd_options() const { return fd_options_; }

   private:
    bool includes_keys_ = false;
    ZlibReaderBase::Options zlib_options_ =
        ZlibReaderBase::Options()
            .set_header(ZlibReaderBase::Header::kGzip)
            .set_concatenate(true);
    FdReaderBase::Options fd_options_;
  };

  // Creates a closed `ChunkFileReader`.
  explicit ChunkFileReader(Closed) noexcept : ChunkRecordReader(kClosed) {}

  // Opens the chunk file `filename` for reading.
  //
  // If the last component of `filename` is not a valid chunk name, the file is
  // not opened and the `ChunkFileReader` fails immediately with the
  // `absl::InvalidArgumentError()` from `ParseChunkAddress()`.
  explicit ChunkFileReader(absl::string_view filename,
                           Options options = Options());

  ChunkFileReader(ChunkFileReader&& that) = default;
  ChunkFileReader& operator=(ChunkFileReader&& that) = default;

  // Returns the name of the file being read.
  const std::string& filename() const { return filename_; }

 private:
  std::string filename_;
};

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_CHUNK_FILE_READER_H_
