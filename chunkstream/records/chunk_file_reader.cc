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

#include "chunkstream/records/chunk_file_reader.h"

#include <string>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "chunkstream/bytes/fd_reader.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record_reader.h"
#include "chunkstream/zlib/zlib_reader.h"

namespace chunkstream {

ChunkFileReader::ChunkFileReader(absl::string_view filename, Options options)
    : ChunkRecordReader(kClosed), filename_(filename) {
  absl::StatusOr<ChunkAddress> address = ParseChunkAddress(filename);
  if (ABSL_PREDICT_FALSE(!address.ok())) {
    // Open with a closed source, only to report the failure.
    ChunkRecordReaderBase::Reset();
    Fail(std::move(address).status());
    return;
  }
  ChunkRecordReader::Reset(
      ZlibReader<FdReader<>>(FdReader<>(filename, options.fd_options()),
                             options.zlib_options()),
      *std::move(address),
      ChunkRecordReaderBase::Options().set_includes_keys(
          options.includes_keys()));
}

}  // namespace chunkstream
