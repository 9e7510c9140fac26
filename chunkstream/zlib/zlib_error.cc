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

#include "chunkstream/zlib/zlib_error.h"

#include <string>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/string_view.h"
#include "zlib.h"

namespace chunkstream {
namespace zlib_internal {

namespace {

struct ZlibCodeInfo {
  absl::StatusCode status_code;
  // `nullptr` for a code unknown to this version of zlib.
  const char* description;
};

ZlibCodeInfo DescribeZlibCode(int zlib_code) {
  switch (zlib_code) {
    case Z_NEED_DICT:
      return {absl::StatusCode::kInvalidArgument, "need dictionary"};
    case Z_DATA_ERROR:
      return {absl::StatusCode::kInvalidArgument, "data error"};
    case Z_MEM_ERROR:
      return {absl::StatusCode::kResourceExhausted, "insufficient memory"};
    case Z_STREAM_END:
      return {absl::StatusCode::kInternal, "stream end"};
    case Z_ERRNO:
      return {absl::StatusCode::kInternal, "file error"};
    case Z_STREAM_ERROR:
      return {absl::StatusCode::kInternal, "stream error"};
    case Z_BUF_ERROR:
      return {absl::StatusCode::kInternal, "buffer error"};
    case Z_VERSION_ERROR:
      return {absl::StatusCode::kInternal, "incompatible version"};
    default:
      return {absl::StatusCode::kInternal, nullptr};
  }
}

}  // namespace

absl::Status ZlibErrorToStatus(absl::string_view operation, int zlib_code,
                               const char* details) {
  if (zlib_code == Z_OK) return absl::OkStatus();
  const ZlibCodeInfo info = DescribeZlibCode(zlib_code);
  std::string message = absl::StrCat(operation, " failed");
  if (details != nullptr) {
    absl::StrAppend(&message, ": ", details);
  } else if (info.description != nullptr) {
    absl::StrAppend(&message, ": ", info.description);
  } else {
    absl::StrAppend(&message, ": unknown zlib error code: ", zlib_code);
  }
  return absl::Status(info.status_code, message);
}

}  // namespace zlib_internal
}  // namespace chunkstream
