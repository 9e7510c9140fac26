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

#include "chunkstream/records/chunk_record.h"

#include <ostream>

#include "absl/strings/escaping.h"
#include "absl/types/optional.h"

namespace chunkstream {

std::ostream& operator<<(std::ostream& out, const ChunkRecord& record) {
  out << "{" << record.topic << "-" << record.partition << ":"
      << record.offset << ", key: ";
  if (record.key == absl::nullopt) {
    out << "none";
  } else {
    out << "\"" << absl::CHexEscape(*record.key) << "\"";
  }
  return out << ", value: \"" << absl::CHexEscape(record.value) << "\"}";
}

}  // namespace chunkstream
