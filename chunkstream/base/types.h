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

#ifndef CHUNKSTREAM_BASE_TYPES_H_
#define CHUNKSTREAM_BASE_TYPES_H_

#include <stddef.h>
#include <stdint.h>

#include <ios>
#include <type_traits>

namespace chunkstream {

// Position in a stream of bytes, used also for stream sizes.
//
// This is an unsigned integer type at least as wide as `size_t`,
// `std::streamoff`, and `uint64_t`.
using Position =
    std::common_type_t<size_t, std::make_unsigned_t<std::streamoff>, uint64_t>;

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BASE_TYPES_H_
