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


#ifndef CHUNKSTREAM_BASE_STATUS_H_
#define CHUNKSTREAM_BASE_STATUS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace chunkstream {

// Appends `detail` to the message of a failed `status`, after "; " unless
// the message was empty. The code and the payloads carry over. An OK status
// or an empty `detail` leaves `status` as it is.
absl::Status Annotate(const absl::Status& status, absl::string_view detail);

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BASE_STATUS_H_
