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


#include "chunkstream/base/assert.h"

#include "absl/log/absl_log.h"
#include "absl/strings/string_view.h"

namespace chunkstream {
namespace assert_internal {

FailureMessage::FailureMessage(const char* file, int line,
                               absl::string_view condition)
    : file_(file), line_(line) {
  stream_ << "Check failed: " << condition << " ";
}

FailureMessage::~FailureMessage() {
  ABSL_LOG(FATAL).AtLocation(file_, line_) << stream_.str();
}

}  // namespace assert_internal
}  // namespace chunkstream
