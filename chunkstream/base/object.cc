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

#include "chunkstream/base/object.h"

#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "chunkstream/base/assert.h"

namespace chunkstream {

absl::Status Object::status() const {
  if (ABSL_PREDICT_FALSE(!failure_.ok())) return failure_;
  if (ABSL_PREDICT_FALSE(!is_open_)) {
    return absl::FailedPreconditionError("Object closed");
  }
  return absl::OkStatus();
}

bool Object::Fail(absl::Status status) {
  CHUNKSTREAM_ASSERT(!status.ok())
      << "Failed precondition of Object::Fail(): status not failed";
  if (ABSL_PREDICT_FALSE(!not_failed())) return false;
  return FailWithoutAnnotation(AnnotateStatus(std::move(status)));
}

absl::Status Object::AnnotateStatusImpl(absl::Status status) { return status; }

bool Object::FailWithoutAnnotation(absl::Status status) {
  CHUNKSTREAM_ASSERT(!status.ok())
      << "Failed precondition of Object::FailWithoutAnnotation(): "
         "status not failed";
  if (ABSL_PREDICT_TRUE(not_failed())) failure_ = std::move(status);
  return false;
}

}  // namespace chunkstream
