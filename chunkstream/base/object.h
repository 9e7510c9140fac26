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

#ifndef CHUNKSTREAM_BASE_OBJECT_H_
#define CHUNKSTREAM_BASE_OBJECT_H_

#include <utility>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/status/status.h"

namespace chunkstream {

// Tag selecting a constructor or `Reset()` overload which leaves the object
// closed.
struct Closed {};
inline constexpr Closed kClosed = Closed();

// Base class of byte readers and record readers, tracking two independent
// bits of state:
//
//  * open or closed: an `Object` is closed by `Close()`, by being moved from,
//    or by being constructed as closed;
//  * not failed or failed: a failed `Object` carries an `absl::Status` saying
//    why, and stays failed until it is `Reset()`.
//
// An `Object` is OK when it is open and not failed. Reading functions of
// derived classes return `false` for failure, and `status()` then tells more.
//
// Derived classes are movable but not copyable.
class Object {
 public:
  Object(const Object&) = delete;
  Object& operator=(const Object&) = delete;

  virtual ~Object() {}

  // Releases owned dependencies, possibly failing while doing so.
  //
  // Does nothing if the `Object` is already closed.
  //
  // Returns `not_failed()` as of after closing.
  bool Close();

  bool ok() const { return is_open_ && failure_.ok(); }
  bool is_open() const { return is_open_; }
  bool not_failed() const { return failure_.ok(); }

  // Returns:
  //  * the failure, if failed
  //  * `absl::FailedPreconditionError()`, if closed without failing
  //  * `absl::OkStatus()`, if OK
  absl::Status status() const;

  // Fails the `Object` with `status` annotated by `AnnotateStatus()`, unless
  // it has already failed, in which case the earlier failure is kept.
  //
  // Always returns `false`.
  //
  // Precondition: `!status.ok()`
  ABSL_ATTRIBUTE_COLD bool Fail(absl::Status status);

  // Adds context of this `Object` to `status`, e.g. the current position.
  // Used by `Fail()`, and by callers which detected a problem with data read
  // from this `Object`.
  ABSL_ATTRIBUTE_COLD absl::Status AnnotateStatus(absl::Status status) {
    return AnnotateStatusImpl(std::move(status));
  }

 protected:
  explicit Object(Closed) noexcept : is_open_(false) {}

  Object() noexcept {}

  Object(Object&& that) noexcept;
  Object& operator=(Object&& that) noexcept;

  // Makes `*this` equivalent to a newly constructed `Object`. Derived classes
  // redefining `Reset()` call this.
  void Reset(Closed);
  void Reset();

  // Work of `Close()` specific to the derived class, e.g. closing owned
  // dependencies. Called at most once, while `is_open()`.
  virtual void Done() {}

  // `AnnotateStatus()` of the derived class. Returns `status` unchanged by
  // default.
  ABSL_ATTRIBUTE_COLD virtual absl::Status AnnotateStatusImpl(
      absl::Status status);

  // Like `Fail()`, but `status` is taken as is. Used for propagating a failure
  // of a dependency which carries its own context.
  ABSL_ATTRIBUTE_COLD bool FailWithoutAnnotation(absl::Status status);

 private:
  bool is_open_ = true;
  // `absl::OkStatus()` unless failed.
  absl::Status failure_;
};

// Implementation details follow.

inline Object::Object(Object&& that) noexcept
    : is_open_(std::exchange(that.is_open_, false)),
      failure_(std::exchange(that.failure_, absl::OkStatus())) {}

inline Object& Object::operator=(Object&& that) noexcept {
  is_open_ = std::exchange(that.is_open_, false);
  failure_ = std::exchange(that.failure_, absl::OkStatus());
  return *this;
}

inline void Object::Reset(Closed) {
  is_open_ = false;
  failure_ = absl::OkStatus();
}

inline void Object::Reset() {
  is_open_ = true;
  failure_ = absl::OkStatus();
}

inline bool Object::Close() {
  if (ABSL_PREDICT_FALSE(!is_open_)) return not_failed();
  Done();
  is_open_ = false;
  return not_failed();
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BASE_OBJECT_H_
