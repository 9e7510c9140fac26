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

#ifndef CHUNKSTREAM_BYTES_FD_HANDLE_H_
#define CHUNKSTREAM_BYTES_FD_HANDLE_H_

#include <utility>

#include "absl/status/status.h"
#include "chunkstream/base/dependency.h"

namespace chunkstream {

// Owns a file descriptor, which is closed when the `OwnedFd` is destroyed or
// `Close()` is called.
//
// An `OwnedFd` holding -1 does not own anything.
class OwnedFd {
 public:
  // Creates an `OwnedFd` which does not own a fd.
  OwnedFd() = default;

  // Creates an `OwnedFd` which owns `fd` if `fd >= 0`.
  explicit OwnedFd(int fd) noexcept : fd_(fd) {}

  OwnedFd(OwnedFd&& that) noexcept : fd_(that.Release()) {}
  OwnedFd& operator=(OwnedFd&& that) noexcept;

  ~OwnedFd();

  // Returns the owned fd, or -1 if none.
  int get() const { return fd_; }

  // Releases and returns the owned fd without closing it.
  int Release() { return std::exchange(fd_, -1); }

  // Closes the owned fd if present.
  //
  // Returns a failed `absl::Status` if `close()` failed. The fd is not owned
  // after `Close()` in any case.
  absl::Status Close();

 private:
  int fd_ = -1;
};

// Refers to a file descriptor owned by the caller, which is not closed by a
// reader using it.
class UnownedFd {
 public:
  UnownedFd() = default;

  explicit UnownedFd(int fd) noexcept : fd_(fd) {}

  UnownedFd(const UnownedFd& that) = default;
  UnownedFd& operator=(const UnownedFd& that) = default;

  int get() const { return fd_; }

 private:
  int fd_ = -1;
};

// Specializations of `Dependency<int, Manager>` for fds.

template <>
class Dependency<int, OwnedFd>
    : public dependency_internal::DependencyBase<OwnedFd> {
 public:
  using DependencyBase::DependencyBase;

  int get() const { return manager_.get(); }

  bool IsOwning() const { return manager_.get() >= 0; }

  static constexpr bool kIsOwning = true;
  static constexpr bool kIsStable = true;
};

template <>
class Dependency<int, UnownedFd>
    : public dependency_internal::DependencyBase<UnownedFd> {
 public:
  using DependencyBase::DependencyBase;

  int get() const { return manager_.get(); }

  bool IsOwning() const { return false; }

  static constexpr bool kIsOwning = false;
  static constexpr bool kIsStable = true;
};

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_FD_HANDLE_H_
