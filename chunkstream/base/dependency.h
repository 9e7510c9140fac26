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

#ifndef CHUNKSTREAM_BASE_DEPENDENCY_H_
#define CHUNKSTREAM_BASE_DEPENDENCY_H_

#include <memory>
#include <string>
#include <type_traits>
#include <utility>

#include "absl/strings/string_view.h"
#include "chunkstream/base/object.h"

namespace chunkstream {

// `Dependency<Handle, Manager>` stores or refers to an optionally owned object
// which is stored as type `Manager` and accessed through type `Handle`.
//
// When a dependent object is said to be owned by a host object, the host is
// responsible for closing it when done, and for destroying it.
//
// Often `Handle` is some pointer `Base*`, and then `Manager` can be e.g.
// `T` (owned), `T*` (not owned), or `std::unique_ptr<T, Deleter>` (owned),
// with some `T` derived from `Base`.
//
// `Dependency<Handle, Manager>` is usually a member of a host class template
// parameterized by `Manager`, with `Handle` fixed by the host class. A user of
// the host class specifies ownership of the dependent object by choosing the
// `Manager` template argument, usually deduced by CTAD from a constructor
// argument.
//
// Operations of `Dependency<Handle, Manager>`:
//
// ```
//   // Constructs a dummy `Manager`, closed if it is an `Object`. Used when
//   // the host object is closed and does not need a dependent object.
//   Dependency();
//
//   // Moves a `Manager`. Used to specify the initial value of the dependent
//   // object.
//   explicit Dependency(Manager manager);
//
//   // Moves the dependency.
//   Dependency(Dependency&& that) noexcept;
//   Dependency& operator=(Dependency&& that) noexcept;
//
//   // Makes `*this` equivalent to a newly constructed `Dependency`.
//   void Reset();
//   void Reset(Manager manager);
//
//   // Exposes the stored `Manager`.
//   Manager& manager();
//   const Manager& manager() const;
//
//   // Returns a `Handle` to the `Manager`.
//   Handle get() const;
//
//   // If `Handle` is `Base*`, `Dependency` can be used as a smart pointer.
//   Base& operator*() const;
//   Base* operator->() const;
//
//   // Returns `true` if the host is responsible for closing the dependent
//   // object.
//   bool IsOwning() const;
//   static constexpr bool kIsOwning;
//
//   // If `true`, `get()` stays unchanged when a `Dependency` is moved.
//   static constexpr bool kIsStable;
// ```
template <typename Handle, typename Manager, typename Enable = void>
class Dependency;

namespace dependency_internal {

// Constructs a `Manager` for a host which is closed: a closed `Object`, or a
// default-constructed value otherwise.
template <typename Manager,
          std::enable_if_t<std::is_constructible<Manager, Closed>::value,
                           int> = 0>
inline Manager DependencySentinel() {
  return Manager(kClosed);
}

template <typename Manager,
          std::enable_if_t<!std::is_constructible<Manager, Closed>::value,
                           int> = 0>
inline Manager DependencySentinel() {
  return Manager();
}

// Common part of `Dependency` specializations storing a `Manager` by value.
template <typename Manager>
class DependencyBase {
 public:
  DependencyBase() : manager_(DependencySentinel<Manager>()) {}

  explicit DependencyBase(Manager manager) : manager_(std::move(manager)) {}

  DependencyBase(DependencyBase&& that) = default;
  DependencyBase& operator=(DependencyBase&& that) = default;

  void Reset() { manager_ = DependencySentinel<Manager>(); }
  void Reset(Manager manager) { manager_ = std::move(manager); }

  Manager& manager() { return manager_; }
  const Manager& manager() const { return manager_; }

 protected:
  mutable Manager manager_;
};

}  // namespace dependency_internal

// Specialization of `Dependency<P*, M*>` when `M*` is convertible to `P*`:
// an unowned dependency stored by pointer.
template <typename P, typename M>
class Dependency<P*, M*, std::enable_if_t<std::is_convertible<M*, P*>::value>>
    : public dependency_internal::DependencyBase<M*> {
 public:
  using dependency_internal::DependencyBase<M*>::DependencyBase;

  M* get() const { return this->manager_; }
  M& operator*() const { return *get(); }
  M* operator->() const { return get(); }

  bool IsOwning() const { return false; }

  static constexpr bool kIsOwning = false;
  static constexpr bool kIsStable = true;
};

// Specialization of `Dependency<P*, M>` when `M*` is convertible to `P*`:
// an owned dependency stored by value.
template <typename P, typename M>
class Dependency<P*, M,
                 std::enable_if_t<std::is_convertible<M*, P*>::value>>
    : public dependency_internal::DependencyBase<M> {
 public:
  using dependency_internal::DependencyBase<M>::DependencyBase;

  M* get() const { return &this->manager_; }
  M& operator*() const { return *get(); }
  M* operator->() const { return get(); }

  bool IsOwning() const { return true; }

  static constexpr bool kIsOwning = true;
  static constexpr bool kIsStable = false;
};

// Specialization of `Dependency<P*, std::unique_ptr<M, Deleter>>` when `M*` is
// convertible to `P*`: an owned dependency stored by `std::unique_ptr`.
template <typename P, typename M, typename Deleter>
class Dependency<P*, std::unique_ptr<M, Deleter>,
                 std::enable_if_t<std::is_convertible<M*, P*>::value>>
    : public dependency_internal::DependencyBase<std::unique_ptr<M, Deleter>> {
 public:
  using dependency_internal::DependencyBase<
      std::unique_ptr<M, Deleter>>::DependencyBase;

  M* get() const { return this->manager_.get(); }
  M& operator*() const { return *get(); }
  M* operator->() const { return get(); }

  bool IsOwning() const { return this->manager_ != nullptr; }

  static constexpr bool kIsOwning = true;
  static constexpr bool kIsStable = true;
};

// Specializations for `absl::string_view` handles, used by `StringReader`.

template <>
class Dependency<absl::string_view, absl::string_view>
    : public dependency_internal::DependencyBase<absl::string_view> {
 public:
  using DependencyBase::DependencyBase;

  absl::string_view get() const { return manager_; }

  bool IsOwning() const { return false; }

  static constexpr bool kIsOwning = false;
  static constexpr bool kIsStable = true;
};

template <>
class Dependency<absl::string_view, std::string>
    : public dependency_internal::DependencyBase<std::string> {
 public:
  using DependencyBase::DependencyBase;

  absl::string_view get() const { return manager_; }

  bool IsOwning() const { return true; }

  static constexpr bool kIsOwning = true;
  static constexpr bool kIsStable = false;
};

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BASE_DEPENDENCY_H_
