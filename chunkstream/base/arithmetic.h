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


#ifndef CHUNKSTREAM_BASE_ARITHMETIC_H_
#define CHUNKSTREAM_BASE_ARITHMETIC_H_

#include <type_traits>

#include "chunkstream/base/assert.h"

namespace chunkstream {

// Whether `value` survives conversion to `To` unchanged.
template <typename To, typename From>
constexpr bool IntFits(From value) {
  static_assert(std::is_integral<To>::value && std::is_integral<From>::value,
                "IntFits() works on integers");
  const To converted = static_cast<To>(value);
  return static_cast<From>(converted) == value &&
         (converted < To{0}) == (value < From{0});
}

// Converts `value` to another integer type, asserting that it fits.
template <typename To, typename From>
inline To IntCast(From value) {
  CHUNKSTREAM_ASSERT(IntFits<To>(value))
      << "IntCast(): " << value << " out of range";
  return static_cast<To>(value);
}

// The smaller of unsigned `a` and `b`, in the narrower of their types.
template <typename A, typename B>
constexpr std::conditional_t<(sizeof(A) <= sizeof(B)), A, B> UnsignedMin(
    A a, B b) {
  static_assert(std::is_unsigned<A>::value && std::is_unsigned<B>::value,
                "UnsignedMin() works on unsigned integers");
  return static_cast<std::conditional_t<(sizeof(A) <= sizeof(B)), A, B>>(
      a < b ? a : b);
}

template <typename A, typename B, typename C>
constexpr auto UnsignedMin(A a, B b, C c) {
  return UnsignedMin(UnsignedMin(a, b), c);
}

// The larger of unsigned `a` and `b`, in their common type.
template <typename A, typename B>
constexpr std::common_type_t<A, B> UnsignedMax(A a, B b) {
  static_assert(std::is_unsigned<A>::value && std::is_unsigned<B>::value,
                "UnsignedMax() works on unsigned integers");
  return a < b ? b : a;
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BASE_ARITHMETIC_H_
