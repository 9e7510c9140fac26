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


#ifndef CHUNKSTREAM_BASE_ASSERT_H_
#define CHUNKSTREAM_BASE_ASSERT_H_

#include <functional>
#include <memory>
#include <ostream>  // IWYU pragma: export
#include <sstream>
#include <string>

#include "absl/base/attributes.h"
#include "absl/base/optimization.h"
#include "absl/strings/string_view.h"

// Invariant checks.
//
// `CHUNKSTREAM_CHECK(expr)` terminates the program through a fatal log
// message when `expr` is `false`. `CHUNKSTREAM_CHECK_{EQ,NE,LT,GT,LE,GE}(a, b)`
// compare two printable values and print both on failure.
// `CHUNKSTREAM_CHECK_UNREACHABLE()` always fails. Any of them accepts further
// `<< details`, evaluated only on failure.
//
// `CHUNKSTREAM_ASSERT*` are the same checks in debug builds and compile to
// nothing otherwise. `CHUNKSTREAM_DEBUG` selects between the two, following
// `NDEBUG` unless set explicitly.

#ifndef CHUNKSTREAM_DEBUG
#ifdef NDEBUG
#define CHUNKSTREAM_DEBUG 0
#else
#define CHUNKSTREAM_DEBUG 1
#endif
#endif

namespace chunkstream {
namespace assert_internal {

// Accumulates the text of a failed check. The destructor logs it fatally.
class FailureMessage {
 public:
  FailureMessage(const char* file, int line, absl::string_view condition);

  FailureMessage(const FailureMessage&) = delete;
  FailureMessage& operator=(const FailureMessage&) = delete;

  ABSL_ATTRIBUTE_NORETURN ~FailureMessage();

  std::ostream& stream() { return stream_; }

 private:
  const char* file_;
  int line_;
  std::ostringstream stream_;
};

// Returns `nullptr` if `Op()(a, b)` holds, otherwise the condition text
// followed by both values.
template <typename Op, typename A, typename B>
inline std::unique_ptr<std::string> CheckCompare(const char* condition,
                                                 const A& a, const B& b) {
  if (ABSL_PREDICT_TRUE(Op()(a, b))) return nullptr;
  std::ostringstream out;
  out << condition << " (" << a << " vs. " << b << ")";
  return std::make_unique<std::string>(out.str());
}

}  // namespace assert_internal
}  // namespace chunkstream

// Lets `if (condition) CHUNKSTREAM_CHECK(x);` be followed by `else` without
// the `else` binding to the macro's own `if`.
#define CHUNKSTREAM_INTERNAL_BLOCK_ELSE \
  switch (0)                            \
  case 0:                               \
  default:

#define CHUNKSTREAM_CHECK(expr)                                       \
  CHUNKSTREAM_INTERNAL_BLOCK_ELSE                                     \
  if (ABSL_PREDICT_TRUE(expr))                                        \
    ;                                                                 \
  else                                                                \
    ::chunkstream::assert_internal::FailureMessage(__FILE__, __LINE__, \
                                                   #expr)              \
        .stream()

#define CHUNKSTREAM_INTERNAL_CHECK_OP(compare, op, a, b)                \
  CHUNKSTREAM_INTERNAL_BLOCK_ELSE                                       \
  if (const std::unique_ptr<std::string> chunkstream_internal_failure = \
          ::chunkstream::assert_internal::CheckCompare<compare>(        \
              #a " " #op " " #b, a, b);                                 \
      chunkstream_internal_failure == nullptr)                          \
    ;                                                                   \
  else                                                                  \
    ::chunkstream::assert_internal::FailureMessage(                     \
        __FILE__, __LINE__, *chunkstream_internal_failure)              \
        .stream()

#define CHUNKSTREAM_CHECK_EQ(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::equal_to<>, ==, a, b)
#define CHUNKSTREAM_CHECK_NE(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::not_equal_to<>, !=, a, b)
#define CHUNKSTREAM_CHECK_LT(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::less<>, <, a, b)
#define CHUNKSTREAM_CHECK_GT(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::greater<>, >, a, b)
#define CHUNKSTREAM_CHECK_LE(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::less_equal<>, <=, a, b)
#define CHUNKSTREAM_CHECK_GE(a, b) \
  CHUNKSTREAM_INTERNAL_CHECK_OP(std::greater_equal<>, >=, a, b)

#define CHUNKSTREAM_CHECK_UNREACHABLE()                                  \
  ::chunkstream::assert_internal::FailureMessage(__FILE__, __LINE__,     \
                                                 "unreachable code")     \
      .stream()

#if CHUNKSTREAM_DEBUG

#define CHUNKSTREAM_ASSERT CHUNKSTREAM_CHECK
#define CHUNKSTREAM_ASSERT_EQ CHUNKSTREAM_CHECK_EQ
#define CHUNKSTREAM_ASSERT_NE CHUNKSTREAM_CHECK_NE
#define CHUNKSTREAM_ASSERT_LT CHUNKSTREAM_CHECK_LT
#define CHUNKSTREAM_ASSERT_GT CHUNKSTREAM_CHECK_GT
#define CHUNKSTREAM_ASSERT_LE CHUNKSTREAM_CHECK_LE
#define CHUNKSTREAM_ASSERT_GE CHUNKSTREAM_CHECK_GE

#else  // !CHUNKSTREAM_DEBUG

// The condition and the details still have to compile.
#define CHUNKSTREAM_ASSERT(expr)                                      \
  CHUNKSTREAM_INTERNAL_BLOCK_ELSE                                     \
  if (true || (expr))                                                 \
    ;                                                                 \
  else                                                                \
    ::chunkstream::assert_internal::FailureMessage(__FILE__, __LINE__, \
                                                   #expr)              \
        .stream()

#define CHUNKSTREAM_ASSERT_EQ(a, b) CHUNKSTREAM_ASSERT((a) == (b))
#define CHUNKSTREAM_ASSERT_NE(a, b) CHUNKSTREAM_ASSERT((a) != (b))
#define CHUNKSTREAM_ASSERT_LT(a, b) CHUNKSTREAM_ASSERT((a) < (b))
#define CHUNKSTREAM_ASSERT_GT(a, b) CHUNKSTREAM_ASSERT((a) > (b))
#define CHUNKSTREAM_ASSERT_LE(a, b) CHUNKSTREAM_ASSERT((a) <= (b))
#define CHUNKSTREAM_ASSERT_GE(a, b) CHUNKSTREAM_ASSERT((a) >= (b))

#endif  // !CHUNKSTREAM_DEBUG

#endif  // CHUNKSTREAM_BASE_ASSERT_H_
