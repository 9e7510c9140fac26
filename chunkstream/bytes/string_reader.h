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


#ifndef CHUNKSTREAM_BYTES_STRING_READER_H_
#define CHUNKSTREAM_BYTES_STRING_READER_H_

#include <stddef.h>

#include <type_traits>
#include <utility>

#include "absl/meta/type_traits.h"
#include "absl/strings/string_view.h"
#include "chunkstream/base/dependency.h"
#include "chunkstream/base/object.h"
#include "chunkstream/base/types.h"
#include "chunkstream/bytes/reader.h"

namespace chunkstream {

class StringReaderBase : public Reader {
 public:
  // The bytes being read. Still valid after `Close()`.
  virtual absl::string_view SrcStringView() const = 0;

 protected:
  using Reader::Reader;

  StringReaderBase(StringReaderBase&& that) noexcept
      : Reader(static_cast<Reader&&>(that)) {}
  StringReaderBase& operator=(StringReaderBase&& that) noexcept {
    Reader::operator=(static_cast<Reader&&>(that));
    return *this;
  }

  // The window covers all of `src` from the start, so `pos()` is also the
  // index of `cursor()` in `src`.
  void Initialize(absl::string_view src) {
    set_buffer(src.data(), src.size());
    move_limit_pos(src.size());
  }

  bool PullSlow(size_t min_length) override;
};

// Reads bytes held in memory.
//
// `Src` provides the bytes and decides who owns them: `absl::string_view`
// (borrowed, the default) or `std::string` (owned).
//
// With CTAD, an lvalue convertible to `absl::string_view` or a `const char*`
// is borrowed as `absl::string_view`, and anything else is stored as its
// decayed type. Borrowed bytes must outlive the reader.
template <typename Src = absl::string_view>
class StringReader : public StringReaderBase {
 public:
  explicit StringReader(Closed) noexcept : StringReaderBase(kClosed) {}
  explicit StringReader(Src src) : src_(std::move(src)) {
    Initialize(src_.get());
  }

  StringReader(StringReader&& that) noexcept;
  StringReader& operator=(StringReader&& that) noexcept;

  Src& src() { return src_.manager(); }
  const Src& src() const { return src_.manager(); }
  absl::string_view SrcStringView() const override { return src_.get(); }

 private:
  // Takes `that.src_`. An owned string may relocate its bytes when moved, in
  // which case the window is rebuilt over the new location.
  void MoveSrc(StringReader&& that);

  Dependency<absl::string_view, Src> src_;
};

explicit StringReader(Closed) -> StringReader<>;
template <typename Src>
explicit StringReader(Src&& src) -> StringReader<std::conditional_t<
    absl::disjunction<
        absl::conjunction<std::is_lvalue_reference<Src>,
                          std::is_convertible<Src, absl::string_view>>,
        std::is_convertible<Src&&, const char*>>::value,
    absl::string_view, std::decay_t<Src>>>;

// Implementation details follow.

template <typename Src>
inline StringReader<Src>::StringReader(StringReader&& that) noexcept
    : StringReaderBase(static_cast<StringReaderBase&&>(that)) {
  MoveSrc(std::move(that));
}

template <typename Src>
inline StringReader<Src>& StringReader<Src>::operator=(
    StringReader&& that) noexcept {
  StringReaderBase::operator=(static_cast<StringReaderBase&&>(that));
  MoveSrc(std::move(that));
  return *this;
}

template <typename Src>
inline void StringReader<Src>::MoveSrc(StringReader&& that) {
  const Position consumed = pos();
  src_ = std::move(that.src_);
  if (src_.kIsStable || !is_open()) return;
  const absl::string_view src = src_.get();
  set_buffer(src.data() + consumed, src.size() - consumed);
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_BYTES_STRING_READER_H_
