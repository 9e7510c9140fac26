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

#ifndef CHUNKSTREAM_RECORDS_CHUNK_RECORD_READER_H_
#define CHUNKSTREAM_RECORDS_CHUNK_RECORD_READER_H_

#include <stddef.h>
#include <stdint.h>

#include <iterator>
#include <utility>

#include "absl/base/optimization.h"
#include "absl/status/status.h"
#include "absl/strings/string_view.h"
#include "absl/types/optional.h"
#include "chunkstream/base/dependency.h"
#include "chunkstream/base/object.h"
#include "chunkstream/bytes/reader.h"
#include "chunkstream/records/chunk_address.h"
#include "chunkstream/records/chunk_record.h"

namespace chunkstream {

// Template parameter independent part of `ChunkRecordReader`.
class ChunkRecordReaderBase : public Object {
 public:
  class Options {
   public:
    Options() noexcept {}

    // If `true`, each record is a key frame followed by a value frame, and
    // records have `key` present.
    //
    // If `false`, each record is a single value frame, and records have `key`
    // absent.
    //
    // Default: `false`.
    Options& set_includes_keys(bool includes_keys) & {
      includes_keys_ = includes_keys;
      return *this;
    }
    Options&& set_includes_keys(bool includes_keys) && {
      return std::move(set_includes_keys(includes_keys));
    }
    bool includes_keys() const { return includes_keys_; }

   private:
    bool includes_keys_ = false;
  };

  // Progress of decoding.
  enum class State {
    // More records may follow, starting at `next_offset()`.
    kReady,
    // The source ended cleanly at a record boundary.
    kExhausted,
    // Decoding failed, `status()` explains why.
    kFailed,
  };

  // A single-pass input iterator over records, reading them with
  // `ReadRecord()`. Reaching the end of the source or failing ends the
  // iteration; `status()` tells which one happened.
  class iterator {
   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = ChunkRecord;
    using reference = const ChunkRecord&;
    using pointer = const ChunkRecord*;
    using difference_type = ptrdiff_t;

    // Creates the end iterator.
    iterator() = default;

    reference operator*() const { return record_; }
    pointer operator->() const { return &record_; }
    iterator& operator++() {
      Next();
      return *this;
    }

    friend bool operator==(const iterator& a, const iterator& b) {
      return a.reader_ == b.reader_;
    }
    friend bool operator!=(const iterator& a, const iterator& b) {
      return !(a == b);
    }

   private:
    friend class ChunkRecordReaderBase;

    explicit iterator(ChunkRecordReaderBase* reader) : reader_(reader) {
      Next();
    }

    void Next() {
      if (ABSL_PREDICT_FALSE(!reader_->ReadRecord(record_))) reader_ = nullptr;
    }

    ChunkRecordReaderBase* reader_ = nullptr;
    ChunkRecord record_;
  };

  // Returns the `Reader` of the decompressed frames. Unchanged by `Close()`.
  virtual Reader* SrcReader() const = 0;

  // Returns the address of the chunk, as given or parsed from its name.
  const ChunkAddress& address() const { return address_; }

  // Returns `Options::includes_keys()`.
  bool includes_keys() const { return includes_keys_; }

  // Returns the offset of the record which the next `ReadRecord()` returns.
  //
  // Starts at `address().start_offset` and is incremented by each record
  // returned. Unchanged by `PeekRecord()` and `HasNext()`.
  uint64_t next_offset() const { return next_offset_; }

  // Returns the progress of decoding.
  State state() const;

  // Reads the next record.
  //
  // Return values:
  //  * `true`                 - success (`record` is set)
  //  * `false` (when `ok()`)  - the source ends cleanly (`record` is
  //                             unchanged); further calls return `false` too
  //  * `false` (when `!ok()`) - failure (`record` is unchanged); further calls
  //                             return `false` with the same `status()`
  bool ReadRecord(ChunkRecord& record);

  // Decodes the next record if it is not buffered yet, and points `record` to
  // it without consuming it. At most one record is buffered.
  //
  // `*record` is valid until the next non-const call.
  //
  // Return values are as for `ReadRecord()`.
  bool PeekRecord(const ChunkRecord*& record);

  // Returns `true` if `ReadRecord()` would return a record.
  //
  // Decodes the next record if it is not buffered yet, so it can fail.
  bool HasNext();

  // Iterates over the remaining records. `begin()` reads the first of them.
  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

 protected:
  explicit ChunkRecordReaderBase(Closed) noexcept : Object(kClosed) {}

  ChunkRecordReaderBase() noexcept {}

  ChunkRecordReaderBase(ChunkRecordReaderBase&& that) noexcept;
  ChunkRecordReaderBase& operator=(ChunkRecordReaderBase&& that) noexcept;

  void Reset(Closed);
  void Reset();
  void Initialize(Reader* src, ChunkAddress&& address, bool includes_keys);
  void Initialize(Reader* src, absl::string_view identifier,
                  bool includes_keys);

  void Done() override;

 private:
  // Decodes the next record into `lookahead_` unless it is already there.
  bool PullRecord();

  ChunkAddress address_;
  bool includes_keys_ = false;
  uint64_t next_offset_ = 0;
  bool exhausted_ = false;
  // The decoded record following the records already returned, if any.
  //
  // Invariant: if `lookahead_ != absl::nullopt` then
  //   `lookahead_->offset == next_offset_`
  absl::optional<ChunkRecord> lookahead_;
};

// `ChunkRecordReader` reconstructs the records of one chunk from its
// decompressed frames.
//
// The `Src` template parameter specifies the type of the object providing and
// possibly owning the `Reader` of frames. `Src` must support
// `Dependency<Reader*, Src>`, e.g. `Reader*` (not owned, default),
// `std::unique_ptr<Reader>` (owned), `ZlibReader<FdReader<>>` (owned).
//
// By relying on CTAD the template argument can be deduced as the value type of
// the first constructor argument.
//
// `Close()` closes the `Reader` only if it is owned. A borrowed `Reader` stays
// open and its position is after the records read.
//
// A `ChunkRecordReader` is not safe for concurrent use.
template <typename Src = Reader*>
class ChunkRecordReader : public ChunkRecordReaderBase {
 public:
  // Creates a closed `ChunkRecordReader`.
  explicit ChunkRecordReader(Closed) noexcept
      : ChunkRecordReaderBase(kClosed) {}

  // Will read the records of the chunk at `address` from `src`.
  explicit ChunkRecordReader(Src src, ChunkAddress address,
                             Options options = Options());

  // Will read the records of the chunk named `identifier` from `src`.
  //
  // If `identifier` is not a valid chunk name, the `ChunkRecordReader` fails
  // immediately with the `absl::InvalidArgumentError()` from
  // `ParseChunkAddress()`.
  explicit ChunkRecordReader(Src src, absl::string_view identifier,
                             Options options = Options());

  ChunkRecordReader(ChunkRecordReader&& that) noexcept;
  ChunkRecordReader& operator=(ChunkRecordReader&& that) noexcept;

  // Makes `*this` equivalent to a newly constructed `ChunkRecordReader`.
  void Reset(Closed);
  void Reset(Src src, ChunkAddress address, Options options = Options());
  void Reset(Src src, absl::string_view identifier,
             Options options = Options());

  // Returns the object providing and possibly owning the `Reader` of frames.
  // Unchanged by `Close()`.
  Src& src() { return src_.manager(); }
  const Src& src() const { return src_.manager(); }
  Reader* SrcReader() const override { return src_.get(); }

 protected:
  void Done() override;

 private:
  // The object providing and possibly owning the `Reader` of frames.
  Dependency<Reader*, Src> src_;
};

// Support CTAD.
explicit ChunkRecordReader(Closed) -> ChunkRecordReader<>;
template <typename Src>
explicit ChunkRecordReader(Src src, ChunkAddress address,
                           ChunkRecordReaderBase::Options options =
                               ChunkRecordReaderBase::Options())
    -> ChunkRecordReader<Src>;
template <typename Src>
explicit ChunkRecordReader(Src src, absl::string_view identifier,
                           ChunkRecordReaderBase::Options options =
                               ChunkRecordReaderBase::Options())
    -> ChunkRecordReader<Src>;

// Implementation details follow.

inline ChunkRecordReaderBase::ChunkRecordReaderBase(
    ChunkRecordReaderBase&& that) noexcept
    : Object(static_cast<Object&&>(that)),
      address_(std::move(that.address_)),
      includes_keys_(that.includes_keys_),
      next_offset_(that.next_offset_),
      exhausted_(that.exhausted_),
      lookahead_(std::exchange(that.lookahead_, absl::nullopt)) {}

inline ChunkRecordReaderBase& ChunkRecordReaderBase::operator=(
    ChunkRecordReaderBase&& that) noexcept {
  Object::operator=(static_cast<Object&&>(that));
  address_ = std::move(that.address_);
  includes_keys_ = that.includes_keys_;
  next_offset_ = that.next_offset_;
  exhausted_ = that.exhausted_;
  lookahead_ = std::exchange(that.lookahead_, absl::nullopt);
  return *this;
}

inline void ChunkRecordReaderBase::Reset(Closed) {
  Object::Reset(kClosed);
  address_ = ChunkAddress();
  includes_keys_ = false;
  next_offset_ = 0;
  exhausted_ = false;
  lookahead_ = absl::nullopt;
}

inline void ChunkRecordReaderBase::Reset() {
  Object::Reset();
  address_ = ChunkAddress();
  includes_keys_ = false;
  next_offset_ = 0;
  exhausted_ = false;
  lookahead_ = absl::nullopt;
}

template <typename Src>
inline ChunkRecordReader<Src>::ChunkRecordReader(Src src, ChunkAddress address,
                                                 Options options)
    : src_(std::move(src)) {
  Initialize(src_.get(), std::move(address), options.includes_keys());
}

template <typename Src>
inline ChunkRecordReader<Src>::ChunkRecordReader(Src src,
                                                 absl::string_view identifier,
                                                 Options options)
    : src_(std::move(src)) {
  Initialize(src_.get(), identifier, options.includes_keys());
}

template <typename Src>
inline ChunkRecordReader<Src>::ChunkRecordReader(
    ChunkRecordReader&& that) noexcept
    : ChunkRecordReaderBase(static_cast<ChunkRecordReaderBase&&>(that)),
      src_(std::move(that.src_)) {}

template <typename Src>
inline ChunkRecordReader<Src>& ChunkRecordReader<Src>::operator=(
    ChunkRecordReader&& that) noexcept {
  ChunkRecordReaderBase::operator=(static_cast<ChunkRecordReaderBase&&>(that));
  src_ = std::move(that.src_);
  return *this;
}

template <typename Src>
inline void ChunkRecordReader<Src>::Reset(Closed) {
  ChunkRecordReaderBase::Reset(kClosed);
  src_.Reset();
}

template <typename Src>
inline void ChunkRecordReader<Src>::Reset(Src src, ChunkAddress address,
                                          Options options) {
  ChunkRecordReaderBase::Reset();
  src_.Reset(std::move(src));
  Initialize(src_.get(), std::move(address), options.includes_keys());
}

template <typename Src>
inline void ChunkRecordReader<Src>::Reset(Src src,
                                          absl::string_view identifier,
                                          Options options) {
  ChunkRecordReaderBase::Reset();
  src_.Reset(std::move(src));
  Initialize(src_.get(), identifier, options.includes_keys());
}

template <typename Src>
void ChunkRecordReader<Src>::Done() {
  ChunkRecordReaderBase::Done();
  if (src_.IsOwning()) {
    if (ABSL_PREDICT_FALSE(!src_->Close())) {
      FailWithoutAnnotation(src_->status());
    }
  }
}

}  // namespace chunkstream

#endif  // CHUNKSTREAM_RECORDS_CHUNK_RECORD_READER_H_
