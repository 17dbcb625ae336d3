#pragma once
#include "split_source/boundary_policy.hpp"
#include "split_source/errors.hpp"
#include "split_source/file_set.hpp"
#include "split_source/range_cursor.hpp"
#include "split_source/record_decoder.hpp"
#include "split_source/source_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace ss {

// Forward-only cursor over the records of one source.
//
//   for (bool ok = r->start(); ok; ok = r->advance()) use(r->current());
//
// Single owner, not re-entrant, not restartable. Accessors throw
// IllegalStateError before a successful start()/advance() and after exhaustion.
template <typename T>
class Reader {
public:
  virtual ~Reader() = default;

  virtual bool start() = 0;
  virtual bool advance() = 0;

  virtual const T& current() const = 0;
  virtual std::int64_t current_offset() const = 0;
  virtual bool is_at_split_point() const = 0;
};

// Records of one file range: byte-offset adjustment, policy skip, range end.
template <typename T>
class SingleFileReader final : public Reader<T> {
public:
  SingleFileReader(SourceDescriptor d,
                   std::shared_ptr<const RecordDecoder<T>> decoder,
                   std::shared_ptr<const BoundaryPolicy> policy,
                   LineScanner::Config cfg = {})
    : cursor_(std::move(d), std::move(policy), cfg), decoder_(std::move(decoder)) {
    if (!decoder_) throw ConfigError("reader needs a record decoder");
  }

  bool start() override { return decode_if(cursor_.start()); }
  bool advance() override { return decode_if(cursor_.advance()); }

  const T& current() const override {
    if (!value_) throw IllegalStateError("current() called without a current record");
    return *value_;
  }
  std::int64_t current_offset() const override { return cursor_.current_offset(); }
  bool is_at_split_point() const override { return cursor_.is_at_split_point(); }

  std::int64_t next_offset() const { return cursor_.next_offset(); }
  std::int64_t split_offset() const { return cursor_.split_offset(); }
  const SourceDescriptor& descriptor() const noexcept { return cursor_.descriptor(); }
  std::uint64_t bytes_read() const noexcept { return cursor_.bytes_read(); }

private:
  // A DecodeError leaves the reader positioned after the bad record with no
  // current value.
  bool decode_if(bool available) {
    value_.reset();
    if (!available) return false;
    value_.emplace(decoder_->decode(cursor_.current().bytes));
    return true;
  }

  RangeCursor cursor_;
  std::shared_ptr<const RecordDecoder<T>> decoder_;
  std::optional<T> value_;
};

// Every file of a whole-file or pattern descriptor, one after the other in
// resolver order. Offsets are relative to the file being read.
template <typename T>
class FileSetReader final : public Reader<T> {
public:
  FileSetReader(SourceDescriptor d,
                std::shared_ptr<const RecordDecoder<T>> decoder,
                std::shared_ptr<const BoundaryPolicy> policy,
                LineScanner::Config cfg = {})
    : desc_(std::move(d)), decoder_(std::move(decoder)), policy_(std::move(policy)), cfg_(cfg) {}

  bool start() override {
    if (started_) throw IllegalStateError("start() called twice on " + desc_.to_string());
    started_ = true;
    files_ = resolve_file_set(desc_.path_or_pattern(), desc_.is_pattern());
    next_ = 0;
    return open_next();
  }

  bool advance() override {
    if (!started_) throw IllegalStateError("advance() before start() on " + desc_.to_string());
    if (failed_ || !cur_) return false;
    if (guarded([this] { return cur_->advance(); })) return true;
    bytes_ += cur_->bytes_read();
    cur_.reset();
    return open_next();
  }

  const T& current() const override { return live().current(); }
  std::int64_t current_offset() const override { return live().current_offset(); }
  bool is_at_split_point() const override { return live().is_at_split_point(); }

  std::uint64_t bytes_read() const noexcept { return bytes_ + (cur_ ? cur_->bytes_read() : 0); }

private:
  const SingleFileReader<T>& live() const {
    if (failed_ || !cur_) throw IllegalStateError("no current record on " + desc_.to_string());
    return *cur_;
  }

  // A read failure ends the whole file set; a bad record does not.
  template <typename F>
  bool guarded(F&& f) {
    try {
      return f();
    } catch (const DecodeError&) {
      throw;
    } catch (...) {
      failed_ = true;
      if (cur_) bytes_ += cur_->bytes_read();
      cur_.reset();
      throw;
    }
  }

  bool open_next() {
    while (next_ < files_.size()) {
      const MatchedFile& f = files_[next_++];
      if (f.size_bytes == 0) continue;
      cur_ = std::make_unique<SingleFileReader<T>>(
          SourceDescriptor::single_file(f.path, desc_.min_shard_size_bytes()), decoder_, policy_, cfg_);
      if (guarded([this] { return cur_->start(); })) return true;
      bytes_ += cur_->bytes_read();
      cur_.reset();
    }
    return false;
  }

  SourceDescriptor desc_;
  std::shared_ptr<const RecordDecoder<T>> decoder_;
  std::shared_ptr<const BoundaryPolicy> policy_;
  LineScanner::Config cfg_;

  bool started_{false};
  bool failed_{false};
  std::vector<MatchedFile> files_;
  std::size_t next_{0};
  std::unique_ptr<SingleFileReader<T>> cur_;
  std::uint64_t bytes_{0};
};

}
