#pragma once
#include "split_source/boundary_policy.hpp"
#include "split_source/errors.hpp"
#include "split_source/line_scanner.hpp"
#include "split_source/record_decoder.hpp"
#include "split_source/record_reader.hpp"
#include "split_source/shard_planner.hpp"
#include "split_source/source_descriptor.hpp"

#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace ss {

// A descriptor plus everything needed to read it: the record decoder, the
// record-boundary policy and the scanner settings. Cheap to copy; decoder and
// policy are shared, immutable and thread-safe.
template <typename T>
class FileBasedSource {
public:
  FileBasedSource(SourceDescriptor d,
                  std::shared_ptr<const RecordDecoder<T>> decoder,
                  std::shared_ptr<const BoundaryPolicy> policy = std::make_shared<LineBoundary>(),
                  LineScanner::Config cfg = {})
    : desc_(std::move(d)), decoder_(std::move(decoder)), policy_(std::move(policy)), cfg_(cfg) {
    if (!decoder_) throw ConfigError("source needs a record decoder");
    if (!policy_) throw ConfigError("source needs a boundary policy");
  }

  const SourceDescriptor& descriptor() const noexcept { return desc_; }
  const BoundaryPolicy& policy() const noexcept { return *policy_; }

  std::int64_t estimated_size_bytes() const { return ss::estimated_size_bytes(desc_); }

  // Same decoder, policy and settings over another descriptor.
  FileBasedSource with_descriptor(SourceDescriptor d) const {
    return FileBasedSource(std::move(d), decoder_, policy_, cfg_);
  }

  std::vector<FileBasedSource> split_into_shards(std::int64_t desired_shard_size_bytes) const {
    std::vector<FileBasedSource> out;
    for (auto& d : ss::split_into_shards(desc_, desired_shard_size_bytes))
      out.push_back(with_descriptor(std::move(d)));
    return out;
  }

  // Primary and residual sources around a split offset (see SourceDescriptor::split_at).
  std::pair<FileBasedSource, FileBasedSource> split_at(std::int64_t offset) const {
    auto halves = desc_.split_at(offset);
    return {with_descriptor(std::move(halves.first)), with_descriptor(std::move(halves.second))};
  }

  std::unique_ptr<Reader<T>> create_reader() const {
    if (desc_.mode() == SourceMode::WholeFileOrPattern)
      return std::make_unique<FileSetReader<T>>(desc_, decoder_, policy_, cfg_);
    return std::make_unique<SingleFileReader<T>>(desc_, decoder_, policy_, cfg_);
  }

  std::unique_ptr<SingleFileReader<T>> create_single_file_reader() const {
    return std::make_unique<SingleFileReader<T>>(desc_, decoder_, policy_, cfg_);
  }

private:
  SourceDescriptor desc_;
  std::shared_ptr<const RecordDecoder<T>> decoder_;
  std::shared_ptr<const BoundaryPolicy> policy_;
  LineScanner::Config cfg_;
};

// Drain a reader into a vector.
template <typename T>
std::vector<T> read_all(Reader<T>& r) {
  std::vector<T> out;
  for (bool ok = r.start(); ok; ok = r.advance()) out.push_back(r.current());
  return out;
}

}
