#include "split_source/source_descriptor.hpp"
#include "split_source/errors.hpp"

#include <sstream>

namespace ss {

const char* to_string(SourceMode m) noexcept {
  switch (m) {
    case SourceMode::WholeFileOrPattern:   return "whole_file_or_pattern";
    case SourceMode::SingleFile:           return "single_file";
    case SourceMode::SubrangeOfSingleFile: return "subrange_of_single_file";
  }
  return "unknown";
}

SourceDescriptor::SourceDescriptor(bool is_pattern, std::string path, std::int64_t min_shard,
                                   std::int64_t start, std::int64_t end, SourceMode mode)
  : is_pattern_(is_pattern), path_(std::move(path)), min_shard_(min_shard),
    start_(start), end_(end), mode_(mode) {
  if (path_.empty()) throw InvalidRangeError("empty path or pattern");
  if (min_shard_ < 0) throw InvalidRangeError("negative minimum shard size");
  if (start_ < 0 || end_ < 0) throw InvalidRangeError("negative offset in " + to_string());
  if (start_ > end_) throw InvalidRangeError("start after end in " + to_string());
  if (is_pattern_ && (start_ != 0 || end_ != kUnboundedOffset))
    throw InvalidRangeError("a pattern cannot carry a byte range: " + path_);
}

SourceDescriptor SourceDescriptor::whole(std::string path_or_pattern, bool is_pattern,
                                         std::int64_t min_shard_size_bytes) {
  return SourceDescriptor(is_pattern, std::move(path_or_pattern), min_shard_size_bytes,
                          0, kUnboundedOffset, SourceMode::WholeFileOrPattern);
}

SourceDescriptor SourceDescriptor::single_file(std::string path, std::int64_t min_shard_size_bytes) {
  return SourceDescriptor(false, std::move(path), min_shard_size_bytes,
                          0, kUnboundedOffset, SourceMode::SingleFile);
}

SourceDescriptor SourceDescriptor::subrange(std::string path, std::int64_t min_shard_size_bytes,
                                            std::int64_t start_offset, std::int64_t end_offset) {
  return SourceDescriptor(false, std::move(path), min_shard_size_bytes,
                          start_offset, end_offset, SourceMode::SubrangeOfSingleFile);
}

SourceDescriptor SourceDescriptor::for_subrange_of_file(const std::string& path,
                                                        std::int64_t start,
                                                        std::int64_t end) const {
  return subrange(path, min_shard_, start, end);
}

std::pair<SourceDescriptor, SourceDescriptor> SourceDescriptor::split_at(std::int64_t offset) const {
  if (is_pattern_) throw InvalidRangeError("cannot split a pattern at a byte offset: " + path_);
  if (offset <= start_ || offset >= end_) {
    std::ostringstream o;
    o << "split offset " << offset << " outside (" << start_ << ", " << end_ << ")";
    throw InvalidRangeError(o.str());
  }
  return {subrange(path_, min_shard_, start_, offset), subrange(path_, min_shard_, offset, end_)};
}

std::string SourceDescriptor::to_string() const {
  std::ostringstream o;
  o << (is_pattern_ ? "pattern " : "file ") << path_ << " [" << start_ << ", ";
  if (end_ == kUnboundedOffset) o << "eof"; else o << end_;
  o << ")";
  return o.str();
}

}
