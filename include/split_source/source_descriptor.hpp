#pragma once
#include <cstdint>
#include <limits>
#include <string>
#include <utility>

namespace ss {

// End offset meaning "to the end of the file".
inline constexpr std::int64_t kUnboundedOffset = std::numeric_limits<std::int64_t>::max();

enum class SourceMode { WholeFileOrPattern, SingleFile, SubrangeOfSingleFile };

const char* to_string(SourceMode m) noexcept;

// Immutable description of one unit of schedulable work.
// Narrowing and splitting always build new descriptors.
class SourceDescriptor {
public:
  // Whole literal file, or every file matched by a pattern.
  static SourceDescriptor whole(std::string path_or_pattern, bool is_pattern,
                                std::int64_t min_shard_size_bytes);
  static SourceDescriptor pattern(std::string pattern, std::int64_t min_shard_size_bytes) {
    return whole(std::move(pattern), true, min_shard_size_bytes);
  }
  static SourceDescriptor file(std::string path, std::int64_t min_shard_size_bytes) {
    return whole(std::move(path), false, min_shard_size_bytes);
  }
  // One matched file read in full through a single-file reader.
  static SourceDescriptor single_file(std::string path, std::int64_t min_shard_size_bytes);
  // Explicit byte range [start, end) of one file.
  static SourceDescriptor subrange(std::string path, std::int64_t min_shard_size_bytes,
                                   std::int64_t start_offset, std::int64_t end_offset);

  bool is_pattern() const noexcept { return is_pattern_; }
  const std::string& path_or_pattern() const noexcept { return path_; }
  std::int64_t min_shard_size_bytes() const noexcept { return min_shard_; }
  std::int64_t start_offset() const noexcept { return start_; }
  std::int64_t end_offset() const noexcept { return end_; }
  bool has_bounded_end() const noexcept { return end_ != kUnboundedOffset; }
  SourceMode mode() const noexcept { return mode_; }

  // New SubrangeOfSingleFile descriptor for one file, same minimum shard size.
  SourceDescriptor for_subrange_of_file(const std::string& path, std::int64_t start,
                                        std::int64_t end) const;

  // Primary [start, offset) and residual [offset, end). Requires a
  // non-pattern descriptor and start < offset < end.
  std::pair<SourceDescriptor, SourceDescriptor> split_at(std::int64_t offset) const;

  std::string to_string() const;

  friend bool operator==(const SourceDescriptor& a, const SourceDescriptor& b) {
    return a.is_pattern_ == b.is_pattern_ && a.path_ == b.path_ && a.min_shard_ == b.min_shard_ &&
           a.start_ == b.start_ && a.end_ == b.end_ && a.mode_ == b.mode_;
  }
  friend bool operator!=(const SourceDescriptor& a, const SourceDescriptor& b) { return !(a == b); }

private:
  SourceDescriptor(bool is_pattern, std::string path, std::int64_t min_shard,
                   std::int64_t start, std::int64_t end, SourceMode mode);

  bool is_pattern_;
  std::string path_;
  std::int64_t min_shard_;
  std::int64_t start_;
  std::int64_t end_;
  SourceMode mode_;
};

}
