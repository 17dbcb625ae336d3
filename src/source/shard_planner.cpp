#include "split_source/shard_planner.hpp"
#include "split_source/errors.hpp"

#include <algorithm>
#include <cmath>

namespace ss {

std::int64_t estimated_size_bytes(const SourceDescriptor& d) {
  if (d.mode() == SourceMode::WholeFileOrPattern || d.mode() == SourceMode::SingleFile)
    return total_size_bytes(resolve_file_set(d.path_or_pattern(), d.is_pattern()));

  if (d.has_bounded_end()) return d.end_offset() - d.start_offset();
  auto files = resolve_file_set(d.path_or_pattern(), false);
  return std::max<std::int64_t>(0, files.front().size_bytes - d.start_offset());
}

std::vector<std::int64_t> shard_boundaries(std::int64_t lo, std::int64_t hi,
                                           std::int64_t desired_shard_size_bytes,
                                           std::int64_t min_shard_size_bytes) {
  if (desired_shard_size_bytes <= 0) throw InvalidRangeError("desired shard size must be positive");
  std::vector<std::int64_t> b;
  const std::int64_t len = hi - lo;
  if (len <= 0) return b;

  const std::int64_t eff = std::max(desired_shard_size_bytes, min_shard_size_bytes);
  std::int64_t n = static_cast<std::int64_t>(
      std::llround(static_cast<long double>(len) / static_cast<long double>(eff)));
  n = std::max<std::int64_t>(1, std::min(n, len));

  // Spread the remainder over the first shards so sizes differ by at most one byte.
  const std::int64_t base = len / n;
  const std::int64_t rem = len % n;
  b.reserve(static_cast<std::size_t>(n) + 1);
  for (std::int64_t i = 0; i <= n; ++i) b.push_back(lo + i * base + std::min(i, rem));
  return b;
}

std::vector<SourceDescriptor> split_into_shards(const SourceDescriptor& d,
                                                std::int64_t desired_shard_size_bytes) {
  if (desired_shard_size_bytes <= 0) throw InvalidRangeError("desired shard size must be positive");

  std::vector<SourceDescriptor> out;
  for (const auto& f : resolve_file_set(d.path_or_pattern(), d.is_pattern())) {
    std::int64_t lo = 0, hi = f.size_bytes;
    if (d.mode() == SourceMode::SubrangeOfSingleFile) {
      lo = std::min(d.start_offset(), f.size_bytes);
      hi = std::min(d.end_offset(), f.size_bytes);
    }
    auto b = shard_boundaries(lo, hi, desired_shard_size_bytes, d.min_shard_size_bytes());
    for (std::size_t i = 0; i + 1 < b.size(); ++i)
      out.push_back(d.for_subrange_of_file(f.path, b[i], b[i + 1]));
  }
  return out;
}

}
