#pragma once
#include "split_source/file_set.hpp"
#include "split_source/source_descriptor.hpp"

#include <cstdint>
#include <vector>

namespace ss {

// Sum of matched file sizes for whole-file/pattern descriptors; range length
// (clipped to the file size when unbounded) for sub-ranges.
std::int64_t estimated_size_bytes(const SourceDescriptor& d);

// Byte-range shards of every file the descriptor denotes. Within a file the
// shards are ascending, contiguous and cover the file (or the descriptor's
// range) exactly; boundaries are arithmetic and need not fall on records.
std::vector<SourceDescriptor> split_into_shards(const SourceDescriptor& d,
                                                std::int64_t desired_shard_size_bytes);

// Shard boundaries for one byte range [lo, hi); exposed for the planner tests.
std::vector<std::int64_t> shard_boundaries(std::int64_t lo, std::int64_t hi,
                                           std::int64_t desired_shard_size_bytes,
                                           std::int64_t min_shard_size_bytes);

}
