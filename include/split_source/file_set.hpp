#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace ss {

struct MatchedFile {
  std::string path;
  std::int64_t size_bytes = 0;
};

// Expand a literal path or a glob pattern through the channel registry.
// Literal: exactly one file, NotFoundError if missing. Pattern: zero or more
// files sorted by path. Nothing is cached between calls.
std::vector<MatchedFile> resolve_file_set(const std::string& path_or_pattern, bool is_pattern);

std::int64_t total_size_bytes(const std::vector<MatchedFile>& files);

}
