#include "split_source/file_set.hpp"
#include "split_source/channel_provider.hpp"

#include <algorithm>

namespace ss {

std::vector<MatchedFile> resolve_file_set(const std::string& path_or_pattern, bool is_pattern) {
  auto& reg = ChannelRegistry::instance();
  std::vector<MatchedFile> out;

  if (!is_pattern) {
    auto provider = reg.provider_for(path_or_pattern);
    out.push_back(MatchedFile{path_or_pattern, provider->size_of(path_or_pattern)});
    return out;
  }

  // Matched paths may live under another scheme than the pattern itself
  // (e.g. a synthetic scheme expanding to local files), so size each one
  // through its own provider.
  std::vector<std::string> paths = reg.provider_for(path_or_pattern)->match(path_or_pattern);
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

  out.reserve(paths.size());
  for (auto& p : paths) {
    std::int64_t sz = reg.provider_for(p)->size_of(p);
    out.push_back(MatchedFile{std::move(p), sz});
  }
  return out;
}

std::int64_t total_size_bytes(const std::vector<MatchedFile>& files) {
  std::int64_t sum = 0;
  for (const auto& f : files) sum += f.size_bytes;
  return sum;
}

}
