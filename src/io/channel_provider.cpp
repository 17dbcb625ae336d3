#include "split_source/channel_provider.hpp"
#include "split_source/errors.hpp"
#include "split_source/path_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <glob.h>
#include <system_error>

namespace ss {

namespace fs = std::filesystem;

std::unique_ptr<SeekableChannel>
ChannelProvider::open_seekable_for_read(const std::string& path, std::int64_t start) const {
  auto ch = open_for_read(path);
  if (start > 0) ch->seek(start);
  return ch;
}

std::vector<std::string> LocalChannelProvider::match(const std::string& pattern) const {
  const std::string local = strip_local_scheme(pattern);
  std::vector<std::string> out;

  if (!is_glob_pattern(local)) {
    std::error_code ec;
    if (fs::is_regular_file(local, ec)) out.push_back(local);
    return out;
  }

  glob_t g{};
  const int rc = ::glob(local.c_str(), 0, nullptr, &g);
  if (rc == GLOB_NOMATCH) { ::globfree(&g); return out; }
  if (rc != 0) {
    ::globfree(&g);
    throw IoError("glob failed for pattern: " + pattern);
  }
  out.reserve(g.gl_pathc);
  for (std::size_t i = 0; i < g.gl_pathc; ++i) {
    std::error_code ec;
    if (fs::is_regular_file(g.gl_pathv[i], ec)) out.emplace_back(g.gl_pathv[i]);
  }
  ::globfree(&g);
  std::sort(out.begin(), out.end());
  return out;
}

std::int64_t LocalChannelProvider::size_of(const std::string& path) const {
  const std::string local = strip_local_scheme(path);
  std::error_code ec;
  auto st = fs::status(local, ec);
  if (ec || !fs::exists(st)) throw NotFoundError("no such file: " + path);
  if (!fs::is_regular_file(st)) throw IoError("not a regular file: " + path);
  auto n = fs::file_size(local, ec);
  if (ec) throw IoError("stat failed: " + path + ": " + ec.message());
  return static_cast<std::int64_t>(n);
}

std::unique_ptr<SeekableChannel> LocalChannelProvider::open_for_read(const std::string& path) const {
  return std::make_unique<FileChannel>(strip_local_scheme(path));
}

ChannelRegistry& ChannelRegistry::instance() {
  static ChannelRegistry reg;
  return reg;
}

void ChannelRegistry::init_defaults() {
  register_provider(std::string(kLocalScheme), std::make_shared<LocalChannelProvider>());
}

void ChannelRegistry::register_provider(const std::string& scheme,
                                        std::shared_ptr<const ChannelProvider> p) {
  if (scheme.empty() || !p) throw ConfigError("register_provider: empty scheme or provider");
  std::lock_guard<std::mutex> lk(mu_);
  providers_[scheme] = std::move(p);
}

void ChannelRegistry::unregister_provider(const std::string& scheme) {
  std::lock_guard<std::mutex> lk(mu_);
  providers_.erase(scheme);
}

void ChannelRegistry::teardown() {
  std::lock_guard<std::mutex> lk(mu_);
  providers_.clear();
}

bool ChannelRegistry::has_scheme(const std::string& scheme) const {
  std::lock_guard<std::mutex> lk(mu_);
  return providers_.count(scheme) != 0;
}

std::shared_ptr<const ChannelProvider> ChannelRegistry::provider_for(std::string_view path) const {
  const std::string scheme = scheme_of(path);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = providers_.find(scheme);
  if (it == providers_.end())
    throw ConfigError("no channel provider registered for scheme '" + scheme + "'");
  return it->second;
}

}
