#pragma once
#include "split_source/channel.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ss {

// Filesystem capability for one path scheme.
class ChannelProvider {
public:
  virtual ~ChannelProvider() = default;

  // Existing regular files denoted by a pattern (or literal path). Order is
  // implementation-defined; an empty result is not an error.
  virtual std::vector<std::string> match(const std::string& pattern) const = 0;

  // Byte size; NotFoundError if the path does not exist.
  virtual std::int64_t size_of(const std::string& path) const = 0;

  virtual std::unique_ptr<SeekableChannel> open_for_read(const std::string& path) const = 0;

  // Default: open_for_read() followed by seek(start).
  virtual std::unique_ptr<SeekableChannel> open_seekable_for_read(const std::string& path,
                                                                  std::int64_t start) const;
};

// Local disk. Accepts bare paths and "file://" paths; patterns use glob(3).
class LocalChannelProvider : public ChannelProvider {
public:
  std::vector<std::string> match(const std::string& pattern) const override;
  std::int64_t size_of(const std::string& path) const override;
  std::unique_ptr<SeekableChannel> open_for_read(const std::string& path) const override;
};

// Process-wide scheme -> provider table. Must be initialized before any
// resolver/estimator call; an unknown scheme is a ConfigError.
class ChannelRegistry {
public:
  static ChannelRegistry& instance();

  // Registers the local provider under "file".
  void init_defaults();
  void register_provider(const std::string& scheme, std::shared_ptr<const ChannelProvider> p);
  void unregister_provider(const std::string& scheme);
  // Drops every provider.
  void teardown();

  bool has_scheme(const std::string& scheme) const;
  std::shared_ptr<const ChannelProvider> provider_for(std::string_view path) const;

private:
  ChannelRegistry() = default;

  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<const ChannelProvider>> providers_;
};

// Registry initialized for the lifetime of the object.
class ScopedChannelRegistry {
public:
  ScopedChannelRegistry() { ChannelRegistry::instance().init_defaults(); }
  ~ScopedChannelRegistry() { ChannelRegistry::instance().teardown(); }

  ScopedChannelRegistry(const ScopedChannelRegistry&) = delete;
  ScopedChannelRegistry& operator=(const ScopedChannelRegistry&) = delete;
};

}
