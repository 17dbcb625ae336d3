#pragma once
// Fixture helpers shared by the split-source test executables.
#include "split_source/channel.hpp"
#include "split_source/channel_provider.hpp"
#include "split_source/errors.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <random>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace ss_test {

namespace fs = std::filesystem;

inline int& failures() { static int n = 0; return n; }

// Prints "[FAIL] <message>" when ok is false; the message is streamed in:
//   ss_test::expect(n == 3) << "got " << n;
class Expectation {
public:
  explicit Expectation(bool ok) : ok_(ok) {}
  Expectation(const Expectation&) = delete;
  Expectation& operator=(const Expectation&) = delete;
  ~Expectation() {
    if (ok_) return;
    std::cerr << "[FAIL] " << msg_.str() << "\n";
    ++failures();
  }

  template <typename V>
  Expectation& operator<<(const V& v) {
    if (!ok_) msg_ << v;
    return *this;
  }

private:
  bool ok_;
  std::ostringstream msg_;
};

inline Expectation expect(bool ok) { return Expectation(ok); }

// Runs f and checks that it throws Error.
template <typename Error, typename F>
void expect_throw(F&& f, const char* what) {
  bool thrown = false;
  try { f(); } catch (const Error&) { thrown = true; }
  expect(thrown) << what << " did not throw";
}

inline int finish(const char* name) {
  if (failures() != 0) {
    std::cerr << "[FAIL] " << name << ": " << failures() << " check(s) failed\n";
    return 1;
  }
  std::cout << "[PASS] " << name << "\n";
  return 0;
}

// Fresh, empty directory under the system temp dir.
inline fs::path make_dir(const std::string& name) {
  auto d = fs::temp_directory_path() /
           ("split_source_" + name + "_" + std::to_string(::getpid()));
  fs::remove_all(d);
  fs::create_directories(d);
  return d;
}

// Lowercase strings of fixed length; never contain '<', '\n' or '\r'.
inline std::vector<std::string> random_lines(std::size_t n, std::size_t len, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 25);
  std::vector<std::string> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    std::string s(len, 'a');
    for (auto& c : s) c = static_cast<char>('a' + dist(rng));
    out.push_back(std::move(s));
  }
  return out;
}

// `blocks` groups of marker + `per_block` random lines.
inline std::vector<std::string> header_lines(std::size_t blocks, std::size_t per_block,
                                             const std::string& marker, std::uint32_t seed) {
  std::vector<std::string> out;
  auto data = random_lines(blocks * per_block, 3, seed);
  for (std::size_t b = 0; b < blocks; ++b) {
    out.push_back(marker);
    for (std::size_t i = 0; i < per_block; ++i) out.push_back(data[b * per_block + i]);
  }
  return out;
}

inline fs::path write_lines(const fs::path& dir, const std::string& name,
                            const std::vector<std::string>& lines) {
  auto p = dir / name;
  std::ofstream o(p, std::ios::binary | std::ios::trunc);
  for (const auto& l : lines) o << l << '\n';
  return p;
}

inline std::vector<std::string> slice(const std::vector<std::string>& v, std::size_t from,
                                      std::size_t to) {
  return std::vector<std::string>(v.begin() + static_cast<std::ptrdiff_t>(from),
                                  v.begin() + static_cast<std::ptrdiff_t>(to));
}

inline std::vector<std::string> without(std::vector<std::string> v, const std::string& marker) {
  v.erase(std::remove(v.begin(), v.end(), marker), v.end());
  return v;
}

inline std::vector<std::string> sorted(std::vector<std::string> v) {
  std::sort(v.begin(), v.end());
  return v;
}

// In-memory channel; optionally fails once `fail_at` bytes have been served
// and counts close() calls.
class MemoryChannel : public ss::SeekableChannel {
public:
  MemoryChannel(std::string data, std::shared_ptr<int> closes, std::int64_t fail_at = -1)
    : data_(std::move(data)), closes_(std::move(closes)), fail_at_(fail_at) {}
  ~MemoryChannel() override { close(); }

  std::size_t read(char* dst, std::size_t n) override {
    if (closed_) throw ss::IoError("read on closed memory channel");
    if (fail_at_ >= 0 && pos_ >= fail_at_) throw ss::IoError("injected read failure");
    std::size_t avail = pos_ < static_cast<std::int64_t>(data_.size())
                          ? data_.size() - static_cast<std::size_t>(pos_) : 0;
    std::size_t k = std::min(n, avail);
    if (fail_at_ >= 0) k = std::min<std::size_t>(k, static_cast<std::size_t>(fail_at_ - pos_));
    std::copy_n(data_.data() + pos_, k, dst);
    pos_ += static_cast<std::int64_t>(k);
    return k;
  }
  std::int64_t position() const override { return pos_; }
  void seek(std::int64_t offset) override { pos_ = offset; }
  void close() override {
    if (closed_) return;
    closed_ = true;
    if (closes_) ++*closes_;
  }

private:
  std::string data_;
  std::shared_ptr<int> closes_;
  std::int64_t fail_at_;
  std::int64_t pos_{0};
  bool closed_{false};
};

// Provider for a synthetic scheme serving fixed in-memory files.
class MemoryProvider : public ss::ChannelProvider {
public:
  void add(const std::string& path, std::string data) { files_.emplace_back(path, std::move(data)); }
  void fail_reads_at(std::int64_t offset) { fail_at_ = offset; }
  std::shared_ptr<int> closes() const { return closes_; }

  std::vector<std::string> match(const std::string&) const override {
    std::vector<std::string> out;
    for (const auto& f : files_) out.push_back(f.first);
    return out;
  }
  std::int64_t size_of(const std::string& path) const override {
    return static_cast<std::int64_t>(find(path).size());
  }
  std::unique_ptr<ss::SeekableChannel> open_for_read(const std::string& path) const override {
    return std::make_unique<MemoryChannel>(find(path), closes_, fail_at_);
  }

private:
  const std::string& find(const std::string& path) const {
    for (const auto& f : files_) if (f.first == path) return f.second;
    throw ss::NotFoundError("no such memory file: " + path);
  }

  std::vector<std::pair<std::string, std::string>> files_;
  std::shared_ptr<int> closes_ = std::make_shared<int>(0);
  std::int64_t fail_at_{-1};
};

}
