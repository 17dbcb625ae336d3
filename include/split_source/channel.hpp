#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

namespace ss {

// Forward-reading byte channel that can be repositioned.
// Implementations throw IoError on failure; read() returns 0 only at end of channel.
class SeekableChannel {
public:
  virtual ~SeekableChannel() = default;

  virtual std::size_t read(char* dst, std::size_t n) = 0;
  virtual std::int64_t position() const = 0;
  virtual void seek(std::int64_t offset) = 0;

  // Idempotent; the destructor of every implementation calls it too.
  virtual void close() = 0;
};

// stdio-backed channel over a local file.
class FileChannel : public SeekableChannel {
public:
  explicit FileChannel(std::string path);
  ~FileChannel() override;

  FileChannel(const FileChannel&) = delete;
  FileChannel& operator=(const FileChannel&) = delete;

  std::size_t read(char* dst, std::size_t n) override;
  std::int64_t position() const override { return pos_; }
  void seek(std::int64_t offset) override;
  void close() override;

  const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  std::FILE* f_{nullptr};
  std::int64_t pos_{0};
};

}
