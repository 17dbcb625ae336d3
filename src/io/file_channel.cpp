#include "split_source/channel.hpp"
#include "split_source/errors.hpp"

#include <cerrno>
#include <cstring>
#include <sys/types.h>

namespace ss {

static std::string errno_text(int e) { return std::strerror(e); }

FileChannel::FileChannel(std::string path) : path_(std::move(path)) {
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) {
    const int e = errno;
    if (e == ENOENT) throw NotFoundError("no such file: " + path_);
    throw IoError("open failed: " + path_ + ": " + errno_text(e));
  }
}

FileChannel::~FileChannel() { close(); }

std::size_t FileChannel::read(char* dst, std::size_t n) {
  if (!f_) throw IoError("read on closed channel: " + path_);
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got < n && std::ferror(f_)) {
    const int e = errno;
    throw IoError("read failed: " + path_ + ": " + errno_text(e));
  }
  pos_ += static_cast<std::int64_t>(got);
  return got;
}

void FileChannel::seek(std::int64_t offset) {
  if (!f_) throw IoError("seek on closed channel: " + path_);
  if (offset < 0) throw IoError("negative seek on " + path_);
  if (::fseeko(f_, static_cast<off_t>(offset), SEEK_SET) != 0) {
    const int e = errno;
    throw IoError("seek failed: " + path_ + ": " + errno_text(e));
  }
  pos_ = offset;
}

void FileChannel::close() {
  if (f_) { std::fclose(f_); f_ = nullptr; }
}

}
