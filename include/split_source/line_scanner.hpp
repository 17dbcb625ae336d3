#pragma once
#include "split_source/channel.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace ss {

// One delimited record as found in the byte stream.
struct RawRecord {
  std::string bytes;            // delimiter excluded
  std::int64_t offset = 0;      // first byte of the record
  std::int64_t next_offset = 0; // first byte after the delimiter
};

// Scans a channel for delimiter-terminated records through a fixed-size
// read-ahead buffer. Offsets are absolute channel positions.
class LineScanner {
public:
  struct Config {
    std::size_t buffer_bytes     = 64 * 1024;       // 64 KiB read-ahead
    std::size_t max_record_bytes = 8 * 1024 * 1024; // 8 MiB guard per record
    char        delimiter        = '\n';
    bool        strip_cr         = true;            // trim trailing '\r' (CRLF)
  };

  explicit LineScanner(std::unique_ptr<SeekableChannel> ch);   // uses default Config{}
  LineScanner(std::unique_ptr<SeekableChannel> ch, Config cfg);
  ~LineScanner();

  LineScanner(const LineScanner&) = delete;
  LineScanner& operator=(const LineScanner&) = delete;

  // False at end of channel with zero bytes since the last delimiter.
  // A final record without delimiter is returned. Throws IoError.
  bool read_next(RawRecord& out);

  // Offset of the next unread byte.
  std::int64_t position() const noexcept;
  std::uint64_t bytes_read() const noexcept;

  // Releases the channel; later reads report end of channel.
  void close();
  bool is_open() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
