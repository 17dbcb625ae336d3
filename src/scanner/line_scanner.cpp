#include "split_source/line_scanner.hpp"
#include "split_source/errors.hpp"

#include <cstring>
#include <vector>

namespace ss {

struct LineScanner::Impl {
  std::unique_ptr<SeekableChannel> ch;
  Config cfg;
  std::vector<char> buf;
  std::size_t head{0};
  std::size_t tail{0};
  std::int64_t pos{0};   // absolute offset of buf[head]
  std::uint64_t bytes{0};
  bool eof{false};

  Impl(std::unique_ptr<SeekableChannel> c, Config k)
    : ch(std::move(c)), cfg(k), buf(k.buffer_bytes == 0 ? 1 : k.buffer_bytes) {
    pos = ch ? ch->position() : 0;
    eof = !ch;
  }

  bool fill() {
    if (eof) return false;
    std::size_t n = ch->read(buf.data(), buf.size());
    head = 0;
    tail = n;
    bytes += n;
    if (n == 0) { eof = true; return false; }
    return true;
  }

  bool read_next(RawRecord& out) {
    out.bytes.clear();
    out.offset = pos;

    std::size_t consumed = 0;
    while (true) {
      if (head == tail && !fill()) break;

      const char* b = buf.data() + head;
      const std::size_t avail = tail - head;
      const void* hit = std::memchr(b, cfg.delimiter, avail);
      const std::size_t take = hit ? static_cast<std::size_t>(static_cast<const char*>(hit) - b)
                                   : avail;

      if (out.bytes.size() + take > cfg.max_record_bytes)
        throw IoError("record at offset " + std::to_string(out.offset) +
                      " exceeds max_record_bytes=" + std::to_string(cfg.max_record_bytes));

      out.bytes.append(b, take);
      head += take;
      consumed += take;
      if (hit) { ++head; ++consumed; break; }
    }

    pos += static_cast<std::int64_t>(consumed);
    out.next_offset = pos;
    if (consumed == 0) return false;

    if (cfg.strip_cr && !out.bytes.empty() && out.bytes.back() == '\r') out.bytes.pop_back();
    return true;
  }
};

LineScanner::LineScanner(std::unique_ptr<SeekableChannel> ch)
  : LineScanner(std::move(ch), Config{}) {}

LineScanner::LineScanner(std::unique_ptr<SeekableChannel> ch, Config cfg)
  : p_(new Impl(std::move(ch), cfg)) {}

LineScanner::~LineScanner() { delete p_; }

bool LineScanner::read_next(RawRecord& out) { return p_->read_next(out); }
std::int64_t LineScanner::position() const noexcept { return p_->pos; }
std::uint64_t LineScanner::bytes_read() const noexcept { return p_->bytes; }

void LineScanner::close() {
  if (p_->ch) { p_->ch->close(); p_->ch.reset(); }
  p_->eof = true;
  p_->head = p_->tail = 0;
}

bool LineScanner::is_open() const noexcept { return static_cast<bool>(p_->ch); }

}
