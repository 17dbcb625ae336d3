#include "split_source/errors.hpp"
#include "split_source/line_scanner.hpp"
#include "test_support.hpp"

namespace {

std::unique_ptr<ss::SeekableChannel> mem(std::string data, std::shared_ptr<int> closes = nullptr) {
  return std::make_unique<ss_test::MemoryChannel>(std::move(data), std::move(closes));
}

}

int main() {
  // Read-ahead buffer smaller than the records; unterminated final record.
  {
    ss::LineScanner::Config cfg;
    cfg.buffer_bytes = 3;
    ss::LineScanner s(mem("abc\nde\n\nxyz"), cfg);
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "abc" && r.offset == 0 && r.next_offset == 4)
        << "first";
    ss_test::expect(s.read_next(r) && r.bytes == "de" && r.offset == 4 && r.next_offset == 7)
        << "second";
    ss_test::expect(s.read_next(r) && r.bytes.empty() && r.offset == 7 && r.next_offset == 8)
        << "empty record";
    ss_test::expect(s.read_next(r) && r.bytes == "xyz" && r.offset == 8 && r.next_offset == 11)
        << "unterminated tail";
    ss_test::expect(!s.read_next(r)) << "end of channel";
    ss_test::expect(!s.read_next(r)) << "end of channel is sticky";
    ss_test::expect(s.position() == 11 && s.bytes_read() == 11) << "position " << s.position();
  }

  // CRLF: '\r' trimmed from the value, still counted in offsets.
  {
    ss::LineScanner s(mem("a\r\nbb\r\n"));
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "a" && r.next_offset == 3) << "crlf 1";
    ss_test::expect(s.read_next(r) && r.bytes == "bb" && r.offset == 3 && r.next_offset == 7)
        << "crlf 2";
  }
  {
    ss::LineScanner::Config cfg;
    cfg.strip_cr = false;
    ss::LineScanner s(mem("a\r\n"), cfg);
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "a\r")
        << "strip_cr=false keeps the carriage return";
  }

  // Custom delimiter.
  {
    ss::LineScanner::Config cfg;
    cfg.delimiter = '|';
    ss::LineScanner s(mem("x|yy|"), cfg);
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "x") << "pipe 1";
    ss_test::expect(s.read_next(r) && r.bytes == "yy" && r.next_offset == 5) << "pipe 2";
    ss_test::expect(!s.read_next(r)) << "pipe end";
  }

  // Oversize records are an error, never dropped.
  {
    ss::LineScanner::Config cfg;
    cfg.max_record_bytes = 4;
    cfg.buffer_bytes = 2;
    ss::LineScanner s(mem("abcd\nabcdefgh\n"), cfg);
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "abcd") << "record at the limit";
    ss_test::expect_throw<ss::IoError>([&] { s.read_next(r); }, "s.read_next(r)");
  }

  // Offsets are absolute channel positions.
  {
    auto ch = mem("0123\n5678\n");
    ch->seek(5);
    ss::LineScanner s(std::move(ch));
    ss::RawRecord r;
    ss_test::expect(s.position() == 5) << "starts at the channel position";
    ss_test::expect(s.read_next(r) && r.bytes == "5678" && r.offset == 5 && r.next_offset == 10)
        << "seeked";
  }

  // Read failures propagate.
  {
    ss::LineScanner::Config cfg;
    cfg.buffer_bytes = 4;
    ss::LineScanner s(std::make_unique<ss_test::MemoryChannel>("aaa\nbbb\nccc\n", nullptr, 6), cfg);
    ss::RawRecord r;
    ss_test::expect(s.read_next(r) && r.bytes == "aaa") << "before failure";
    ss_test::expect_throw<ss::IoError>([&] { s.read_next(r); }, "s.read_next(r)");
  }

  // close() releases the channel exactly once.
  {
    auto closes = std::make_shared<int>(0);
    {
      ss::LineScanner s(mem("a\nb\n", closes));
      ss::RawRecord r;
      ss_test::expect(s.read_next(r)) << "read before close";
      s.close();
      ss_test::expect(!s.is_open() && *closes == 1) << "closed";
      ss_test::expect(!s.read_next(r)) << "no reads after close";
      s.close();
    }
    ss_test::expect(*closes == 1) << "closed once, got " << *closes;
  }

  return ss_test::finish("line_scanner");
}
