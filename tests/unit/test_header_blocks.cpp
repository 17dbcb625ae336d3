#include "split_source/channel_provider.hpp"
#include "split_source/errors.hpp"
#include "split_source/file_based_source.hpp"
#include "test_support.hpp"

using ss::FileBasedSource;
using ss::SourceDescriptor;
using Lines = std::vector<std::string>;

namespace {

const std::string kHeader = "<h>";

FileBasedSource<std::string> source(SourceDescriptor d) {
  return FileBasedSource<std::string>(std::move(d), std::make_shared<ss::Utf8StringDecoder>(),
                                      std::make_shared<ss::HeaderBlockBoundary>(kHeader));
}

Lines read_range(const std::string& path, std::int64_t start, std::int64_t end) {
  auto r = source(SourceDescriptor::subrange(path, 1024, start, end)).create_reader();
  return ss::read_all(*r);
}

Lines read_sharded(const std::string& path, std::int64_t desired) {
  Lines all;
  for (const auto& shard : source(SourceDescriptor::file(path, 1)).split_into_shards(desired)) {
    auto r = shard.create_reader();
    auto part = ss::read_all(*r);
    all.insert(all.end(), part.begin(), part.end());
  }
  return all;
}

// Uneven line lengths, runs of consecutive markers, data before the first marker.
Lines irregular_lines(std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> len(1, 7), pick(0, 9), letter(0, 25);
  Lines out;
  for (int i = 0; i < 3; ++i) out.push_back("pre" + std::to_string(i));
  for (int i = 0; i < 600; ++i) {
    if (pick(rng) < 2) { out.push_back(kHeader); continue; }
    std::string s(static_cast<std::size_t>(len(rng)), 'a');
    for (auto& c : s) c = static_cast<char>('a' + letter(rng));
    out.push_back(s);
  }
  return out;
}

}

int main() {
  ss::ScopedChannelRegistry scope;
  auto dir = ss_test::make_dir("header_blocks");

  // 100 blocks: marker + 9 lines, 4 bytes per line; block b starts at 40*b.
  auto data = ss_test::header_lines(100, 9, kHeader, 99);
  auto file = ss_test::write_lines(dir, "file", data).string();

  // Whole file: markers dropped, one split point per block, at its first data record.
  {
    auto r = source(SourceDescriptor::file(file, 1024)).create_reader();
    Lines got;
    std::size_t splits = 0;
    bool offsets_ok = true;
    for (bool ok = r->start(); ok; ok = r->advance()) {
      const std::int64_t line = r->current_offset() / 4;
      const bool first_in_block = (line % 10) == 1;
      if (r->is_at_split_point()) ++splits;
      if (r->is_at_split_point() != first_in_block) offsets_ok = false;
      got.push_back(r->current());
    }
    ss_test::expect(got == ss_test::without(data, kHeader)) << "whole file without markers";
    ss_test::expect(splits == 100) << "one split point per block, got " << splits;
    ss_test::expect(offsets_ok) << "split points are exactly the first data records";
  }

  // The split offset of a block is its marker's offset.
  {
    auto r = source(SourceDescriptor::subrange(file, 0, 0, ss::kUnboundedOffset)).create_single_file_reader();
    ss_test::expect(r->start() && r->current_offset() == 4 && r->split_offset() == 0) << "block 0";
    for (int i = 0; i < 9; ++i) (void)r->advance();
    ss_test::expect(r->current_offset() == 44 && r->is_at_split_point() && r->split_offset() == 40)
        << "block 1";
    ss_test::expect(r->advance() && !r->is_at_split_point() && r->split_offset() == 40)
        << "non-split record reports its block's split offset";
  }

  ss_test::expect(read_range(file, 0, 60) == ss_test::without(ss_test::slice(data, 0, 20), kHeader))
      << "range from start keeps the block begun before the end offset";
  ss_test::expect(read_range(file, 502, 702) == ss_test::without(ss_test::slice(data, 130, 180), kHeader))
      << "range from the middle starts at the next complete block";

  // Starting anywhere inside the first marker converges on the same block.
  const Lines block1 = ss_test::without(ss_test::slice(data, 10, 20), kHeader);
  for (std::int64_t k : {1, 2, 3}) {
    auto r = source(SourceDescriptor::subrange(file, 1024, k, 60)).create_reader();
    ss_test::expect(r->start() && r->is_at_split_point() && r->current_offset() == 44)
        << "start " << k << " lands on block 1";
    ss_test::expect(read_range(file, k, 60) == block1) << "start " << k << " yields block 1 only";
  }

  // No complete block inside the range: zero records, not an error.
  ss_test::expect(read_range(file, 44, 76).empty()) << "range without a block start";
  ss_test::expect(read_range(file, 41, 80).empty())
      << "range starting inside a marker, ending on the next";

  // Boundaries around a marker: a block belongs to the shard holding its marker.
  {
    Lines a = read_range(file, 0, 44);
    Lines b = read_range(file, 44, ss::kUnboundedOffset);
    ss_test::expect(a == ss_test::without(ss_test::slice(data, 0, 20), kHeader))
        << "marker at 40 < 44";
    a.insert(a.end(), b.begin(), b.end());
    ss_test::expect(a == ss_test::without(data, kHeader)) << "nothing lost or repeated at 44";

    Lines c = read_range(file, 0, 40);
    Lines d = read_range(file, 40, ss::kUnboundedOffset);
    ss_test::expect(c == ss_test::without(ss_test::slice(data, 0, 10), kHeader))
        << "marker at 40 is not < 40";
    c.insert(c.end(), d.begin(), d.end());
    ss_test::expect(c == ss_test::without(data, kHeader)) << "nothing lost or repeated at 40";
  }

  // Every plan reproduces the whole-file read.
  for (std::int64_t desired : {3, 5, 9, 17, 40, 44, 63, 100, 401, 4096}) {
    ss_test::expect(read_sharded(file, desired) == ss_test::without(data, kHeader))
        << "shards of " << desired << " bytes";
  }

  // h, a, b, h, h, c -> a, b, c with a and c split points; c owned by the second marker.
  {
    auto small = ss_test::write_lines(dir, "small", {kHeader, "aaa", "bbb", kHeader, kHeader, "ccc"}).string();
    auto r = source(SourceDescriptor::file(small, 0)).create_reader();
    Lines got;
    std::vector<bool> splits;
    for (bool ok = r->start(); ok; ok = r->advance()) {
      got.push_back(r->current());
      splits.push_back(r->is_at_split_point());
    }
    ss_test::expect(got == Lines{"aaa", "bbb", "ccc"}) << "records of the small file";
    ss_test::expect(splits == std::vector<bool>{true, false, true})
        << "split points of the small file";

    auto c = source(SourceDescriptor::subrange(small, 0, 0, 20)).create_single_file_reader();
    ss_test::expect(c->start() && c->advance() && c->advance() && c->split_offset() == 16)
        << "latest marker owns the record";
    ss_test::expect(read_range(small, 0, 16) == (Lines{"aaa", "bbb"}))
        << "second marker outside [0, 16)";
    ss_test::expect(read_range(small, 13, 20) == (Lines{"ccc"})) << "second marker inside [13, 20)";
  }

  // Records before the first marker belong to no block.
  {
    auto lead = ss_test::write_lines(dir, "lead", {"xxx", "yyy", kHeader, "aaa"}).string();
    auto r = source(SourceDescriptor::file(lead, 0)).create_reader();
    ss_test::expect(ss::read_all(*r) == Lines{"aaa"}) << "leading records skipped";
    auto none = ss_test::write_lines(dir, "none", {"xxx", "yyy"}).string();
    auto n = source(SourceDescriptor::file(none, 0)).create_reader();
    ss_test::expect(!n->start()) << "file without markers has no records";
  }

  // Irregular layout: every plan agrees with the whole-file read.
  for (std::uint32_t seed : {1u, 2u, 3u}) {
    auto lines = irregular_lines(seed);
    auto path = ss_test::write_lines(dir, "irregular" + std::to_string(seed), lines).string();
    auto r = source(SourceDescriptor::file(path, 0)).create_reader();
    const Lines expect = ss::read_all(*r);
    ss_test::expect(!expect.empty()) << "irregular file has records";
    for (std::int64_t desired = 1; desired <= 64; desired += 3)
      ss_test::expect(read_sharded(path, desired) == expect)
          << "irregular seed " << seed << " shards of " << desired << " bytes";
  }

  // One long block: shards past the marker stop scanning at their end offset.
  {
    Lines lines{kHeader};
    for (int i = 0; i < 20000; ++i) lines.push_back("abc");
    auto path = ss_test::write_lines(dir, "long_block", lines).string();
    const std::int64_t file_bytes = 4 + 20000 * 4;

    ss::LineScanner::Config cfg;
    cfg.buffer_bytes = 256;
    FileBasedSource<std::string> src(SourceDescriptor::file(path, 1), std::make_shared<ss::Utf8StringDecoder>(),
                                     std::make_shared<ss::HeaderBlockBoundary>(kHeader), cfg);
    auto shards = src.split_into_shards(1000);
    std::size_t records = 0;
    std::uint64_t bytes = 0;
    for (const auto& shard : shards) {
      auto r = shard.create_single_file_reader();
      for (bool ok = r->start(); ok; ok = r->advance()) ++records;
      bytes += r->bytes_read();
    }
    ss_test::expect(shards.size() == 80) << "80 shards, got " << shards.size();
    ss_test::expect(records == 20000) << "block read once, got " << records;
    ss_test::expect(bytes < static_cast<std::uint64_t>(3 * file_bytes))
        << "bytes read " << bytes << " for a " << file_bytes << "-byte file";
  }

  ss_test::expect(ss::HeaderBlockBoundary(kHeader).name() == "header:<h>") << "policy name";
  ss_test::expect(ss::LineBoundary().name() == "line") << "line policy name";
  ss_test::expect_throw<ss::ConfigError>([&] { ss::HeaderBlockBoundary(""); },
      "ss::HeaderBlockBoundary(\"\")");

  return ss_test::finish("header_blocks");
}
