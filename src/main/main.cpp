#include "split_source/channel_provider.hpp"
#include "split_source/errors.hpp"
#include "split_source/file_based_source.hpp"
#include "split_source/json_record.hpp"
#include "split_source/metrics.hpp"
#include "split_source/plan_json.hpp"
#include "split_source/record_decoder.hpp"
#include "split_source/tool_config.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

ss::SourceDescriptor make_descriptor(const ss::ToolConfig& c) {
  if (c.range_start || c.range_end) {
    return ss::SourceDescriptor::subrange(c.path, c.min_shard_bytes, c.range_start.value_or(0),
                                          c.range_end.value_or(ss::kUnboundedOffset));
  }
  return ss::SourceDescriptor::whole(c.path, c.is_pattern, c.min_shard_bytes);
}

std::shared_ptr<const ss::BoundaryPolicy> make_policy(const ss::ToolConfig& c) {
  if (c.header_marker.empty()) return std::make_shared<ss::LineBoundary>();
  return std::make_shared<ss::HeaderBlockBoundary>(c.header_marker);
}

void print_record(const std::string& v)  { std::cout << v << "\n"; }
void print_record(double v) {
  char tmp[64];
  std::snprintf(tmp, sizeof(tmp), "%.17g", v);
  std::cout << tmp << "\n";
}
void print_record(const ss::JsonRecord& r) {
  for (std::size_t i = 0; i < r.fields.size(); ++i) {
    if (i) std::cout << '\t';
    std::cout << r.fields[i].first << '=' << r.fields[i].second;
  }
  std::cout << "\n";
}

// Each worker owns the readers of the shards it picks; shards share nothing.
template <typename T>
ss::RunStats read_shards(const std::vector<ss::FileBasedSource<T>>& shards,
                         const ss::ToolConfig& cfg, ss::MetricsRegistry& metrics) {
  std::atomic<std::size_t> next{0};
  std::mutex mu;   // guards metrics and stdout
  const int nthreads = std::max(1, std::min<int>(cfg.threads, static_cast<int>(shards.size())));

  auto worker = [&]() {
    ss::MetricsRegistry local;
    for (std::size_t i = next++; i < shards.size(); i = next++) {
      const auto& shard = shards[i];
      std::uint64_t records = 0, splits = 0, bytes = 0;
      try {
        auto reader = shard.create_single_file_reader();
        for (bool ok = reader->start(); ok; ok = reader->advance()) {
          ++records;
          if (reader->is_at_split_point()) ++splits;
          if (cfg.print) {
            std::lock_guard<std::mutex> lk(mu);
            print_record(reader->current());
          }
        }
        bytes = reader->bytes_read();
      } catch (const std::exception& e) {
        // A failed shard does not stop the others.
        std::lock_guard<std::mutex> lk(mu);
        std::cerr << "[read] shard failed: " << shard.descriptor().to_string()
                  << ": " << e.what() << "\n";
        local.add_failed_shard();
        continue;
      }
      local.add_shard();
      local.add_records(records);
      local.add_split_points(splits);
      local.add_bytes(bytes);
    }
    std::lock_guard<std::mutex> lk(mu);
    metrics.merge(local);
  };

  const auto t0 = std::chrono::steady_clock::now();
  metrics.start_stage("read");
  std::vector<std::thread> pool;
  pool.reserve(static_cast<std::size_t>(nthreads));
  for (int t = 0; t < nthreads; ++t) pool.emplace_back(worker);
  for (auto& th : pool) th.join();
  metrics.end_stage("read");
  const auto t1 = std::chrono::steady_clock::now();

  return metrics.snapshot(std::chrono::duration<double, std::milli>(t1 - t0).count());
}

template <typename T>
int run(const ss::ToolConfig& cfg, std::shared_ptr<const ss::RecordDecoder<T>> decoder) {
  ss::FileBasedSource<T> source(make_descriptor(cfg), std::move(decoder), make_policy(cfg),
                                ss::LineScanner::Config{cfg.buffer_bytes});
  ss::MetricsRegistry metrics;

  metrics.start_stage("plan");
  const std::int64_t estimate = source.estimated_size_bytes();
  auto shards = source.split_into_shards(cfg.desired_shard_bytes);
  metrics.end_stage("plan");

  std::cerr << "[plan] " << source.descriptor().to_string() << " (" << source.policy().name()
            << "): " << estimate << " bytes, " << shards.size() << " shard(s)\n";

  if (cfg.plan) {
    std::vector<ss::SourceDescriptor> descs;
    descs.reserve(shards.size());
    for (const auto& s : shards) descs.push_back(s.descriptor());
    std::cout << ss::PlanJsonWriter::plan_to_json(source.descriptor(), estimate,
                                                  cfg.desired_shard_bytes, descs) << "\n";
  }

  if (cfg.read) {
    ss::RunStats stats = read_shards(shards, cfg, metrics);
    std::cerr << "[read] " << stats.records << " record(s) from " << stats.shards
              << " shard(s), " << stats.failed_shards << " failed\n";
    if (!cfg.print) std::cout << ss::PlanJsonWriter::stats_to_json(source.descriptor(), stats) << "\n";
    if (stats.failed_shards > 0) return 3;
  }
  return 0;
}

}

int main(int argc, char** argv) {
  ss::ToolConfig cfg;
  try {
    cfg = ss::parse_cli(argc, argv);
    if (cfg.help) { std::cout << ss::usage(); return 0; }
    ss::validate(cfg);
  } catch (const ss::ConfigError& e) {
    std::cerr << "[split-source] error: " << e.what() << "\n" << ss::usage();
    return 2;
  }

  ss::ScopedChannelRegistry registry;
  try {
    if (cfg.decoder == "number")
      return run<double>(cfg, std::make_shared<ss::NumberDecoder>());
    if (cfg.decoder == "json")
      return run<ss::JsonRecord>(cfg, std::make_shared<ss::JsonRecordDecoder>());
    return run<std::string>(cfg, std::make_shared<ss::Utf8StringDecoder>());
  } catch (const ss::ConfigError& e) {
    std::cerr << "[split-source] error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "[split-source] error: " << e.what() << "\n";
    return 3;
  }
}
