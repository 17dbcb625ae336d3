#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ss {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  std::uint64_t shards = 0;
  std::uint64_t split_points = 0;
  std::uint64_t failed_shards = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;
};

// Counters for one planning/reading run. Not thread-safe; workers keep their
// own and the caller merges them.
class MetricsRegistry {
public:
  void add_records(std::uint64_t n) noexcept { records_ += n; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_split_points(std::uint64_t n) noexcept { split_points_ += n; }
  void add_shard() noexcept { ++shards_; }
  void add_failed_shard() noexcept { ++failed_shards_; }

  void merge(const MetricsRegistry& other);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::uint64_t shards_{0};
  std::uint64_t split_points_{0};
  std::uint64_t failed_shards_{0};
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
