#include "split_source/metrics.hpp"
#include <algorithm>
#include <chrono>

namespace ss {

void MetricsRegistry::merge(const MetricsRegistry& other) {
  records_ += other.records_;
  bytes_ += other.bytes_;
  shards_ += other.shards_;
  split_points_ += other.split_points_;
  failed_shards_ += other.failed_shards_;
  for (auto& kv : other.stage_accum_ms_) stage_accum_ms_[kv.first] += kv.second;
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.records = records_;
  r.bytes = bytes_;
  r.shards = shards_;
  r.split_points = split_points_;
  r.failed_shards = failed_shards_;
  r.wall_time_ms = wall_ms;
  r.throughput_mb_s = (wall_ms > 0.0) ? (bytes_ / (1024.0*1024.0)) / (wall_ms / 1000.0) : 0.0;
  r.records_per_sec = (wall_ms > 0.0) ? records_ / (wall_ms / 1000.0) : 0.0;

  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  std::sort(r.stages.begin(), r.stages.end(),
            [](const StageTiming& a, const StageTiming& b) { return a.name < b.name; });
  return r;
}

}
