#pragma once
#include "split_source/metrics.hpp"
#include "split_source/source_descriptor.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace ss {

class PlanJsonWriter {
public:
  // {"source":..,"estimated_size_bytes":N,"desired_shard_bytes":N,
  //  "shards":[{"path":..,"start":..,"end":..}]}
  static std::string plan_to_json(const SourceDescriptor& source, std::int64_t estimated_size_bytes,
                                  std::int64_t desired_shard_bytes,
                                  const std::vector<SourceDescriptor>& shards);

  // Run summary of a --read pass.
  static std::string stats_to_json(const SourceDescriptor& source, const RunStats& s);
};

}
