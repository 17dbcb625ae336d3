#include "split_source/plan_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace ss {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          static const char* hex = "0123456789abcdef";
          o << "\\u00" << hex[(c >> 4) & 0xf] << hex[c & 0xf];
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void end_offset(std::ostringstream& o, const SourceDescriptor& d) {
  // Unbounded ends are written as null.
  if (d.has_bounded_end()) o << d.end_offset(); else o << "null";
}

std::string PlanJsonWriter::plan_to_json(const SourceDescriptor& source,
                                         std::int64_t estimated_size_bytes,
                                         std::int64_t desired_shard_bytes,
                                         const std::vector<SourceDescriptor>& shards) {
  std::ostringstream o;
  o << "{";
  o << "\"source\":"; esc(o, source.path_or_pattern()); o << ",";
  o << "\"is_pattern\":" << (source.is_pattern() ? "true" : "false") << ",";
  o << "\"mode\":"; esc(o, ss::to_string(source.mode())); o << ",";
  o << "\"estimated_size_bytes\":" << estimated_size_bytes << ",";
  o << "\"desired_shard_bytes\":" << desired_shard_bytes << ",";
  o << "\"min_shard_bytes\":" << source.min_shard_size_bytes() << ",";

  o << "\"shards\":[";
  for (size_t i=0;i<shards.size();++i){
    if (i) o << ",";
    o << "{\"path\":"; esc(o, shards[i].path_or_pattern());
    o << ",\"start\":" << shards[i].start_offset();
    o << ",\"end\":"; end_offset(o, shards[i]);
    o << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

std::string PlanJsonWriter::stats_to_json(const SourceDescriptor& source, const RunStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"source\":"; esc(o, source.path_or_pattern()); o << ",";
  o << "\"records\":" << s.records << ",";
  o << "\"bytes\":" << s.bytes << ",";
  o << "\"shards\":" << s.shards << ",";
  o << "\"failed_shards\":" << s.failed_shards << ",";
  o << "\"split_points\":" << s.split_points << ",";
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(s.records_per_sec) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "]";

  o << "}";
  return o.str();
}

}
