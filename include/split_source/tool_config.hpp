#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ss {

// Settings of the split-source command line tool.
struct ToolConfig {
  std::string path;                 // literal file or glob pattern
  bool is_pattern = false;          // --pattern= (or a glob in --file=)
  std::optional<std::int64_t> range_start;
  std::optional<std::int64_t> range_end;   // absent = to end of file
  std::int64_t min_shard_bytes = 1024;
  std::int64_t desired_shard_bytes = 64 * 1024 * 1024;
  std::string header_marker;        // non-empty selects header-block records
  std::string decoder = "string";   // string|number|json
  int threads = 1;
  std::size_t buffer_bytes = 64 * 1024;
  bool plan = false;
  bool read = false;
  bool print = false;               // --read also prints every record
  bool help = false;
};

// "4096", "64KiB", "1.5MiB", "2GiB", "10KB". Throws ConfigError.
std::int64_t parse_byte_size(std::string_view text);

// "START:END" or "START:" (unbounded). Throws ConfigError.
void parse_range(std::string_view text, ToolConfig& cfg);

// Applies keys of a JSON object file onto cfg (same names as the flags,
// dashes replaced by underscores). Throws ConfigError.
void load_json_config(const std::string& file, ToolConfig& cfg);

// --config=FILE is applied first; other flags override it.
// Default thread count comes from SS_THREADS. Throws ConfigError.
ToolConfig parse_cli(int argc, char** argv);

// Consistency checks (source given, decoder known, positive sizes).
void validate(const ToolConfig& cfg);

std::string usage();

}
