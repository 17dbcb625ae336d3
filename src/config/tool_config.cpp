#include "split_source/tool_config.hpp"
#include "split_source/errors.hpp"
#include "split_source/path_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <limits>
#include <fast_float/fast_float.h>
#include <simdjson.h>
#include <system_error>

namespace ss {

namespace {

// 2^63, the first double past the int64 range.
constexpr double kInt64Limit = 9223372036854775808.0;

bool fits_int64(double v) { return std::isfinite(v) && v >= 0 && v < kInt64Limit; }

std::int64_t parse_int(std::string_view text, const char* what) {
  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || ptr != text.data() + text.size() || !fits_int64(v) || v != std::floor(v))
    throw ConfigError(std::string("bad ") + what + ": '" + std::string(text) + "'");
  return static_cast<std::int64_t>(v);
}

int parse_thread_count(std::string_view text) {
  std::int64_t n = parse_int(text, "thread count");
  if (n > std::numeric_limits<int>::max())
    throw ConfigError("thread count out of range: '" + std::string(text) + "'");
  return static_cast<int>(n);
}

bool parse_bool(std::string_view v) {
  if (v.empty() || v == "1" || v == "true" || v == "yes") return true;
  if (v == "0" || v == "false" || v == "no") return false;
  throw ConfigError("bad boolean: '" + std::string(v) + "'");
}

// Shared by flags and JSON keys; key uses underscores.
bool apply_key(std::string_view key, std::string_view val, ToolConfig& c) {
  if (key == "file")          { c.path = std::string(val); c.is_pattern = is_glob_pattern(val); return true; }
  if (key == "pattern")       { c.path = std::string(val); c.is_pattern = true; return true; }
  if (key == "range")         { parse_range(val, c); return true; }
  if (key == "min_shard")     { c.min_shard_bytes = parse_byte_size(val); return true; }
  if (key == "desired_shard") { c.desired_shard_bytes = parse_byte_size(val); return true; }
  if (key == "buffer")        { c.buffer_bytes = static_cast<std::size_t>(parse_byte_size(val)); return true; }
  if (key == "header")        { c.header_marker = std::string(val); return true; }
  if (key == "decoder")       { c.decoder = std::string(val); return true; }
  if (key == "threads")       { c.threads = parse_thread_count(val); return true; }
  if (key == "plan")          { c.plan = parse_bool(val); return true; }
  if (key == "read")          { c.read = parse_bool(val); return true; }
  if (key == "print")         { c.print = parse_bool(val); return true; }
  return false;
}

std::string underscored(std::string_view s) {
  std::string out(s);
  for (auto& ch : out) if (ch == '-') ch = '_';
  return out;
}

} // namespace

std::int64_t parse_byte_size(std::string_view text) {
  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(text.data(), text.data() + text.size(), v);
  if (ec != std::errc() || !fits_int64(v))
    throw ConfigError("bad byte size: '" + std::string(text) + "'");

  std::string_view unit(ptr, static_cast<std::size_t>(text.data() + text.size() - ptr));
  double mul = 1.0;
  if (unit.empty() || unit == "B")        mul = 1.0;
  else if (unit == "KiB" || unit == "K")  mul = 1024.0;
  else if (unit == "MiB" || unit == "M")  mul = 1024.0 * 1024.0;
  else if (unit == "GiB" || unit == "G")  mul = 1024.0 * 1024.0 * 1024.0;
  else if (unit == "KB")                  mul = 1e3;
  else if (unit == "MB")                  mul = 1e6;
  else if (unit == "GB")                  mul = 1e9;
  else throw ConfigError("bad byte size unit: '" + std::string(text) + "'");
  if (!fits_int64(v * mul)) throw ConfigError("byte size out of range: '" + std::string(text) + "'");
  return static_cast<std::int64_t>(v * mul);
}

void parse_range(std::string_view text, ToolConfig& cfg) {
  auto colon = text.find(':');
  if (colon == std::string_view::npos) throw ConfigError("range must be START:END, got '" + std::string(text) + "'");
  cfg.range_start = parse_int(text.substr(0, colon), "range start");
  auto end = text.substr(colon + 1);
  if (end.empty()) cfg.range_end.reset();
  else cfg.range_end = parse_int(end, "range end");
}

void load_json_config(const std::string& file, ToolConfig& cfg) {
  try {
    simdjson::ondemand::parser p;
    simdjson::padded_string json = simdjson::padded_string::load(file);
    auto doc = p.iterate(json);
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view k = field.unescaped_key();
      std::string key = underscored(k);
      simdjson::ondemand::value v = field.value();
      std::string text;
      switch (v.type()) {
        case simdjson::ondemand::json_type::string: {
          std::string_view s = v.get_string();
          text.assign(s);
          break;
        }
        case simdjson::ondemand::json_type::boolean:
          text = bool(v.get_bool()) ? "true" : "false";
          break;
        default: {
          std::string_view raw = v.raw_json_token();
          while (!raw.empty() && (raw.back() == ' ' || raw.back() == '\n' || raw.back() == '\r' ||
                                  raw.back() == '\t'))
            raw.remove_suffix(1);
          text.assign(raw);
          break;
        }
      }
      if (!apply_key(key, text, cfg)) throw ConfigError("unknown config key '" + key + "' in " + file);
    }
  } catch (const simdjson::simdjson_error& e) {
    throw ConfigError("cannot read config " + file + ": " + e.what());
  }
}

ToolConfig parse_cli(int argc, char** argv) {
  ToolConfig c;
  if (const char* env = std::getenv("SS_THREADS"); env && *env)
    c.threads = parse_thread_count(env);

  for (int i = 1; i < argc; ++i) {
    std::string_view a(argv[i]);
    if (a.rfind("--config=", 0) == 0) load_json_config(std::string(a.substr(9)), c);
  }

  for (int i = 1; i < argc; ++i) {
    std::string_view a(argv[i]);
    if (a == "-h" || a == "--help") { c.help = true; continue; }
    if (a.rfind("--", 0) != 0) throw ConfigError("unexpected argument '" + std::string(a) + "'");
    a.remove_prefix(2);
    auto eq = a.find('=');
    std::string key = underscored(a.substr(0, eq));
    std::string_view val = (eq == std::string_view::npos) ? std::string_view{} : a.substr(eq + 1);
    if (key == "config") continue;
    if (!apply_key(key, val, c)) throw ConfigError("unknown flag '--" + std::string(a.substr(0, eq)) + "'");
  }
  return c;
}

void validate(const ToolConfig& c) {
  if (c.path.empty()) throw ConfigError("no input: pass --file=PATH or --pattern=GLOB");
  if (c.is_pattern && (c.range_start || c.range_end))
    throw ConfigError("--range cannot be combined with a pattern");
  if (c.desired_shard_bytes <= 0) throw ConfigError("--desired-shard must be positive");
  if (c.threads < 1) throw ConfigError("--threads must be at least 1");
  if (c.buffer_bytes == 0) throw ConfigError("--buffer must be positive");
  if (c.decoder != "string" && c.decoder != "number" && c.decoder != "json")
    throw ConfigError("unknown decoder '" + c.decoder + "' (string|number|json)");
  if (!c.plan && !c.read) throw ConfigError("nothing to do: pass --plan and/or --read");
}

std::string usage() {
  return
    "Usage: split-source (--file=PATH | --pattern=GLOB) [--range=START:END]\n"
    "                    [--min-shard=BYTES] [--desired-shard=BYTES] [--buffer=BYTES]\n"
    "                    [--header=MARKER] [--decoder=string|number|json]\n"
    "                    [--threads=N] [--config=FILE.json] [--plan] [--read [--print]]\n"
    "Sizes accept B, KiB, MiB, GiB, KB, MB, GB suffixes.\n";
}

}
