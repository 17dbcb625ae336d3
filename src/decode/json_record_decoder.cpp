#include "split_source/json_record.hpp"
#include "split_source/errors.hpp"

#include <simdjson.h>
#include <cstdio>
#include <string>

namespace ss {

static std::string from_number(double x) {
  char tmp[64];
  int n = std::snprintf(tmp, sizeof(tmp), "%.17g", x);
  return std::string(tmp, (n > 0) ? static_cast<std::size_t>(n) : 0);
}

static std::string copy_capped(std::string_view s, std::size_t cap) {
  if (s.size() <= cap) return std::string(s);
  if (cap <= 3) return std::string(s.substr(0, cap));
  std::string out; out.reserve(cap);
  out.append(s.substr(0, cap - 3));
  out.append("...");
  return out;
}

// Scalars become their text form, nested values their (capped) raw token.
static std::string value_text(simdjson::ondemand::value v, std::size_t cap) {
  switch (v.type()) {
    case simdjson::ondemand::json_type::number:
      return from_number(double(v.get_double()));
    case simdjson::ondemand::json_type::string: {
      std::string_view s = v.get_string();
      return std::string(s);
    }
    case simdjson::ondemand::json_type::boolean:
      return bool(v.get_bool()) ? "true" : "false";
    case simdjson::ondemand::json_type::null:
      return std::string{};
    default: {
      std::string_view tok = v.raw_json();
      return copy_capped(tok, cap);
    }
  }
}

const std::string* JsonRecord::find(std::string_view key) const {
  for (const auto& kv : fields) if (kv.first == key) return &kv.second;
  return nullptr;
}

JsonRecord JsonRecordDecoder::decode(std::string_view bytes) const {
  // thread-local scratch and parser
  thread_local simdjson::ondemand::parser parser;
  thread_local std::string scratch;

  scratch.assign(bytes.data(), bytes.size());
  scratch.resize(bytes.size() + simdjson::SIMDJSON_PADDING, '\0');
  simdjson::padded_string_view view(scratch.data(), bytes.size(), scratch.size());

  JsonRecord rec;
  try {
    auto doc = parser.iterate(view);
    auto t   = doc.type().value();

    if (t == simdjson::ondemand::json_type::object) {
      simdjson::ondemand::object obj = doc.get_object();
      for (auto field : obj) {
        std::string_view k = field.unescaped_key();
        std::string key(k);
        rec.fields.emplace_back(std::move(key), value_text(field.value(), cfg_.cap_nested_value_bytes));
      }
      return rec;
    }

    if (cfg_.strict) throw DecodeError("JSONL strict mode: non-object line");

    // Lenient scalar/array -> 1-field record
    std::string val;
    switch (t) {
      case simdjson::ondemand::json_type::number:  val = from_number(double(doc.get_double())); break;
      case simdjson::ondemand::json_type::string:  { std::string_view s = doc.get_string(); val.assign(s); break; }
      case simdjson::ondemand::json_type::boolean: val = bool(doc.get_bool()) ? "true" : "false"; break;
      case simdjson::ondemand::json_type::null:    break;
      default: {
        std::string_view tok = doc.value().raw_json();
        val = copy_capped(tok, cfg_.cap_nested_value_bytes);
        break;
      }
    }
    rec.fields.emplace_back(std::string{}, std::move(val));
    return rec;
  } catch (const simdjson::simdjson_error& e) {
    throw DecodeError(std::string("JSONL parse error: ") + e.what());
  }
}

}
