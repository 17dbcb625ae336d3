#include "split_source/record_decoder.hpp"
#include "split_source/errors.hpp"

#include <fast_float/fast_float.h>
#include <system_error>

namespace ss {

static std::string_view trim_blanks(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
  return s;
}

double NumberDecoder::decode(std::string_view bytes) const {
  std::string_view s = cfg_.trim_spaces ? trim_blanks(bytes) : bytes;
  double out = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size())
    throw DecodeError("not a number: '" + std::string(bytes.substr(0, 64)) + "'");
  return out;
}

}
