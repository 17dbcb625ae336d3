#include "split_source/path_utils.hpp"
#include <cctype>

namespace ss {

std::string scheme_of(std::string_view path) {
  auto pos = path.find("://");
  if (pos == std::string_view::npos || pos == 0) return std::string(kLocalScheme);
  // A scheme is letters, digits, '+', '-', '.'; anything else means "no scheme".
  for (std::size_t i = 0; i < pos; ++i) {
    unsigned char c = static_cast<unsigned char>(path[i]);
    if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return std::string(kLocalScheme);
  }
  return std::string(path.substr(0, pos));
}

std::string strip_local_scheme(std::string_view path) {
  constexpr std::string_view pfx = "file://";
  if (path.substr(0, pfx.size()) == pfx) return std::string(path.substr(pfx.size()));
  return std::string(path);
}

bool is_glob_pattern(std::string_view s) {
  return s.find_first_of("*?[") != std::string_view::npos;
}

}
