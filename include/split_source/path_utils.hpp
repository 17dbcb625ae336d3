#pragma once
#include <string>
#include <string_view>

namespace ss {

// Scheme used for paths without an explicit "scheme://" prefix.
inline constexpr std::string_view kLocalScheme = "file";

// "mocked://a/b" -> "mocked"; "/tmp/x" -> "file".
std::string scheme_of(std::string_view path);

// Strip a "file://" prefix; other schemes are returned untouched.
std::string strip_local_scheme(std::string_view path);

// True if the string contains glob metacharacters (* ? [).
bool is_glob_pattern(std::string_view s);

}
