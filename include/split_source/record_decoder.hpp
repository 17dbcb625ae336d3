#pragma once
#include <string>
#include <string_view>

namespace ss {

// Turns the bytes of one delimited record into a T. Failures throw DecodeError.
// Implementations must be safe to call from several readers at once.
template <typename T>
class RecordDecoder {
public:
  using value_type = T;
  virtual ~RecordDecoder() = default;
  virtual T decode(std::string_view bytes) const = 0;
};

// UTF-8 text; invalid sequences are rejected (simdjson validator).
class Utf8StringDecoder final : public RecordDecoder<std::string> {
public:
  std::string decode(std::string_view bytes) const override;
};

// A whole record parsed as a floating-point number (fast_float).
class NumberDecoder final : public RecordDecoder<double> {
public:
  struct Config {
    bool trim_spaces = true;  // ignore leading/trailing blanks and tabs
  };

  NumberDecoder() = default;
  explicit NumberDecoder(Config cfg) : cfg_(cfg) {}

  double decode(std::string_view bytes) const override;

private:
  Config cfg_{};
};

}
