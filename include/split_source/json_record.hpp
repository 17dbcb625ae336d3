#pragma once
#include "split_source/record_decoder.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ss {

// One JSON-lines record flattened to ordered key/value strings.
// Numbers: "%.17g"; booleans: "true"/"false"; null: empty; arrays and objects:
// raw JSON (capped). A non-object line in lenient mode is one field with an
// empty key.
struct JsonRecord {
  std::vector<std::pair<std::string, std::string>> fields;

  std::size_t size() const noexcept { return fields.size(); }
  // Value for key, or nullptr.
  const std::string* find(std::string_view key) const;
};

class JsonRecordDecoder final : public RecordDecoder<JsonRecord> {
public:
  struct Config {
    bool        strict = true;                       // object-only in strict mode
    std::size_t cap_nested_value_bytes = 32 * 1024;  // cap for arrays/objects raw storage
  };

  JsonRecordDecoder() = default;
  explicit JsonRecordDecoder(Config cfg) : cfg_(cfg) {}

  JsonRecord decode(std::string_view bytes) const override;

private:
  Config cfg_{};
};

}
