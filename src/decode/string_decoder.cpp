#include "split_source/record_decoder.hpp"
#include "split_source/errors.hpp"

#include <simdjson.h>

namespace ss {

std::string Utf8StringDecoder::decode(std::string_view bytes) const {
  if (!simdjson::validate_utf8(bytes.data(), bytes.size()))
    throw DecodeError("record is not valid UTF-8 (" + std::to_string(bytes.size()) + " bytes)");
  return std::string(bytes);
}

}
