#pragma once

#include <cstdint>
#include <string_view>

// Schema type: record error code.
// Supply chain workflow: stable numeric failure codes carried in result
// envelopes; 0 in an envelope means success.
namespace provenance::schema {

enum class record_error_code : uint32_t {
  invalid_argument = 1,
  clock_unavailable = 2,
  store_read_failed = 3,
  store_write_failed = 4,
  decode_failed = 5,
  product_not_found = 6,
  product_exists = 7,
};

constexpr std::string_view to_string(const record_error_code code) {
  switch (code) {
    case record_error_code::invalid_argument:
      return "invalid_argument";
    case record_error_code::clock_unavailable:
      return "clock_unavailable";
    case record_error_code::store_read_failed:
      return "store_read_failed";
    case record_error_code::store_write_failed:
      return "store_write_failed";
    case record_error_code::decode_failed:
      return "decode_failed";
    case record_error_code::product_not_found:
      return "product_not_found";
    case record_error_code::product_exists:
      return "product_exists";
  }
  return "unknown";
}

}  // namespace provenance::schema
