#pragma once

#include <provenance/schema/primitives.hpp>
#include <provenance/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction result.
// Supply chain workflow: outcome of a writing operation. `code` is 0 or a
// record_error_code; `data` holds the encoded record that was written.
namespace provenance::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;
};

using transaction_result_t = transaction_result<1>;

}  // namespace provenance::schema
