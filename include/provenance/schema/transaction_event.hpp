#pragma once

#include <provenance/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

// Schema type: transaction event.
// Supply chain workflow: one emission per applied write (creation, update,
// transfer, seeding) for indexers following custody changes.
namespace provenance::schema {

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;
};

using transaction_event_t = transaction_event<1>;

}  // namespace provenance::schema
