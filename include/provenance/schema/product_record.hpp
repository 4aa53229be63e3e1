#pragma once
#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <string>

// Schema type: product record.
// Supply chain workflow: one tracked physical product; keyed by id in the
// world state and rewritten by every custody or status change.
namespace provenance::schema {

template <uint16_t Version>
struct product_record;

template <>
struct product_record<1> final {
  uint16_t version{1};
  std::string id;
  std::string name;
  std::string status;
  std::string owner;
  rfc3339_t created_at;
  rfc3339_t updated_at;
  std::string description;
  std::string category;

  bool operator==(const product_record&) const = default;
};

using product_record_t = product_record<1>;

/// Status assigned to every freshly created or seeded product.
inline constexpr auto kManufacturedStatus = std::string_view{"Manufactured"};

}  // namespace provenance::schema
