#pragma once
#include <provenance/schema/product_record.hpp>
#include <string_view>

// Schema key type: product record.
// Supply chain workflow: products live directly under their id so a full
// range scan of the world state enumerates every product in id order.
namespace provenance::schema::key {

inline provenance::schema::bytes_t make_key(const std::string_view& id) {
  return provenance::schema::make_bytes(id);
}

inline provenance::schema::bytes_t make_key(
    const provenance::schema::product_record<1>& value) {
  return make_key(std::string_view{value.id});
}

}  // namespace provenance::schema::key
