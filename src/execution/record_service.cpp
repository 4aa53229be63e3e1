#include <provenance/execution/record_service.hpp>

namespace provenance::execution {

std::vector<provenance::schema::product_record_t> initial_records(
    const provenance::schema::rfc3339_t& timestamp) {
  auto manufactured = std::string{provenance::schema::kManufacturedStatus};
  return {
      provenance::schema::product_record_t{
          .id = "p1",
          .name = "Laptop",
          .status = manufactured,
          .owner = "CompanyA",
          .created_at = timestamp,
          .updated_at = timestamp,
          .description = "High-end gaming laptop",
          .category = "Electronics"},
      provenance::schema::product_record_t{
          .id = "p2",
          .name = "Smartphone",
          .status = manufactured,
          .owner = "CompanyB",
          .created_at = timestamp,
          .updated_at = timestamp,
          .description = "Latest model smartphone",
          .category = "Electronics"},
  };
}

}  // namespace provenance::execution
