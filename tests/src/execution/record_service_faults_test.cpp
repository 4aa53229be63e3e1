#include <provenance/execution/record_service.hpp>
#include <provenance/schema/record_error_code.hpp>
#include <provenance/testing/common.hpp>
#include <provenance/testing/fault_storage.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace {

using provenance::schema::record_error_code;
using provenance::testing::kGenesisSeconds;
using provenance::testing::make_context;
using provenance::testing::make_context_without_clock;

using fault_storage_t =
    provenance::storage::storage<provenance::testing::fault_storage_tag>;
using fault_service_t =
    provenance::execution::record_service<provenance::testing::fault_storage_tag>;

uint32_t code_of(const record_error_code code) {
  return static_cast<uint32_t>(code);
}

class record_service_faults : public ::testing::Test {
 protected:
  void SetUp() override {
    auto result = service.seed_initial_records(make_context(kGenesisSeconds));
    ASSERT_EQ(result.code, 0u) << result.info;
    storage.reads = 0;
    storage.writes = 0;
  }

  provenance::execution::scale_encoder_t encoder;
  fault_storage_t storage;
  fault_service_t service{encoder, storage};
};

}  // namespace

TEST_F(record_service_faults, read_failure_surfaces_from_every_reader) {
  storage.fail_reads = true;
  auto ctx = make_context(kGenesisSeconds + 1);
  const auto expected = code_of(record_error_code::store_read_failed);

  auto exists = service.exists("p1");
  EXPECT_EQ(exists.code, expected);
  EXPECT_EQ(exists.codespace, provenance::execution::kExistsCodespace);

  auto query = service.query("p1");
  EXPECT_EQ(query.code, expected);
  EXPECT_NE(query.info.find("injected read failure"), std::string::npos);
  EXPECT_NE(query.info.find("p1"), std::string::npos);

  EXPECT_EQ(service.create(ctx, "p9", "Tablet", "CompanyA", "", "").code,
            expected);
  EXPECT_EQ(service.update(ctx, "p1", "Shipped", "", "", "").code, expected);
  EXPECT_EQ(service.transfer_ownership(ctx, "p1", "CompanyB").code, expected);
  EXPECT_EQ(storage.writes, 0u);
}

TEST_F(record_service_faults, write_failure_surfaces_from_every_writer) {
  storage.fail_writes = true;
  auto ctx = make_context(kGenesisSeconds + 1);
  const auto expected = code_of(record_error_code::store_write_failed);

  auto created = service.create(ctx, "p9", "Tablet", "CompanyA", "", "");
  EXPECT_EQ(created.code, expected);
  EXPECT_EQ(created.log, "failed to put to world state");
  EXPECT_TRUE(created.events.empty());

  EXPECT_EQ(service.update(ctx, "p1", "Shipped", "", "", "").code, expected);
  EXPECT_EQ(service.transfer_ownership(ctx, "p1", "CompanyB").code, expected);

  auto seeded = service.seed_initial_records(ctx);
  EXPECT_EQ(seeded.code, expected);
  EXPECT_EQ(seeded.codespace, provenance::execution::kSeedCodespace);
}

TEST_F(record_service_faults, seeding_stops_at_first_failed_write) {
  storage.fail_writes = true;
  auto seeded = service.seed_initial_records(make_context(kGenesisSeconds + 1));
  EXPECT_EQ(seeded.code, code_of(record_error_code::store_write_failed));
  EXPECT_EQ(storage.writes, 1u);
}

TEST_F(record_service_faults, missing_clock_fails_before_store_access) {
  auto ctx = make_context_without_clock();
  const auto expected = code_of(record_error_code::clock_unavailable);

  EXPECT_EQ(service.seed_initial_records(ctx).code, expected);
  EXPECT_EQ(service.create(ctx, "p9", "Tablet", "CompanyA", "", "").code,
            expected);
  EXPECT_EQ(service.update(ctx, "p1", "Shipped", "", "", "").code, expected);
  auto transferred = service.transfer_ownership(ctx, "p1", "CompanyB");
  EXPECT_EQ(transferred.code, expected);
  EXPECT_EQ(transferred.log, "failed to get transaction timestamp");

  EXPECT_EQ(storage.reads, 0u);
  EXPECT_EQ(storage.writes, 0u);
}

TEST_F(record_service_faults, out_of_range_timestamp_is_a_clock_failure) {
  auto ctx = make_context(-100'000'000'000);
  EXPECT_EQ(service.create(ctx, "p9", "Tablet", "CompanyA", "", "").code,
            code_of(record_error_code::clock_unavailable));
  EXPECT_EQ(storage.reads, 0u);
}

TEST_F(record_service_faults, invalid_create_touches_nothing) {
  auto result =
      service.create(make_context(kGenesisSeconds), "p9", "", "CompanyA", "", "");
  EXPECT_EQ(result.code, code_of(record_error_code::invalid_argument));
  EXPECT_EQ(storage.reads, 0u);
  EXPECT_EQ(storage.writes, 0u);
}

TEST_F(record_service_faults, successful_list_releases_cursor) {
  auto listed = service.list_all();
  ASSERT_EQ(listed.code, 0u) << listed.info;
  EXPECT_EQ(storage.open_cursors(), 0);
}

TEST_F(record_service_faults, scan_open_failure_is_a_read_failure) {
  storage.fail_scan_open = true;
  auto listed = service.list_all();
  EXPECT_EQ(listed.code, code_of(record_error_code::store_read_failed));
  EXPECT_NE(listed.info.find("injected scan open failure"), std::string::npos);
  EXPECT_EQ(storage.open_cursors(), 0);
}

TEST_F(record_service_faults, iteration_failure_aborts_and_releases_cursor) {
  storage.fail_scan_at = 1;
  auto listed = service.list_all();
  EXPECT_EQ(listed.code, code_of(record_error_code::store_read_failed));
  EXPECT_TRUE(listed.value.empty());
  EXPECT_EQ(storage.open_cursors(), 0);
}

TEST_F(record_service_faults, interrupted_scan_is_not_a_short_success) {
  storage.interrupt_scan_at = 1;
  auto listed = service.list_all();
  EXPECT_EQ(listed.code, code_of(record_error_code::store_read_failed));
  EXPECT_NE(listed.info.find("injected scan interruption"), std::string::npos);
  EXPECT_EQ(storage.open_cursors(), 0);
}

TEST_F(record_service_faults, undecodable_entry_aborts_and_releases_cursor) {
  storage.entries[provenance::schema::make_bytes(std::string_view{"p0"})] =
      provenance::schema::bytes_t{0xFF};
  auto listed = service.list_all();
  EXPECT_EQ(listed.code, code_of(record_error_code::decode_failed));
  EXPECT_NE(listed.info.find("p0"), std::string::npos);
  EXPECT_EQ(storage.open_cursors(), 0);
}

TEST_F(record_service_faults, empty_values_are_skipped_by_list) {
  storage.entries[provenance::schema::make_bytes(std::string_view{"p0"})] =
      provenance::schema::bytes_t{};
  auto listed = service.list_all();
  ASSERT_EQ(listed.code, 0u) << listed.info;
  auto records =
      encoder.decode<std::vector<provenance::schema::product_record_t>>(
          provenance::schema::make_bytes_view(listed.value));
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[0].id, "p1");
  EXPECT_EQ(records[1].id, "p2");
}

TEST_F(record_service_faults, undecodable_record_fails_query_and_update) {
  storage.entries[provenance::schema::make_bytes(std::string_view{"p1"})] =
      provenance::schema::bytes_t{0x01};
  EXPECT_EQ(service.query("p1").code, code_of(record_error_code::decode_failed));
  EXPECT_EQ(service.update(make_context(kGenesisSeconds + 1), "p1", "Shipped",
                           "", "", "")
                .code,
            code_of(record_error_code::decode_failed));
  EXPECT_EQ(storage.writes, 0u);
}
