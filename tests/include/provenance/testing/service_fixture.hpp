#pragma once

#include <provenance/execution/record_service.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/storage/rocksdb/storage.hpp>
#include <provenance/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <string_view>
#include <vector>

namespace provenance::testing {

/// Record service over a throwaway RocksDB directory.
class service_fixture final {
 public:
  using storage_t =
      provenance::storage::storage<provenance::storage::rocksdb_storage_tag>;
  using service_t = provenance::execution::record_service<
      provenance::storage::rocksdb_storage_tag>;

  explicit service_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{provenance::storage::make_storage<
            provenance::storage::rocksdb_storage_tag>(db_path_)},
        service_{encoder_, storage_} {}

  service_fixture(const service_fixture&) = delete;
  service_fixture& operator=(const service_fixture&) = delete;
  service_fixture(service_fixture&&) = delete;
  service_fixture& operator=(service_fixture&&) = delete;

  ~service_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  provenance::execution::scale_encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }
  service_t& service() { return service_; }

  provenance::schema::product_record_t decode_record(
      const provenance::schema::bytes_t& value) {
    return encoder_.decode<provenance::schema::product_record_t>(
        provenance::schema::make_bytes_view(value));
  }

  std::vector<provenance::schema::product_record_t> decode_records(
      const provenance::schema::bytes_t& value) {
    return encoder_.decode<std::vector<provenance::schema::product_record_t>>(
        provenance::schema::make_bytes_view(value));
  }

  bool decode_bool(const provenance::schema::bytes_t& value) {
    return encoder_.decode<bool>(provenance::schema::make_bytes_view(value));
  }

  /// Stored record for id; fails the calling test when absent.
  provenance::schema::product_record_t fetch(const std::string_view id) {
    auto result = service_.query(id);
    EXPECT_EQ(result.code, 0u) << result.info;
    return decode_record(result.value);
  }

  /// Write raw bytes under key, bypassing the service.
  void put_raw(const std::string_view key,
               const provenance::schema::bytes_t& value) {
    auto error = std::string{};
    auto raw_key = provenance::schema::make_bytes(key);
    ASSERT_TRUE(storage_.put(provenance::schema::make_bytes_view(raw_key),
                             provenance::schema::make_bytes_view(value), error))
        << error;
  }

 private:
  std::string db_path_;
  provenance::execution::scale_encoder_t encoder_;
  storage_t storage_;
  service_t service_;
};

}  // namespace provenance::testing
