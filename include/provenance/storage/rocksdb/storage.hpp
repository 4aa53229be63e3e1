#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <provenance/common/critical.hpp>
#include <provenance/storage/storage.hpp>
#include <memory>
#include <string_view>

namespace provenance::storage {

namespace detail {

inline provenance::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const provenance::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct range_cursor<rocksdb_storage_tag> final {
  // Declared before the iterator: the iterator reads the bound until it is
  // destroyed.
  std::unique_ptr<std::string> upper_bound;
  std::unique_ptr<ROCKSDB_NAMESPACE::Slice> upper_bound_slice;
  std::unique_ptr<ROCKSDB_NAMESPACE::Iterator> iterator;

  bool has_next() const;
  bool next(key_value_entry_t& entry, std::string& error);
  bool healthy(std::string& error) const;
  void close();
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  bool get(const provenance::schema::bytes_view_t& key,
           std::optional<provenance::schema::bytes_t>& value,
           std::string& error) const;
  bool put(const provenance::schema::bytes_view_t& key,
           const provenance::schema::bytes_view_t& value,
           std::string& error) const;
  std::optional<range_cursor<rocksdb_storage_tag>> scan(
      const provenance::schema::bytes_view_t& start,
      const provenance::schema::bytes_view_t& end,
      std::string& error) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

inline bool range_cursor<rocksdb_storage_tag>::has_next() const {
  return iterator && iterator->Valid();
}

inline bool range_cursor<rocksdb_storage_tag>::next(key_value_entry_t& entry,
                                                    std::string& error) {
  if (!iterator) {
    error = "range cursor is closed";
    return false;
  }
  if (!iterator->Valid()) {
    auto status = iterator->status();
    error = status.ok() ? std::string{"range cursor is exhausted"}
                        : status.ToString();
    return false;
  }
  entry = key_value_entry_t{detail::to_bytes(iterator->key()),
                            detail::to_bytes(iterator->value())};
  iterator->Next();
  return true;
}

inline bool range_cursor<rocksdb_storage_tag>::healthy(
    std::string& error) const {
  if (!iterator) {
    return true;
  }
  auto status = iterator->status();
  if (!status.ok()) {
    error = status.ToString();
    return false;
  }
  return true;
}

inline void range_cursor<rocksdb_storage_tag>::close() {
  iterator.reset();
  upper_bound_slice.reset();
  upper_bound.reset();
}

inline bool storage<rocksdb_storage_tag>::get(
    const provenance::schema::bytes_view_t& key,
    std::optional<provenance::schema::bytes_t>& value,
    std::string& error) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &raw);
  if (status.IsNotFound()) {
    value = std::nullopt;
    return true;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    error = status.ToString();
    return false;
  }
  value = provenance::schema::make_bytes(raw);
  return true;
}

inline bool storage<rocksdb_storage_tag>::put(
    const provenance::schema::bytes_view_t& key,
    const provenance::schema::bytes_view_t& value,
    std::string& error) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key), detail::to_slice(value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    error = status.ToString();
    return false;
  }
  return true;
}

inline std::optional<range_cursor<rocksdb_storage_tag>>
storage<rocksdb_storage_tag>::scan(const provenance::schema::bytes_view_t& start,
                                   const provenance::schema::bytes_view_t& end,
                                   std::string& error) const {
  if (!database) {
    provenance::common::critical("RocksDB database is not initialized");
  }

  auto cursor = range_cursor<rocksdb_storage_tag>{};
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  if (!end.empty()) {
    cursor.upper_bound =
        std::make_unique<std::string>(provenance::schema::make_string(end));
    cursor.upper_bound_slice =
        std::make_unique<ROCKSDB_NAMESPACE::Slice>(*cursor.upper_bound);
    read_options.iterate_upper_bound = cursor.upper_bound_slice.get();
  }

  cursor.iterator.reset(database->NewIterator(read_options));
  if (start.empty()) {
    cursor.iterator->SeekToFirst();
  } else {
    cursor.iterator->Seek(detail::to_slice(start));
  }

  auto status = cursor.iterator->status();
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB range scan: {}", status.ToString());
    error = status.ToString();
    return std::nullopt;
  }
  return std::make_optional(std::move(cursor));
}

}  // namespace provenance::storage
