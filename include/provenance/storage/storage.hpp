#pragma once
#include <provenance/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace provenance::storage {

using key_value_entry_t =
    std::pair<provenance::schema::bytes_t, provenance::schema::bytes_t>;

/// Lazy, forward-only, non-restartable view over a key range in ascending
/// key order. Backend resources are held until close() or destruction.
template <typename Library>
struct range_cursor {
  /// True while another entry can be read.
  bool has_next() const;

  /// Read the current entry and advance. Returns false with `error` set when
  /// the cursor is exhausted, closed, or the backend fails.
  bool next(key_value_entry_t& entry, std::string& error);

  /// Report a backend failure that ended iteration early.
  bool healthy(std::string& error) const;

  /// Release backend resources. Idempotent.
  void close();
};

/// World state key-value store.
///
/// Every call reports backend failure through its return value and `error`
/// rather than terminating, so callers can surface the failure upward.
template <typename Library>
struct storage {
  /// Read the raw value at key. `value` is std::nullopt when missing.
  bool get(const provenance::schema::bytes_view_t& key,
           std::optional<provenance::schema::bytes_t>& value,
           std::string& error) const;

  /// Persist raw value at key, replacing any previous value.
  bool put(const provenance::schema::bytes_view_t& key,
           const provenance::schema::bytes_view_t& value,
           std::string& error) const;

  /// Open a cursor over [start, end). An empty bound leaves that side open,
  /// so two empty bounds cover the whole keyspace.
  std::optional<range_cursor<Library>> scan(
      const provenance::schema::bytes_view_t& start,
      const provenance::schema::bytes_view_t& end,
      std::string& error) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace provenance::storage
