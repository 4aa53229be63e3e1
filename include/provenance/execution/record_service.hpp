#pragma once

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <provenance/execution/transaction_context.hpp>
#include <provenance/schema/encoding/scale/encoder.hpp>
#include <provenance/schema/key/product_record.hpp>
#include <provenance/schema/primitives.hpp>
#include <provenance/schema/product_record.hpp>
#include <provenance/schema/query_result.hpp>
#include <provenance/schema/record_error_code.hpp>
#include <provenance/schema/transaction_event.hpp>
#include <provenance/schema/transaction_result.hpp>
#include <provenance/storage/storage.hpp>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace provenance::execution {

using scale_encoder_t = provenance::schema::encoding::encoder<
    provenance::schema::encoding::scale_encoder_tag>;

inline constexpr auto kSeedCodespace = std::string_view{"provenance.seed"};
inline constexpr auto kExistsCodespace = std::string_view{"provenance.exists"};
inline constexpr auto kCreateCodespace = std::string_view{"provenance.create"};
inline constexpr auto kQueryCodespace = std::string_view{"provenance.query"};
inline constexpr auto kUpdateCodespace = std::string_view{"provenance.update"};
inline constexpr auto kTransferCodespace =
    std::string_view{"provenance.transfer"};
inline constexpr auto kListCodespace = std::string_view{"provenance.list"};

/// Genesis product set written by seed_initial_records, stamped with
/// `timestamp` for both creation and last update.
std::vector<provenance::schema::product_record_t> initial_records(
    const provenance::schema::rfc3339_t& timestamp);

namespace detail {

/// First failure an operation hit; copied into its result envelope.
struct failure final {
  provenance::schema::record_error_code code;
  std::string log;
  std::string info;
};

template <typename Result>
Result make_failure(const std::string_view codespace, const failure& cause) {
  auto result = Result{};
  result.code = static_cast<uint32_t>(cause.code);
  result.log = cause.log;
  result.info = cause.info;
  result.codespace = std::string{codespace};
  return result;
}

inline provenance::schema::transaction_event_attribute_t make_attribute(
    std::string key,
    std::string value,
    const bool index = false) {
  return provenance::schema::transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

inline provenance::schema::transaction_event_t make_event(
    std::string type,
    const provenance::schema::product_record_t& record,
    const transaction_context& context) {
  auto event = provenance::schema::transaction_event_t{};
  event.type = std::move(type);
  event.attributes.push_back(make_attribute("id", record.id, true));
  event.attributes.push_back(make_attribute("owner", record.owner));
  event.attributes.push_back(
      make_attribute("tx_id", context.transaction_id));
  return event;
}

}  // namespace detail

/// Product lifecycle operations over the world state.
///
/// Every call is one synchronous invocation: derive the transaction
/// timestamp, read, apply the rule, write at most one key (seeding writes
/// its fixed keys in order). Nothing is cached between calls and no store
/// call is retried; the first failure is returned in the result envelope
/// with the operation's codespace and the product id in `info`.
template <typename StorageLibrary>
class record_service final {
 public:
  using storage_t = provenance::storage::storage<StorageLibrary>;

  explicit record_service(scale_encoder_t& encoder, storage_t& storage);

  /// Render the invoking transaction's timestamp as RFC3339.
  ///
  /// std::nullopt with `error` set when the context carries no timestamp or
  /// the instant cannot be rendered.
  std::optional<provenance::schema::rfc3339_t> derive_timestamp(
      const transaction_context& context,
      std::string& error) const;

  /// Write the genesis product set. Records already stored under the same
  /// ids are overwritten.
  provenance::schema::transaction_result_t seed_initial_records(
      const transaction_context& context);

  /// `value` holds the encoded bool; empty stored values count as absent.
  provenance::schema::query_result_t exists(std::string_view id) const;

  provenance::schema::transaction_result_t create(
      const transaction_context& context,
      std::string_view id,
      std::string_view name,
      std::string_view owner,
      std::string_view description,
      std::string_view category);

  /// `value` holds the encoded product record.
  provenance::schema::query_result_t query(std::string_view id) const;

  /// Selective update: an empty argument keeps the current value, so none
  /// of these fields can be cleared here. `updated_at` is always refreshed.
  provenance::schema::transaction_result_t update(
      const transaction_context& context,
      std::string_view id,
      std::string_view new_status,
      std::string_view new_owner,
      std::string_view new_description,
      std::string_view new_category);

  /// Unconditional owner change; an empty owner is stored as given.
  provenance::schema::transaction_result_t transfer_ownership(
      const transaction_context& context,
      std::string_view id,
      std::string_view new_owner);

  /// Full keyspace scan in ascending key order. `value` holds the encoded
  /// std::vector<product_record_t>. Aborts on the first unreadable entry.
  provenance::schema::query_result_t list_all() const;

 private:
  std::optional<detail::failure> stamp(
      const transaction_context& context,
      provenance::schema::rfc3339_t& timestamp) const;
  std::optional<detail::failure> read_value(
      std::string_view id,
      std::optional<provenance::schema::bytes_t>& value) const;
  std::optional<detail::failure> load(
      std::string_view id,
      provenance::schema::product_record_t& record) const;
  std::optional<detail::failure> store(
      const provenance::schema::product_record_t& record,
      provenance::schema::bytes_t& encoded) const;
  std::optional<provenance::schema::product_record_t> decode(
      const provenance::schema::bytes_view_t& bytes,
      std::string& error) const;

  scale_encoder_t& encoder_;
  storage_t& storage_;
};

template <typename StorageLibrary>
record_service<StorageLibrary>::record_service(scale_encoder_t& encoder,
                                               storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

template <typename StorageLibrary>
std::optional<provenance::schema::rfc3339_t>
record_service<StorageLibrary>::derive_timestamp(
    const transaction_context& context,
    std::string& error) const {
  if (!context.timestamp) {
    error = "transaction context carries no timestamp";
    return std::nullopt;
  }
  return make_rfc3339(*context.timestamp, error);
}

template <typename StorageLibrary>
provenance::schema::transaction_result_t
record_service<StorageLibrary>::seed_initial_records(
    const transaction_context& context) {
  using provenance::schema::transaction_result_t;

  auto timestamp = provenance::schema::rfc3339_t{};
  if (auto failure = stamp(context, timestamp)) {
    return detail::make_failure<transaction_result_t>(kSeedCodespace,
                                                      *failure);
  }

  auto records = initial_records(timestamp);
  for (const auto& record : records) {
    auto encoded = provenance::schema::bytes_t{};
    if (auto failure = store(record, encoded)) {
      return detail::make_failure<transaction_result_t>(kSeedCodespace,
                                                        *failure);
    }
  }

  auto result = transaction_result_t{};
  result.codespace = std::string{kSeedCodespace};
  result.data = encoder_.encode(records);
  auto event = provenance::schema::transaction_event_t{};
  event.type = "ledger_seeded";
  event.attributes.push_back(
      detail::make_attribute("count", std::to_string(records.size())));
  event.attributes.push_back(
      detail::make_attribute("tx_id", context.transaction_id));
  result.events.push_back(std::move(event));
  spdlog::info("Seeded {} product(s) at {}", records.size(), timestamp);
  return result;
}

template <typename StorageLibrary>
provenance::schema::query_result_t record_service<StorageLibrary>::exists(
    const std::string_view id) const {
  using provenance::schema::query_result_t;

  auto value = std::optional<provenance::schema::bytes_t>{};
  if (auto failure = read_value(id, value)) {
    auto result =
        detail::make_failure<query_result_t>(kExistsCodespace, *failure);
    result.key = provenance::schema::key::make_key(id);
    return result;
  }

  auto result = query_result_t{};
  result.key = provenance::schema::key::make_key(id);
  result.value = encoder_.encode(value.has_value());
  result.codespace = std::string{kExistsCodespace};
  return result;
}

template <typename StorageLibrary>
provenance::schema::transaction_result_t record_service<StorageLibrary>::create(
    const transaction_context& context,
    const std::string_view id,
    const std::string_view name,
    const std::string_view owner,
    const std::string_view description,
    const std::string_view category) {
  using provenance::schema::record_error_code;
  using provenance::schema::transaction_result_t;

  if (id.empty() || name.empty() || owner.empty()) {
    spdlog::debug("Rejecting product creation with missing id, name or owner");
    return detail::make_failure<transaction_result_t>(
        kCreateCodespace,
        detail::failure{.code = record_error_code::invalid_argument,
                        .log = "invalid product",
                        .info = fmt::format(
                            "product id, name and owner are required (id "
                            "'{}', name '{}', owner '{}')",
                            id, name, owner)});
  }

  auto timestamp = provenance::schema::rfc3339_t{};
  if (auto failure = stamp(context, timestamp)) {
    return detail::make_failure<transaction_result_t>(kCreateCodespace,
                                                      *failure);
  }

  auto existing = std::optional<provenance::schema::bytes_t>{};
  if (auto failure = read_value(id, existing)) {
    return detail::make_failure<transaction_result_t>(kCreateCodespace,
                                                      *failure);
  }
  if (existing) {
    spdlog::debug("Product '{}' already exists", id);
    return detail::make_failure<transaction_result_t>(
        kCreateCodespace,
        detail::failure{
            .code = record_error_code::product_exists,
            .log = "product already exists",
            .info = fmt::format("product with ID {} already exists", id)});
  }

  auto record = provenance::schema::product_record_t{
      .id = std::string{id},
      .name = std::string{name},
      .status = std::string{provenance::schema::kManufacturedStatus},
      .owner = std::string{owner},
      .created_at = timestamp,
      .updated_at = timestamp,
      .description = std::string{description},
      .category = std::string{category}};

  auto result = transaction_result_t{};
  if (auto failure = store(record, result.data)) {
    return detail::make_failure<transaction_result_t>(kCreateCodespace,
                                                      *failure);
  }
  result.codespace = std::string{kCreateCodespace};
  result.events.push_back(detail::make_event("product_created", record, context));
  spdlog::debug("Created product '{}' owned by '{}'", record.id, record.owner);
  return result;
}

template <typename StorageLibrary>
provenance::schema::query_result_t record_service<StorageLibrary>::query(
    const std::string_view id) const {
  using provenance::schema::query_result_t;

  auto record = provenance::schema::product_record_t{};
  if (auto failure = load(id, record)) {
    auto result =
        detail::make_failure<query_result_t>(kQueryCodespace, *failure);
    result.key = provenance::schema::key::make_key(id);
    return result;
  }

  auto result = query_result_t{};
  result.key = provenance::schema::key::make_key(id);
  result.value = encoder_.encode(record);
  result.codespace = std::string{kQueryCodespace};
  return result;
}

template <typename StorageLibrary>
provenance::schema::transaction_result_t record_service<StorageLibrary>::update(
    const transaction_context& context,
    const std::string_view id,
    const std::string_view new_status,
    const std::string_view new_owner,
    const std::string_view new_description,
    const std::string_view new_category) {
  using provenance::schema::transaction_result_t;

  auto timestamp = provenance::schema::rfc3339_t{};
  if (auto failure = stamp(context, timestamp)) {
    return detail::make_failure<transaction_result_t>(kUpdateCodespace,
                                                      *failure);
  }

  auto record = provenance::schema::product_record_t{};
  if (auto failure = load(id, record)) {
    return detail::make_failure<transaction_result_t>(kUpdateCodespace,
                                                      *failure);
  }

  if (!new_status.empty()) {
    record.status = new_status;
  }
  if (!new_owner.empty()) {
    record.owner = new_owner;
  }
  if (!new_description.empty()) {
    record.description = new_description;
  }
  if (!new_category.empty()) {
    record.category = new_category;
  }
  record.updated_at = timestamp;

  auto result = transaction_result_t{};
  if (auto failure = store(record, result.data)) {
    return detail::make_failure<transaction_result_t>(kUpdateCodespace,
                                                      *failure);
  }
  result.codespace = std::string{kUpdateCodespace};
  auto event = detail::make_event("product_updated", record, context);
  event.attributes.push_back(detail::make_attribute("status", record.status));
  result.events.push_back(std::move(event));
  spdlog::debug("Updated product '{}' (status '{}', owner '{}')", record.id,
                record.status, record.owner);
  return result;
}

template <typename StorageLibrary>
provenance::schema::transaction_result_t
record_service<StorageLibrary>::transfer_ownership(
    const transaction_context& context,
    const std::string_view id,
    const std::string_view new_owner) {
  using provenance::schema::transaction_result_t;

  auto timestamp = provenance::schema::rfc3339_t{};
  if (auto failure = stamp(context, timestamp)) {
    return detail::make_failure<transaction_result_t>(kTransferCodespace,
                                                      *failure);
  }

  auto record = provenance::schema::product_record_t{};
  if (auto failure = load(id, record)) {
    return detail::make_failure<transaction_result_t>(kTransferCodespace,
                                                      *failure);
  }

  auto previous_owner = std::exchange(record.owner, std::string{new_owner});
  record.updated_at = timestamp;

  auto result = transaction_result_t{};
  if (auto failure = store(record, result.data)) {
    return detail::make_failure<transaction_result_t>(kTransferCodespace,
                                                      *failure);
  }
  result.codespace = std::string{kTransferCodespace};
  auto event = detail::make_event("product_transferred", record, context);
  event.attributes.push_back(
      detail::make_attribute("previous_owner", previous_owner));
  result.events.push_back(std::move(event));
  spdlog::debug("Transferred product '{}' from '{}' to '{}'", record.id,
                previous_owner, record.owner);
  return result;
}

template <typename StorageLibrary>
provenance::schema::query_result_t record_service<StorageLibrary>::list_all()
    const {
  using provenance::schema::query_result_t;
  using provenance::schema::record_error_code;

  auto error = std::string{};
  auto cursor = storage_.scan(provenance::schema::bytes_view_t{},
                              provenance::schema::bytes_view_t{}, error);
  if (!cursor) {
    spdlog::warn("Failed to open world state range scan: {}", error);
    return detail::make_failure<query_result_t>(
        kListCodespace,
        detail::failure{.code = record_error_code::store_read_failed,
                        .log = "failed to open world state range scan",
                        .info = error});
  }

  auto records = std::vector<provenance::schema::product_record_t>{};
  auto entry = provenance::storage::key_value_entry_t{};
  while (cursor->has_next()) {
    if (!cursor->next(entry, error)) {
      spdlog::warn("World state range scan failed: {}", error);
      return detail::make_failure<query_result_t>(
          kListCodespace,
          detail::failure{.code = record_error_code::store_read_failed,
                          .log = "failed to iterate world state",
                          .info = error});
    }
    if (entry.second.empty()) {
      continue;
    }
    auto decoded = decode(provenance::schema::make_bytes_view(entry.second),
                          error);
    if (!decoded) {
      spdlog::warn("Undecodable product at key {}: {}",
                   provenance::schema::to_hex(
                       provenance::schema::make_bytes_view(entry.first)),
                   error);
      return detail::make_failure<query_result_t>(
          kListCodespace,
          detail::failure{
              .code = record_error_code::decode_failed,
              .log = "failed to decode product",
              .info = fmt::format("product {}: {}",
                                  provenance::schema::make_string(entry.first),
                                  error)});
    }
    records.push_back(std::move(*decoded));
  }
  if (!cursor->healthy(error)) {
    spdlog::warn("World state range scan ended early: {}", error);
    return detail::make_failure<query_result_t>(
        kListCodespace,
        detail::failure{.code = record_error_code::store_read_failed,
                        .log = "failed to iterate world state",
                        .info = error});
  }
  cursor->close();

  auto result = query_result_t{};
  result.value = encoder_.encode(records);
  result.codespace = std::string{kListCodespace};
  return result;
}

template <typename StorageLibrary>
std::optional<detail::failure> record_service<StorageLibrary>::stamp(
    const transaction_context& context,
    provenance::schema::rfc3339_t& timestamp) const {
  auto error = std::string{};
  auto derived = derive_timestamp(context, error);
  if (!derived) {
    spdlog::warn("Transaction '{}' has no usable timestamp: {}",
                 context.transaction_id, error);
    return detail::failure{
        .code = provenance::schema::record_error_code::clock_unavailable,
        .log = "failed to get transaction timestamp",
        .info = error};
  }
  timestamp = std::move(*derived);
  return std::nullopt;
}

template <typename StorageLibrary>
std::optional<detail::failure> record_service<StorageLibrary>::read_value(
    const std::string_view id,
    std::optional<provenance::schema::bytes_t>& value) const {
  auto error = std::string{};
  auto key = provenance::schema::key::make_key(id);
  if (!storage_.get(provenance::schema::make_bytes_view(key), value, error)) {
    spdlog::warn("Failed to read product '{}' from world state: {}", id,
                 error);
    return detail::failure{
        .code = provenance::schema::record_error_code::store_read_failed,
        .log = "failed to read from world state",
        .info = fmt::format("product {}: {}", id, error)};
  }
  if (value && value->empty()) {
    value = std::nullopt;
  }
  return std::nullopt;
}

template <typename StorageLibrary>
std::optional<detail::failure> record_service<StorageLibrary>::load(
    const std::string_view id,
    provenance::schema::product_record_t& record) const {
  auto value = std::optional<provenance::schema::bytes_t>{};
  if (auto failure = read_value(id, value)) {
    return failure;
  }
  if (!value) {
    spdlog::debug("Product '{}' does not exist", id);
    return detail::failure{
        .code = provenance::schema::record_error_code::product_not_found,
        .log = "product not found",
        .info = fmt::format("product with ID {} does not exist", id)};
  }

  auto error = std::string{};
  auto decoded = decode(provenance::schema::make_bytes_view(*value), error);
  if (!decoded) {
    spdlog::warn("Stored product '{}' is undecodable: {}", id, error);
    return detail::failure{
        .code = provenance::schema::record_error_code::decode_failed,
        .log = "failed to decode product",
        .info = fmt::format("product {}: {}", id, error)};
  }
  record = std::move(*decoded);
  return std::nullopt;
}

template <typename StorageLibrary>
std::optional<detail::failure> record_service<StorageLibrary>::store(
    const provenance::schema::product_record_t& record,
    provenance::schema::bytes_t& encoded) const {
  encoded = encoder_.encode(record);
  auto error = std::string{};
  auto key = provenance::schema::key::make_key(record);
  if (!storage_.put(provenance::schema::make_bytes_view(key),
                    provenance::schema::make_bytes_view(encoded), error)) {
    spdlog::warn("Failed to write product '{}' to world state: {}", record.id,
                 error);
    return detail::failure{
        .code = provenance::schema::record_error_code::store_write_failed,
        .log = "failed to put to world state",
        .info = fmt::format("product {}: {}", record.id, error)};
  }
  return std::nullopt;
}

template <typename StorageLibrary>
std::optional<provenance::schema::product_record_t>
record_service<StorageLibrary>::decode(
    const provenance::schema::bytes_view_t& bytes,
    std::string& error) const {
  try {
    auto decoded =
        encoder_.try_decode<provenance::schema::product_record_t>(bytes);
    if (!decoded) {
      error = "malformed product record encoding";
      return std::nullopt;
    }
    if (decoded->version != 1) {
      error = fmt::format("unsupported product record version {}",
                          decoded->version);
      return std::nullopt;
    }
    return decoded;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace provenance::execution
