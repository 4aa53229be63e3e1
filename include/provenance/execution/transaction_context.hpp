#pragma once

#include <provenance/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace provenance::execution {

/// Declared time of the invoking transaction. Every replica executing the
/// transaction observes the same value.
struct transaction_timestamp final {
  int64_t seconds{};
  int64_t nanos{};
};

/// Per-invocation context supplied by the hosting ledger runtime.
struct transaction_context final {
  std::string transaction_id;
  std::optional<transaction_timestamp> timestamp;
};

/// Render a transaction timestamp as RFC3339 in UTC at second precision.
///
/// Nanoseconds outside [0, 1e9) carry into the seconds field before the
/// sub-second part is dropped. Returns std::nullopt with `error` set when the
/// instant falls outside the supported calendar (years 1400 through 9999).
std::optional<provenance::schema::rfc3339_t> make_rfc3339(
    const transaction_timestamp& timestamp,
    std::string& error);

}  // namespace provenance::execution
