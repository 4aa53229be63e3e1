#pragma once

#include <provenance/execution/transaction_context.hpp>
#include <provenance/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace provenance::testing {

// 2023-11-14T22:13:20Z
inline constexpr auto kGenesisSeconds = int64_t{1'700'000'000};
inline constexpr auto kGenesisRfc3339 = std::string_view{"2023-11-14T22:13:20Z"};

inline provenance::execution::transaction_context make_context(
    const int64_t seconds,
    const int64_t nanos = 0,
    std::string transaction_id = "tx-test") {
  return provenance::execution::transaction_context{
      .transaction_id = std::move(transaction_id),
      .timestamp = provenance::execution::transaction_timestamp{
          .seconds = seconds, .nanos = nanos}};
}

inline provenance::execution::transaction_context make_context_without_clock(
    std::string transaction_id = "tx-no-clock") {
  return provenance::execution::transaction_context{
      .transaction_id = std::move(transaction_id), .timestamp = std::nullopt};
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace provenance::testing
