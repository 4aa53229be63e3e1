#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <spdlog/fmt/fmt.h>
#include <provenance/execution/transaction_context.hpp>

namespace provenance::execution {

namespace {

constexpr auto kNanosPerSecond = int64_t{1'000'000'000};
// 1400-01-01T00:00:00Z and 9999-12-31T23:59:59Z, the posix_time limits.
constexpr auto kMinEpochSeconds = int64_t{-17'987'443'200};
constexpr auto kMaxEpochSeconds = int64_t{253'402'300'799};

}  // namespace

std::optional<provenance::schema::rfc3339_t> make_rfc3339(
    const transaction_timestamp& timestamp,
    std::string& error) {
  if (timestamp.seconds < kMinEpochSeconds ||
      timestamp.seconds > kMaxEpochSeconds) {
    error = fmt::format("transaction timestamp {}s is outside the calendar",
                        timestamp.seconds);
    return std::nullopt;
  }

  auto seconds = timestamp.seconds + (timestamp.nanos / kNanosPerSecond);
  if ((timestamp.nanos % kNanosPerSecond) < 0) {
    --seconds;
  }
  if (seconds < kMinEpochSeconds || seconds > kMaxEpochSeconds) {
    error = fmt::format("transaction timestamp {}s {}ns is outside the calendar",
                        timestamp.seconds, timestamp.nanos);
    return std::nullopt;
  }

  auto epoch =
      boost::posix_time::ptime{boost::gregorian::date{1970, 1, 1}};
  auto instant = epoch + boost::posix_time::seconds{static_cast<long>(seconds)};
  return boost::posix_time::to_iso_extended_string(instant) + "Z";
}

}  // namespace provenance::execution
