#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace provenance::common {

/// Log, flush and terminate. Reserved for broken invariants and unusable
/// environments; expected failures travel in result envelopes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace provenance::common
