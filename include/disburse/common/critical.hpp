#pragma once
#include <spdlog/spdlog.h>
#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

namespace disburse::common {

/// Report an unrecoverable invariant violation and stop the process.
///
/// Used for ledger conservation failures and corrupted persisted state, never
/// for ordinary domain errors which travel back as operation results.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace disburse::common
