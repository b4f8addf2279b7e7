#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace tally::common {

/// Log at critical level, flush every sink and terminate the process.
///
/// Reserved for broken invariants and unrecoverable startup errors; user
/// facing failures are returned as values instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  critical(std::string_view{fmt::format(format, std::forward<Args>(args)...)});
}

}  // namespace tally::common
