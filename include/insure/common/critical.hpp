#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace insure::common {

/// Log an unrecoverable infrastructure failure, flush every sink and stop the
/// process. Domain failures never come through here.
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

}  // namespace insure::common
