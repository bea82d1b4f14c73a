#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace glyphchain::common {

/// Log, flush and bring the process down. Reserved for faults the process
/// cannot continue past: the store is unavailable, or bytes this process
/// wrote itself no longer decode.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace glyphchain::common
