#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace kraken::common {

/// Broken framework invariant (a linear token dropped while live, a corrupt
/// store). Unlike `fail`, this is never a transaction outcome: nothing can be
/// rolled back safely, so the process goes down after flushing the logs.
template <typename... Args>
[[noreturn]] void critical(fmt::format_string<Args...> format,
                           Args&&... args) {
  spdlog::critical("kraken invariant violated: {}",
                   fmt::format(format, std::forward<Args>(args)...));
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace kraken::common
