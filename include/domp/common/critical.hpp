#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace domp::common {

/// Log, flush and terminate. Reserved for local infrastructure failures
/// (store cannot be opened or written, encoder invariants); protocol errors
/// travel as result codes instead.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace domp::common
