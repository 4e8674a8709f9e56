#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace gateway::common {

/// Log and terminate on an infrastructure fault the current call cannot
/// recover from (storage I/O, corrupt persisted state, crypto backend).
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace gateway::common
