#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ibc::common {

/// Log an unrecoverable invariant violation and terminate the process.
///
/// Only used where the failure cannot be caused by message input (a corrupt
/// store, a broken backend). Input-dependent failures return `error_t`.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace ibc::common
