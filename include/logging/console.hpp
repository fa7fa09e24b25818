#pragma once

#include "util/time.hpp"
#include <atomic>
#include <iostream>
#include <sstream>
#include <string_view>

namespace logging {

inline std::atomic<bool> g_console_enabled{true};

inline void SetConsoleEnabled(bool enabled) {
  g_console_enabled.store(enabled, std::memory_order_relaxed);
}

// One line per call on stderr: "HH:MM:SS [who] message". The line is built
// first so concurrent writers do not interleave mid-line.
inline void Console(std::string_view who, std::string_view message) {
  if (!g_console_enabled.load(std::memory_order_relaxed)) {
    return;
  }
  std::ostringstream line;
  line << timeutil::ClockTime() << " [" << who << "] " << message << "\n";
  std::cerr << line.str();
}

} // namespace logging
