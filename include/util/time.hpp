#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
  localtime_r(&tt, &tm);
  return tm;
}

inline std::string NowLocalFormatted(const char *fmt) {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm = LocalTime(tt);
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Human-friendly time for log lines: HH:MM:SS
inline std::string ClockTime() { return NowLocalFormatted("%H:%M:%S"); }

inline std::int64_t EpochMillisUtc() {
  using clock = std::chrono::system_clock;
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             clock::now().time_since_epoch())
      .count();
}

// Stopwatch on the steady clock. Execution times reported to callers are
// taken from here, never from the guest environment.
class Stopwatch {
public:
  using Clock = std::chrono::steady_clock;

  Stopwatch() : started_(Clock::now()) {}

  double ElapsedMillis() const {
    return std::chrono::duration<double, std::milli>(Clock::now() - started_)
        .count();
  }

private:
  Clock::time_point started_;
};

} // namespace timeutil
