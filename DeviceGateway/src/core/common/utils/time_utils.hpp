#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <sstream>
#include <string>

namespace devgw::core::common::time {

using SteadyClock = std::chrono::steady_clock;
using SteadyTime = SteadyClock::time_point;

// Source of monotonic time. Components accept one so tests can drive timeouts.
using SteadyNowFn = std::function<SteadyTime()>;

inline SteadyTime SteadyNow() { return SteadyClock::now(); }

inline std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

inline std::string FormatIso8601Utc(std::int64_t unix_ms) {
  const std::time_t tt = static_cast<std::time_t>(unix_ms / 1000);

  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(3) << std::setfill('0') << (unix_ms % 1000) << 'Z';
  return oss.str();
}

inline std::string NowIso8601Utc() { return FormatIso8601Utc(NowUnixMs()); }

inline std::int64_t ElapsedMs(SteadyTime from, SteadyTime to) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

}  // namespace devgw::core::common::time
