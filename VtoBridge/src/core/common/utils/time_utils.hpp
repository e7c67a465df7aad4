#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>
#include <thread>

namespace vtob::core::common::time {

inline std::int64_t NowUnixMs() {
  const auto now = std::chrono::system_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

// Monotonic; use for intervals and deadlines, never for display.
inline std::int64_t SteadyMs() {
  const auto now = std::chrono::steady_clock::now();
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch());
  return static_cast<std::int64_t>(ms.count());
}

inline std::string ToIso8601Utc(std::int64_t unix_ms) {
  if (unix_ms <= 0) return std::string();
  const std::time_t tt = static_cast<std::time_t>(unix_ms / 1000);

  std::tm tm{};
  gmtime_r(&tt, &tm);

  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return oss.str();
}

inline std::string NowIso8601Utc() { return ToIso8601Utc(NowUnixMs()); }

inline void SleepMs(std::uint32_t ms) {
  std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

}  // namespace vtob::core::common::time
