#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace timeutil {

// Returns std::tm for local time corresponding to the given time_t in a
// thread-safe way across platforms.
inline std::tm LocalTime(const std::time_t &tt) {
  std::tm tm{};
#if defined(_WIN32)
  localtime_s(&tm, &tt);
#else
  localtime_r(&tt, &tm);
#endif
  return tm;
}

// Formats given std::tm using the provided strftime-like format string.
inline std::string FormatTm(const std::tm &tm, const char *fmt) {
  std::ostringstream oss;
  oss << std::put_time(&tm, fmt);
  return oss.str();
}

// Formats current local time using the provided format string.
inline std::string NowLocalFormatted(const char *fmt) {
  auto now = std::chrono::system_clock::now();
  std::time_t tt = std::chrono::system_clock::to_time_t(now);
  std::tm tm = LocalTime(tt);
  return FormatTm(tm, fmt);
}

// Log record prefix: YYYY/MM/DD HH:MM:SS
inline std::string LogTimestamp() {
  return NowLocalFormatted("%Y/%m/%d %H:%M:%S");
}

// Human-friendly duration for log lines, e.g. "1.532s" or "12ms".
template <typename Rep, typename Period>
inline std::string FormatDuration(std::chrono::duration<Rep, Period> d) {
  using namespace std::chrono;
  const auto ms = duration_cast<milliseconds>(d).count();
  std::ostringstream oss;
  if (ms < 1000) {
    oss << ms << "ms";
  } else {
    oss << std::fixed << std::setprecision(3)
        << duration_cast<duration<double>>(d).count() << "s";
  }
  return oss.str();
}

} // namespace timeutil
