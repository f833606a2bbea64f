#ifndef CORESIDENCY_CORE_TIME_UTILS_HPP_
#define CORESIDENCY_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace coresidency::core {

// UTC timestamp with millisecond precision, e.g. 2026-01-02T03:04:05.678Z.
// Used for the ts_utc field of every log line.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  const auto millis_since_epoch =
      std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch()).count();
  const auto millis_component = static_cast<int>((millis_since_epoch % 1000 + 1000) % 1000);

  const std::time_t epoch_seconds = std::chrono::system_clock::to_time_t(timestamp);
  std::tm utc_time{};
#if defined(_WIN32)
  const errno_t result = gmtime_s(&utc_time, &epoch_seconds);
  if (result != 0) {
    return "";
  }
#else
  const std::tm* result = gmtime_r(&epoch_seconds, &utc_time);
  if (result == nullptr) {
    return "";
  }
#endif

  std::ostringstream out;
  out << std::put_time(&utc_time, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis_component << 'Z';
  return out.str();
}

// Milliseconds between two steady-clock points, clamped at zero.
inline std::uint64_t ElapsedMillis(std::chrono::steady_clock::time_point begin,
                                   std::chrono::steady_clock::time_point end) {
  if (end <= begin) {
    return 0;
  }
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(end - begin).count());
}

} // namespace coresidency::core

#endif // CORESIDENCY_CORE_TIME_UTILS_HPP_
