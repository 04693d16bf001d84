#ifndef MEDIAPREP_CORE_TIME_UTILS_HPP_
#define MEDIAPREP_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace mediaprep::core {

// RFC 3339 UTC with millisecond precision, e.g. `2024-03-09T14:02:11.348Z`.
// Shared by log lines and RAW capture times. Empty when the time cannot be
// represented.
inline std::string FormatUtcTimestamp(std::chrono::system_clock::time_point timestamp) {
  using std::chrono::milliseconds;
  const auto since_epoch = std::chrono::duration_cast<milliseconds>(timestamp.time_since_epoch());
  const auto whole_seconds = std::chrono::floor<std::chrono::seconds>(since_epoch);
  const auto millis = static_cast<int>((since_epoch - whole_seconds).count());

  const std::time_t seconds = static_cast<std::time_t>(whole_seconds.count());
  std::tm utc{};
  if (gmtime_r(&seconds, &utc) == nullptr) {
    return "";
  }

  char date[32];
  if (std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc) == 0U) {
    return "";
  }
  char text[48];
  std::snprintf(text, sizeof(text), "%s.%03dZ", date, millis);
  return text;
}

inline std::int64_t ElapsedMillis(std::chrono::steady_clock::time_point start,
                                  std::chrono::steady_clock::time_point end) {
  return end <= start
             ? 0
             : std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
}

} // namespace mediaprep::core

#endif // MEDIAPREP_CORE_TIME_UTILS_HPP_
