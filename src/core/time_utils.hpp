#ifndef SCENEVAULT_CORE_TIME_UTILS_HPP_
#define SCENEVAULT_CORE_TIME_UTILS_HPP_

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace scenevault::core {

// Canonical UTC timestamp formatter used by records, views and log lines.
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

// Persisted records store epoch milliseconds; the ISO form is for humans only.
inline std::int64_t ToEpochMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(timestamp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point FromEpochMilliseconds(std::int64_t epoch_ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(epoch_ms));
}

// Drops sub-millisecond precision so in-memory values equal their persisted form.
inline std::chrono::system_clock::time_point TruncateToMilliseconds(
    std::chrono::system_clock::time_point timestamp) {
  return FromEpochMilliseconds(ToEpochMilliseconds(timestamp));
}

// True when `timestamp` survives a millisecond round trip unchanged.
inline bool IsWholeMilliseconds(std::chrono::system_clock::time_point timestamp) {
  return TruncateToMilliseconds(timestamp) == timestamp;
}

} // namespace scenevault::core

#endif // SCENEVAULT_CORE_TIME_UTILS_HPP_
