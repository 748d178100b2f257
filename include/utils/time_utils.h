#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                          std::chrono::microseconds>;

namespace TimeUtils {

// Wall clock in local time with millisecond precision, for log lines only.
inline std::string getCurrentTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::stringstream ss;
  struct tm tm_buf;
  std::tm *tm_ptr = localtime_r(&time_t, &tm_buf);
  if (!tm_ptr) {
    return "";
  }
  ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
  ss << "." << std::setfill('0') << std::setw(3) << ms.count();
  return ss.str();
}

Timestamp makeTimestamp(int year, unsigned month, unsigned day,
                        unsigned hour = 0, unsigned minute = 0,
                        unsigned second = 0, unsigned microsecond = 0);

// 1970-01-01 00:00:00, used as valid_from of the first version of a key.
Timestamp minTimestamp();

// 9999-12-31 23:59:59, used as valid_to of the open-ended version.
Timestamp maxTimestamp();

// Canonical form "YYYY-MM-DD HH:MM:SS.ffffff". Fixed width and sortable.
std::string formatTimestamp(Timestamp ts);
std::string formatDate(Timestamp ts);
std::string formatTimeOfDay(Timestamp ts);

// Accepts "YYYY-MM-DD", "YYYY-MM-DD HH:MM:SS" with an optional fraction of
// up to six digits, a 'T' separator and a trailing 'Z'. Throws
// std::invalid_argument on anything else.
Timestamp parseTimestamp(const std::string &text);
std::optional<Timestamp> tryParseTimestamp(const std::string &text);

// Only the canonical form is accepted. Used where the textual form is part of
// an identifier and must round-trip byte for byte.
Timestamp parseCanonicalTimestamp(const std::string &text);

// Converts fractional seconds since the epoch (the extraction load id) to a
// timestamp rounded to the microsecond.
Timestamp fromEpochSeconds(double seconds);

int64_t toEpochMicros(Timestamp ts);
Timestamp fromEpochMicros(int64_t micros);

} // namespace TimeUtils

#endif
