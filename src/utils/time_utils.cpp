#include "utils/time_utils.h"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace {

constexpr int64_t MICROS_PER_SECOND = 1000000;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr size_t CANONICAL_LENGTH = 26;

// Days since 1970-01-01 for a proleptic Gregorian date (H. Hinnant's
// days_from_civil).
int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
  y -= m <= 2;
  const int64_t era = (y >= 0 ? y : y - 399) / 400;
  const unsigned yoe = static_cast<unsigned>(y - era * 400);
  const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
  const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
  return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

struct CivilDate {
  int64_t year;
  unsigned month;
  unsigned day;
};

CivilDate civilFromDays(int64_t z) {
  z += 719468;
  const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
  const unsigned doe = static_cast<unsigned>(z - era * 146097);
  const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
  const int64_t y = static_cast<int64_t>(yoe) + era * 400;
  const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
  const unsigned mp = (5 * doy + 2) / 153;
  const unsigned d = doy - (153 * mp + 2) / 5 + 1;
  const unsigned m = mp < 10 ? mp + 3 : mp - 9;
  return {y + (m <= 2), m, d};
}

bool isLeapYear(int64_t y) {
  return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

unsigned daysInMonth(int64_t y, unsigned m) {
  static const unsigned days[] = {31, 28, 31, 30, 31, 30,
                                  31, 31, 30, 31, 30, 31};
  if (m == 2 && isLeapYear(y))
    return 29;
  return days[m - 1];
}

struct Decomposed {
  CivilDate date;
  unsigned hour;
  unsigned minute;
  unsigned second;
  unsigned micros;
};

Decomposed decompose(Timestamp ts) {
  int64_t micros = ts.time_since_epoch().count();
  int64_t days = micros / (SECONDS_PER_DAY * MICROS_PER_SECOND);
  int64_t rem = micros % (SECONDS_PER_DAY * MICROS_PER_SECOND);
  if (rem < 0) {
    rem += SECONDS_PER_DAY * MICROS_PER_SECOND;
    --days;
  }
  Decomposed out;
  out.date = civilFromDays(days);
  int64_t secs = rem / MICROS_PER_SECOND;
  out.micros = static_cast<unsigned>(rem % MICROS_PER_SECOND);
  out.hour = static_cast<unsigned>(secs / 3600);
  out.minute = static_cast<unsigned>((secs % 3600) / 60);
  out.second = static_cast<unsigned>(secs % 60);
  return out;
}

bool readDigits(const std::string &text, size_t pos, size_t count,
                unsigned &value) {
  if (pos + count > text.size())
    return false;
  value = 0;
  for (size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i])))
      return false;
    value = value * 10 + static_cast<unsigned>(text[i] - '0');
  }
  return true;
}

std::optional<Timestamp> parse(const std::string &text, bool canonicalOnly) {
  if (canonicalOnly && text.size() != CANONICAL_LENGTH)
    return std::nullopt;

  unsigned year = 0, month = 0, day = 0;
  if (!readDigits(text, 0, 4, year) || text.size() < 10 || text[4] != '-' ||
      !readDigits(text, 5, 2, month) || text[7] != '-' ||
      !readDigits(text, 8, 2, day))
    return std::nullopt;
  if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month))
    return std::nullopt;

  unsigned hour = 0, minute = 0, second = 0, micros = 0;
  size_t pos = 10;
  if (pos < text.size()) {
    char sep = text[pos];
    if (sep != ' ' && !(sep == 'T' && !canonicalOnly))
      return std::nullopt;
    if (!readDigits(text, pos + 1, 2, hour) || text.size() < pos + 9 ||
        text[pos + 3] != ':' || !readDigits(text, pos + 4, 2, minute) ||
        text[pos + 6] != ':' || !readDigits(text, pos + 7, 2, second))
      return std::nullopt;
    if (hour > 23 || minute > 59 || second > 59)
      return std::nullopt;
    pos += 9;

    if (pos < text.size() && text[pos] == '.') {
      size_t digits = 0;
      ++pos;
      while (pos < text.size() &&
             std::isdigit(static_cast<unsigned char>(text[pos]))) {
        if (digits == 6)
          return std::nullopt;
        micros = micros * 10 + static_cast<unsigned>(text[pos] - '0');
        ++digits;
        ++pos;
      }
      if (digits == 0 || (canonicalOnly && digits != 6))
        return std::nullopt;
      for (size_t i = digits; i < 6; ++i)
        micros *= 10;
    } else if (canonicalOnly) {
      return std::nullopt;
    }

    if (pos < text.size() && text[pos] == 'Z' && !canonicalOnly)
      ++pos;
    if (pos != text.size())
      return std::nullopt;
  } else if (canonicalOnly) {
    return std::nullopt;
  }

  return TimeUtils::makeTimestamp(static_cast<int>(year), month, day, hour,
                                  minute, second, micros);
}

} // namespace

namespace TimeUtils {

Timestamp makeTimestamp(int year, unsigned month, unsigned day, unsigned hour,
                        unsigned minute, unsigned second,
                        unsigned microsecond) {
  int64_t days = daysFromCivil(year, month, day);
  int64_t secs = days * SECONDS_PER_DAY + hour * 3600 + minute * 60 + second;
  return Timestamp(
      std::chrono::microseconds(secs * MICROS_PER_SECOND + microsecond));
}

Timestamp minTimestamp() { return Timestamp(std::chrono::microseconds(0)); }

Timestamp maxTimestamp() {
  static const Timestamp max = makeTimestamp(9999, 12, 31, 23, 59, 59);
  return max;
}

std::string formatTimestamp(Timestamp ts) {
  Decomposed d = decompose(ts);
  char buf[40];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02u:%02u:%02u.%06u",
                static_cast<long long>(d.date.year), d.date.month, d.date.day,
                d.hour, d.minute, d.second, d.micros);
  return buf;
}

std::string formatDate(Timestamp ts) {
  Decomposed d = decompose(ts);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                static_cast<long long>(d.date.year), d.date.month, d.date.day);
  return buf;
}

std::string formatTimeOfDay(Timestamp ts) {
  Decomposed d = decompose(ts);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02u:%02u:%02u", d.hour, d.minute,
                d.second);
  return buf;
}

Timestamp parseTimestamp(const std::string &text) {
  auto parsed = parse(text, false);
  if (!parsed) {
    throw std::invalid_argument("Invalid timestamp: '" + text + "'");
  }
  return *parsed;
}

std::optional<Timestamp> tryParseTimestamp(const std::string &text) {
  return parse(text, false);
}

Timestamp parseCanonicalTimestamp(const std::string &text) {
  auto parsed = parse(text, true);
  if (!parsed) {
    throw std::invalid_argument("Timestamp is not in canonical form "
                                "'YYYY-MM-DD HH:MM:SS.ffffff': '" +
                                text + "'");
  }
  return *parsed;
}

Timestamp fromEpochSeconds(double seconds) {
  if (!std::isfinite(seconds)) {
    throw std::invalid_argument("Epoch seconds must be finite");
  }
  return Timestamp(std::chrono::microseconds(
      static_cast<int64_t>(std::llround(seconds * 1e6))));
}

int64_t toEpochMicros(Timestamp ts) { return ts.time_since_epoch().count(); }

Timestamp fromEpochMicros(int64_t micros) {
  return Timestamp(std::chrono::microseconds(micros));
}

} // namespace TimeUtils
