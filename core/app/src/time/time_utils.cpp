#include "osr/time/time_utils.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>

namespace osr {

namespace {

constexpr std::int64_t kMillisPerSecond = 1000;

bool allDigits(const std::string& text, std::size_t pos, std::size_t count) {
  for (std::size_t i = pos; i < pos + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
      return false;
    }
  }
  return true;
}

int readInt(const std::string& text, std::size_t pos, std::size_t count) {
  int value = 0;
  for (std::size_t i = pos; i < pos + count; ++i) {
    value = value * 10 + (text[i] - '0');
  }
  return value;
}

bool isLeapYear(int year) {
  return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int daysInMonth(int year, int month) {
  static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (month == 2 && isLeapYear(year)) {
    return 29;
  }
  return kDays[month - 1];
}

// Validates Y/M/D and converts a broken-down UTC time to epoch seconds.
std::optional<std::int64_t> toEpochSeconds(int year, int month, int day,
                                           int hour, int minute, int second) {
  if (year < 1970 || month < 1 || month > 12 || day < 1 ||
      day > daysInMonth(year, month) || hour > 23 || minute > 59 ||
      second > 59) {
    return std::nullopt;
  }
  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min = minute;
  tm.tm_sec = second;
  return static_cast<std::int64_t>(timegm(&tm));
}

}  // namespace

// -----------------------------------------------------------------------------
// format_iso8601_ms
// -----------------------------------------------------------------------------
std::string format_iso8601_ms(std::int64_t epoch_ms) {
  std::int64_t seconds = epoch_ms / kMillisPerSecond;
  std::int64_t millis = epoch_ms % kMillisPerSecond;
  if (millis < 0) {
    millis += kMillisPerSecond;
    seconds -= 1;
  }
  std::time_t t = static_cast<std::time_t>(seconds);
  std::tm tm{};
  gmtime_r(&t, &tm);

  char buffer[32];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(millis));
  return buffer;
}

// -----------------------------------------------------------------------------
// parse_iso8601_ms
// -----------------------------------------------------------------------------
// Layout: 0123456789012345678901234
//         YYYY-MM-DDTHH:MM:SS.mmmZ
// -----------------------------------------------------------------------------
std::optional<std::int64_t> parse_iso8601_ms(const std::string& text) {
  if (text.size() != 24 || text[4] != '-' || text[7] != '-' ||
      text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
      text[19] != '.' || text[23] != 'Z') {
    return std::nullopt;
  }
  if (!allDigits(text, 0, 4) || !allDigits(text, 5, 2) ||
      !allDigits(text, 8, 2) || !allDigits(text, 11, 2) ||
      !allDigits(text, 14, 2) || !allDigits(text, 17, 2) ||
      !allDigits(text, 20, 3)) {
    return std::nullopt;
  }
  auto seconds = toEpochSeconds(readInt(text, 0, 4), readInt(text, 5, 2),
                                readInt(text, 8, 2), readInt(text, 11, 2),
                                readInt(text, 14, 2), readInt(text, 17, 2));
  if (!seconds) {
    return std::nullopt;
  }
  return *seconds * kMillisPerSecond + readInt(text, 20, 3);
}

// -----------------------------------------------------------------------------
// parse_date_utc
// -----------------------------------------------------------------------------
std::optional<std::int64_t> parse_date_utc(const std::string& text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-' ||
      !allDigits(text, 0, 4) || !allDigits(text, 5, 2) ||
      !allDigits(text, 8, 2)) {
    return std::nullopt;
  }
  auto seconds = toEpochSeconds(readInt(text, 0, 4), readInt(text, 5, 2),
                                readInt(text, 8, 2), 0, 0, 0);
  if (!seconds) {
    return std::nullopt;
  }
  return *seconds * kMillisPerSecond;
}

}  // namespace osr
