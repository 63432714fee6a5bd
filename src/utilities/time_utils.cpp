#include "utilities/time_utils.hpp"
#include <cctype>
#include <cstdio>

namespace ledgerproof {

namespace {

bool readDigits(const std::string &s, std::size_t &pos, std::size_t count,
                int &out) {
  if (pos + count > s.size())
    return false;
  int v = 0;
  for (std::size_t i = 0; i < count; ++i) {
    char c = s[pos + i];
    if (!std::isdigit(static_cast<unsigned char>(c)))
      return false;
    v = v * 10 + (c - '0');
  }
  out = v;
  pos += count;
  return true;
}

bool expect(const std::string &s, std::size_t &pos, char c) {
  if (pos >= s.size() || s[pos] != c)
    return false;
  ++pos;
  return true;
}

} // namespace

bool isValidDate(int year, int month, int day) {
  if (year < 1 || month < 1 || day < 1)
    return false;
  return std::chrono::year_month_day{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}}
      .ok();
}

TimeParseResult parseIsoUtc(const std::string &text) {
  TimeParseResult result;
  std::size_t pos = 0;
  int year, month, day, hour, minute, second;
  if (!readDigits(text, pos, 4, year) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, month) || !expect(text, pos, '-') ||
      !readDigits(text, pos, 2, day))
    return result;
  if (pos >= text.size() || (text[pos] != 'T' && text[pos] != ' '))
    return result;
  ++pos;
  if (!readDigits(text, pos, 2, hour) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, minute) || !expect(text, pos, ':') ||
      !readDigits(text, pos, 2, second))
    return result;
  if (!isValidDate(year, month, day) || hour > 23 || minute > 59 ||
      second > 59)
    return result;

  int64_t micros = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
      if (digits < 6)
        micros = micros * 10 + (text[pos] - '0');
      ++digits;
      ++pos;
    }
    if (digits == 0)
      return result;
    for (int i = digits; i < 6; ++i)
      micros *= 10;
  }

  int64_t offsetMinutes = 0;
  if (pos == text.size()) {
    result.error = TimeParseError::Naive;
    return result;
  }
  if (text[pos] == 'Z' || text[pos] == 'z') {
    ++pos;
  } else if (text[pos] == '+' || text[pos] == '-') {
    int sign = text[pos] == '-' ? -1 : 1;
    ++pos;
    int oh, om;
    if (!readDigits(text, pos, 2, oh))
      return result;
    if (pos < text.size() && text[pos] == ':')
      ++pos;
    if (!readDigits(text, pos, 2, om) || oh > 23 || om > 59)
      return result;
    offsetMinutes = sign * (oh * 60 + om);
  } else {
    return result;
  }
  if (pos != text.size())
    return result;

  using namespace std::chrono;
  const sys_days date{year_month_day{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}}};
  result.value = time_point_cast<microseconds>(date) + hours{hour} +
                 minutes{minute} + seconds{second} - minutes{offsetMinutes} +
                 microseconds{micros};
  return result;
}

std::string formatIsoUtc(Timestamp ts) {
  using namespace std::chrono;
  const auto date = floor<days>(ts);
  const year_month_day ymd{date};
  const hh_mm_ss<microseconds> tod{ts - date};
  const long long micros = tod.subseconds().count();
  char buf[48];
  if (micros == 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02dZ",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()));
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%06lldZ",
                  static_cast<int>(ymd.year()), static_cast<unsigned>(ymd.month()),
                  static_cast<unsigned>(ymd.day()), static_cast<int>(tod.hours().count()),
                  static_cast<int>(tod.minutes().count()),
                  static_cast<int>(tod.seconds().count()), micros);
  }
  return buf;
}

Timestamp fromUnixMillis(int64_t millis) {
  return Timestamp(std::chrono::microseconds(millis * 1000));
}

int64_t toUnixMillis(Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             ts.time_since_epoch())
      .count();
}

} // namespace ledgerproof
