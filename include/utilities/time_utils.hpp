#ifndef LEDGERPROOF_TIME_UTILS_HPP
#define LEDGERPROOF_TIME_UTILS_HPP

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ledgerproof {

/// UTC instant with microsecond resolution.
using Timestamp =
    std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

enum class TimeParseError { Malformed, Naive };

struct TimeParseResult {
  std::optional<Timestamp> value;
  TimeParseError error = TimeParseError::Malformed;

  explicit operator bool() const { return value.has_value(); }
};

/**
 * @brief Parse an ISO-8601 timestamp carrying an explicit UTC offset.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS[.ffffff]" (a space may replace 'T') followed by
 * "Z", "+HH:MM", "-HH:MM" or "+HHMM". A timestamp without an offset is
 * reported as TimeParseError::Naive.
 */
TimeParseResult parseIsoUtc(const std::string &text);

/// Format as "YYYY-MM-DDTHH:MM:SS.ffffffZ" (fraction omitted when zero).
std::string formatIsoUtc(Timestamp ts);

Timestamp fromUnixMillis(int64_t millis);
int64_t toUnixMillis(Timestamp ts);

bool isValidDate(int year, int month, int day);

} // namespace ledgerproof

#endif // LEDGERPROOF_TIME_UTILS_HPP
