#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace osr {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions that convert between epoch milliseconds (the unit
//         of ITimeProvider) and the text forms used in the history file and
//         on the command line.
//
// @details
// The history file stores timestamps as ISO-8601 UTC with exactly three
// fractional digits and a trailing 'Z' ("2026-10-19T08:15:30.123Z"). The
// fixed width makes the strings sort lexicographically in time order, which
// keeps the file readable and diffable.
//
// Purge dates on the command line are plain "YYYY-MM-DD" and mean UTC
// midnight at the start of that day.
//
// Thread-safety: Stateless. Uses the reentrant gmtime_r/timegm.
// -----------------------------------------------------------------------------

// Formats epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ".
std::string format_iso8601_ms(std::int64_t epoch_ms);

// Parses the exact format produced by format_iso8601_ms(). Returns
// std::nullopt for anything else (missing millis, offsets other than Z,
// out-of-range fields).
std::optional<std::int64_t> parse_iso8601_ms(const std::string& text);

// Parses "YYYY-MM-DD" into epoch milliseconds at 00:00:00.000 UTC.
std::optional<std::int64_t> parse_date_utc(const std::string& text);

}  // namespace osr
