#pragma once

#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace trip_atlas::core {

/**
 * Capture timestamp resolution.
 *
 * Accepts EXIF "YYYY:MM:DD HH:MM:SS" and ISO-8601 "YYYY-MM-DD[T ]HH:MM[:SS[.fff]]"
 * with an optional "Z" or "+HH:MM" designator. A bare date means midnight.
 *
 *   explicit offset: local = text, utc = text - offset
 *   "Z":             utc = text, local = utc + (capture offset | policy default)
 *   no designator:   local = text, utc = text - (capture offset | policy default)
 */
std::optional<CaptureTime> parse_capture_time(const std::string& text,
                                              const std::string& capture_offset,
                                              const TimePolicy& policy);

// "+05:30", "-0400", "Z" -> minutes east of UTC
std::optional<int> parse_utc_offset(const std::string& text);

// Civil calendar helpers (proleptic Gregorian)
int64_t days_from_civil(int year, int month, int day);
void civil_from_days(int64_t days, int& year, int& month, int& day);

DayKey day_key(const CaptureTime& t);
std::string format_display_date(const CaptureTime& t);   // "January 05, 2024"
std::string format_clock(const CaptureTime& t);          // "07:05"

} // namespace trip_atlas::core
