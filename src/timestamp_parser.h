#pragma once

#include <string>
#include <optional>
#include "chat_record.h"

namespace chatmine {

/**
 * @brief Parse a log timestamp without fallback
 *
 * Accepts "YYYY-MM-DD HH:MM:SS,fff" (1-6 fraction digits, read as a decimal
 * fraction of a second) or, failing that, a text whose first 19 characters
 * are "YYYY-MM-DD HH:MM:SS". The log gives no zone, so the fields are
 * stored as a naive wall-clock value (epoch offset as if UTC) and never
 * shifted by the local zone or daylight saving. Days are checked against
 * the month length, leap years included.
 *
 * @param timestamp The timestamp text
 * @return The parsed time point, or nullopt if neither format matches
 */
std::optional<TimePoint> try_parse_log_timestamp(const std::string& timestamp);

/**
 * @brief Parse a log timestamp, falling back to the current time
 *
 * The fallback is lossy; callers must tolerate an unreliable value.
 */
TimePoint parse_log_timestamp(const std::string& timestamp);

// "YYYY-MM-DD HH:MM:SS", the wall-clock text the value was parsed from
std::string format_log_timestamp(const TimePoint& time_point);

// "HH:MM:SS"
std::string format_clock_time(const TimePoint& time_point);

// "YYYYMMDD_HHMMSS"
std::string format_compact_timestamp(const TimePoint& time_point);

} // namespace chatmine
