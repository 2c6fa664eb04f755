#pragma once

#include "MonitorTypes.hpp"

#include <optional>
#include <string>

namespace monitor
{

// Accepts "YYYY-MM-DDTHH:MM:SS" (or a space instead of 'T'), optional
// fractional seconds and an optional "Z" / "+HH:MM" / "-HH:MM" suffix.
// Values without a suffix are taken as UTC.
[[nodiscard]] std::optional<Clock::time_point> parse_iso8601(const std::string& text);

// "YYYY-MM-DDTHH:MM:SS+00:00"
[[nodiscard]] std::string format_iso8601_utc(Clock::time_point tp);

// "YYYY-MM-DD HH:MM:SS" in UTC, used in logs and notifications
[[nodiscard]] std::string format_datetime_utc(Clock::time_point tp);

// Current local time as "YYYY-MM-DDTHH:MM:SS"
[[nodiscard]] std::string local_timestamp_iso();

} // namespace monitor
