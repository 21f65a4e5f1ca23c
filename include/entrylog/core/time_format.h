#pragma once
// Entrylog Library - Time Formatting
// Labels for entries and the draft, and calendar-day helpers.

#include "timeline_config.h"

#include <string>

namespace entrylog {

// "now" under a minute, "12m ago" under an hour, "5h ago" under a day,
// otherwise the clock time ("3:05 pm").
std::string format_time_ago(double t, double now, const Timeline_config& config);

// Draft offset label: "now", "12m ago" or "2h 5m ago".
std::string format_draft_offset(double t, double now);

// Clock time in the configured calendar, lower case: "3:05 pm".
std::string format_clock_time(double t, const Timeline_config& config);

// Three-letter weekday ("SUN" .. "SAT") in the configured calendar.
std::string day_label(double t, const Timeline_config& config);

bool is_different_day(double a, double b, const Timeline_config& config);

} // namespace entrylog
