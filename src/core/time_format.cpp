#include <entrylog/core/time_format.h>
#include <entrylog/core/constants.h>

#include <cmath>
#include <cstdio>
#include <ctime>

namespace entrylog {

namespace constants = core::constants;

namespace {

constexpr const char* k_day_names[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

bool to_calendar(double t, bool utc, std::tm& out)
{
    if (!std::isfinite(t)) {
        return false;
    }
    const std::time_t tt = static_cast<std::time_t>(std::floor(t));

#ifdef _WIN32
    return (utc ? gmtime_s(&out, &tt) : localtime_s(&out, &tt)) == 0;
#else
    return (utc ? gmtime_r(&tt, &out) : localtime_r(&tt, &out)) != nullptr;
#endif
}

} // namespace

std::string format_time_ago(double t, double now, const Timeline_config& config)
{
    const double diff = now - t;
    const double minutes = std::floor(diff / constants::k_minute_s);
    const double hours = std::floor(diff / constants::k_hour_s);

    if (!(minutes >= 1.0)) {
        return "now";
    }
    if (minutes < 60.0) {
        return std::to_string(static_cast<long long>(minutes)) + "m ago";
    }
    if (hours < 24.0) {
        return std::to_string(static_cast<long long>(hours)) + "h ago";
    }
    return format_clock_time(t, config);
}

std::string format_draft_offset(double t, double now)
{
    const double minutes = std::floor((now - t) / constants::k_minute_s);
    if (!(minutes >= 1.0)) {
        return "now";
    }

    const long long total = static_cast<long long>(minutes);
    if (total < 60) {
        return std::to_string(total) + "m ago";
    }
    return std::to_string(total / 60) + "h " + std::to_string(total % 60) + "m ago";
}

std::string format_clock_time(double t, const Timeline_config& config)
{
    std::tm tm_buf{};
    if (!to_calendar(t, config.use_utc_calendar, tm_buf)) {
        return std::string();
    }

    const int hour12 = (tm_buf.tm_hour % 12 == 0) ? 12 : tm_buf.tm_hour % 12;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%d:%02d %s", hour12, tm_buf.tm_min, tm_buf.tm_hour < 12 ? "am" : "pm");
    return buf;
}

std::string day_label(double t, const Timeline_config& config)
{
    std::tm tm_buf{};
    if (!to_calendar(t, config.use_utc_calendar, tm_buf) || tm_buf.tm_wday < 0 || tm_buf.tm_wday > 6) {
        return std::string();
    }
    return k_day_names[tm_buf.tm_wday];
}

bool is_different_day(double a, double b, const Timeline_config& config)
{
    std::tm ta{};
    std::tm tb{};
    if (!to_calendar(a, config.use_utc_calendar, ta) || !to_calendar(b, config.use_utc_calendar, tb)) {
        return false;
    }
    return ta.tm_year != tb.tm_year || ta.tm_mon != tb.tm_mon || ta.tm_mday != tb.tm_mday;
}

} // namespace entrylog
