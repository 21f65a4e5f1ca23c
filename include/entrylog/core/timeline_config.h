#pragma once

// Entrylog Library - Configuration
// Injectable configuration for the timeline core.
// Host applications customize the gap table, backdating bounds, calendar
// mode, colors and diagnostics through this struct.

#include "color_palette.h"
#include "constants.h"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace entrylog {

// -----------------------------------------------------------------------------
// Profiling Interface (optional)
// -----------------------------------------------------------------------------
// Applications can inject profiling by implementing this interface.
// If not provided, profiling is a no-op.
class Profiler
{
public:
    virtual ~Profiler() = default;
    virtual void begin_scope(const char* name) = 0;
    virtual void end_scope() = 0;
};

// RAII scope guard for profiling
class Profile_scope
{
public:
    Profile_scope(Profiler* profiler, const char* name)
    :
        m_profiler(profiler)
    {
        if (m_profiler) {
            m_profiler->begin_scope(name);
        }
    }

    ~Profile_scope()
    {
        if (m_profiler) {
            m_profiler->end_scope();
        }
    }

    Profile_scope(const Profile_scope&) = delete;
    Profile_scope& operator=(const Profile_scope&) = delete;

private:
    Profiler* m_profiler;
};

// Macro helpers for proper __LINE__ expansion
#define ENTRYLOG_CONCAT_IMPL(a, b) a##b
#define ENTRYLOG_CONCAT(a, b) ENTRYLOG_CONCAT_IMPL(a, b)

// Macro for scoped profiling (no-op if profiler is null)
#define ENTRYLOG_PROFILE_SCOPE(profiler, name) \
    ::entrylog::Profile_scope ENTRYLOG_CONCAT(entrylog_profile_scope_, __LINE__)((profiler), (name))

// -----------------------------------------------------------------------------
// Gap Table
// -----------------------------------------------------------------------------
// One step of the gap allocation function: gaps up to max_gap_s get span_px.
struct gap_step_t
{
    double max_gap_s = 0.0;
    double span_px   = 0.0;
};

struct gap_table_t
{
    std::vector<gap_step_t> steps;   ///< Ascending by max_gap_s
    double tail_span_px = 0.0;       ///< Span for gaps beyond the last step

    static gap_table_t make_default()
    {
        namespace c = core::constants;
        gap_table_t table;
        table.steps = {
            {c::k_gap_threshold_5m_s,  c::k_gap_span_5m_px},
            {c::k_gap_threshold_30m_s, c::k_gap_span_30m_px},
            {c::k_gap_threshold_1h_s,  c::k_gap_span_1h_px},
            {c::k_gap_threshold_2h_s,  c::k_gap_span_2h_px},
            {c::k_gap_threshold_6h_s,  c::k_gap_span_6h_px},
            {c::k_gap_threshold_12h_s, c::k_gap_span_12h_px},
        };
        table.tail_span_px = c::k_gap_span_tail_px;
        return table;
    }
};

// -----------------------------------------------------------------------------
// Timeline Configuration
// -----------------------------------------------------------------------------
struct Timeline_config
{
    // --- Axis scale ---
    gap_table_t gap_table = gap_table_t::make_default();

    // Overflow beyond the anchored range maps at allocate(window) / window.
    double extrapolation_window_s = core::constants::k_extrapolation_window_s;

    // --- Backdating ---
    double max_backdate_s = core::constants::k_max_backdate_s;

    // --- Calendar ---
    // Day separators and clock labels use UTC instead of local time.
    bool use_utc_calendar = false;

    // --- Theme ---
    bool dark_mode = true;
    Color_palette palette = Color_palette::dark();

    // --- Profiling (optional) ---
    std::shared_ptr<Profiler> profiler;

    // --- Logging (optional) ---
    std::function<void(const std::string&)> log_debug;
    std::function<void(const std::string&)> log_error;

    // Default configuration
    static Timeline_config make_default()
    {
        Timeline_config cfg;
        cfg.gap_table = gap_table_t::make_default();
        cfg.extrapolation_window_s = core::constants::k_extrapolation_window_s;
        cfg.max_backdate_s = core::constants::k_max_backdate_s;
        cfg.use_utc_calendar = false;
        cfg.dark_mode = true;
        cfg.palette = Color_palette::for_theme(cfg.dark_mode);
        return cfg;
    }
};

} // namespace entrylog
