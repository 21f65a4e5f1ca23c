#pragma once

// Entrylog Library - Core Constants
// Time units, backdating bounds and default gap allocation thresholds.

namespace entrylog::core::constants {

// Time units (seconds)
constexpr double k_minute_s = 60.0;
constexpr double k_hour_s   = 3600.0;
constexpr double k_day_s    = 86400.0;

// Backdating
constexpr double k_max_backdate_s          = 12.0 * k_hour_s;
constexpr double k_extrapolation_window_s  = 12.0 * k_hour_s;

// Default gap allocation table (gap <= threshold -> span)
constexpr double k_gap_threshold_5m_s  = 5.0  * k_minute_s;
constexpr double k_gap_threshold_30m_s = 30.0 * k_minute_s;
constexpr double k_gap_threshold_1h_s  = 1.0  * k_hour_s;
constexpr double k_gap_threshold_2h_s  = 2.0  * k_hour_s;
constexpr double k_gap_threshold_6h_s  = 6.0  * k_hour_s;
constexpr double k_gap_threshold_12h_s = 12.0 * k_hour_s;

constexpr double k_gap_span_5m_px   = 110.0;
constexpr double k_gap_span_30m_px  = 145.0;
constexpr double k_gap_span_1h_px   = 180.0;
constexpr double k_gap_span_2h_px   = 220.0;
constexpr double k_gap_span_6h_px   = 280.0;
constexpr double k_gap_span_12h_px  = 350.0;
constexpr double k_gap_span_tail_px = 420.0;

// Energy
constexpr int    k_energy_min = 1;
constexpr int    k_energy_max = 10;

// Interaction
constexpr int    k_tick_interval_ms   = 1000;
constexpr double k_wheel_px_per_notch = 40.0;

} // namespace entrylog::core::constants
