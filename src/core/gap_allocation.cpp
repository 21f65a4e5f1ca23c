#include <entrylog/core/gap_allocation.h>
#include <entrylog/core/algo.h>
#include <entrylog/core/constants.h>

#include <algorithm>
#include <cmath>

namespace entrylog {

namespace {

bool is_usable_step(const gap_step_t& step)
{
    return std::isfinite(step.max_gap_s) && std::isfinite(step.span_px) &&
           step.max_gap_s >= 0.0 && step.span_px >= 0.0;
}

} // namespace

double allocate_gap_span(double gap_s, const gap_table_t& table)
{
    const double gap = detail::non_negative_duration(gap_s);
    for (const auto& step : table.steps) {
        if (gap <= step.max_gap_s) {
            return step.span_px;
        }
    }
    return table.tail_span_px;
}

gap_table_t normalize_gap_table(const gap_table_t& table, bool* adjusted)
{
    bool changed = false;

    gap_table_t out;
    out.steps.reserve(table.steps.size());
    for (const auto& step : table.steps) {
        if (is_usable_step(step)) {
            out.steps.push_back(step);
        }
        else {
            changed = true;
        }
    }

    if (!std::is_sorted(out.steps.begin(), out.steps.end(),
            [](const gap_step_t& a, const gap_step_t& b) { return a.max_gap_s < b.max_gap_s; }))
    {
        std::stable_sort(out.steps.begin(), out.steps.end(),
            [](const gap_step_t& a, const gap_step_t& b) { return a.max_gap_s < b.max_gap_s; });
        changed = true;
    }

    double running_max = 0.0;
    for (auto& step : out.steps) {
        if (step.span_px < running_max) {
            step.span_px = running_max;
            changed = true;
        }
        running_max = step.span_px;
    }

    double tail = detail::finite_or(table.tail_span_px, running_max);
    if (tail < running_max) {
        tail = running_max;
    }
    if (tail != table.tail_span_px) {
        changed = true;
    }
    out.tail_span_px = tail;

    if (adjusted) {
        *adjusted = changed;
    }
    return out;
}

double extrapolation_rate_for(const gap_table_t& table, double window_s)
{
    if (!std::isfinite(window_s) || window_s <= 0.0) {
        window_s = core::constants::k_extrapolation_window_s;
    }

    const double rate = allocate_gap_span(window_s, table) / window_s;
    if (std::isfinite(rate) && rate > 0.0) {
        return rate;
    }

    // Degenerate (all-zero) table: fall back to the default curve.
    const double fallback_window = core::constants::k_extrapolation_window_s;
    return allocate_gap_span(fallback_window, gap_table_t::make_default()) / fallback_window;
}

} // namespace entrylog
