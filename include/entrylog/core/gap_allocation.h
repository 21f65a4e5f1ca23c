#pragma once
// Entrylog Library - Gap Allocation
// Maps the elapsed time between two adjacent anchors to a pixel span.
// The mapping is a non-decreasing step function of the duration only, so
// dense recent history gets more room than sparse old history.

#include "timeline_config.h"

namespace entrylog {

// Span in pixels for a gap of gap_s seconds.
// Negative and non-finite gaps are treated as zero.
double allocate_gap_span(double gap_s, const gap_table_t& table);

// Returns a table whose steps are sorted by threshold and whose spans never
// decrease. Steps with non-finite or negative values are dropped.
// If adjusted is non-null it is set to whether anything had to change.
gap_table_t normalize_gap_table(const gap_table_t& table, bool* adjusted = nullptr);

// Pixels per second used outside the anchored range:
// allocate_gap_span(window_s) / window_s. Always positive.
double extrapolation_rate_for(const gap_table_t& table, double window_s);

} // namespace entrylog
