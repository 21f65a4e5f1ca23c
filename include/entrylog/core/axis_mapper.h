#pragma once
// Entrylog Library - Axis Mapper
// Converts between timestamps and axis positions over an anchor map.
// Both directions are total: out-of-range queries extrapolate instead of
// failing, and an empty map maps everything to 0.

#include "types.h"

namespace entrylog {

// Position of timestamp t.
// Between two anchors the position is interpolated linearly by elapsed
// time. Older than the oldest anchor it continues past the oldest position
// at map.extrapolation_rate; newer than "now" it is negative.
double time_to_position(double t, const anchor_map_t& map);

// Timestamp at position p; the inverse of time_to_position.
// Inside the anchored range it round-trips exactly up to floating-point
// rounding. Beyond the oldest anchor it moves back in time at
// 1 / map.extrapolation_rate seconds per pixel.
double position_to_time(double p, const anchor_map_t& map);

} // namespace entrylog
