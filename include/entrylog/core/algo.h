#pragma once

// Entrylog Library - Algorithm Utilities
// Small, header-only helpers for anchor searches and numeric sanitizing.
// Pure C++ with no framework dependencies.
//
// Internal API (entrylog::detail):
//   - Binary search over anchors by time and by position
//   - Finite-value guards

#include "types.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace entrylog::detail {

// -----------------------------------------------------------------------------
// Finite-value guards
// -----------------------------------------------------------------------------

inline double finite_or(double v, double fallback)
{
    return std::isfinite(v) ? v : fallback;
}

// Negative and non-finite durations collapse to zero.
inline double non_negative_duration(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return 0.0;
    }
    return seconds;
}

// -----------------------------------------------------------------------------
// Binary Search over Anchors
// -----------------------------------------------------------------------------
// Anchors run newest first: time is non-increasing and position is
// non-decreasing along the vector.

// Returns index of the first anchor with time <= t (size() if none).
inline std::size_t first_anchor_at_or_before(const std::vector<anchor_t>& anchors, double t)
{
    std::size_t lo = 0;
    std::size_t hi = anchors.size();

    while (lo < hi) {
        std::size_t mid = lo + (hi - lo) / 2;
        if (anchors[mid].time > t) {
            lo = mid + 1;
        }
        else {
            hi = mid;
        }
    }
    return lo;
}

// Returns index of the first anchor with position >= p (size() if none).
inline std::size_t first_anchor_at_or_beyond(const std::vector<anchor_t>& anchors, double p)
{
    std::size_t lo = 0;
    std::size_t hi = anchors.size();

    while (lo < hi) {
        std::size_t mid = lo + (hi - lo) / 2;
        if (anchors[mid].position < p) {
            lo = mid + 1;
        }
        else {
            hi = mid;
        }
    }
    return lo;
}

} // namespace entrylog::detail
