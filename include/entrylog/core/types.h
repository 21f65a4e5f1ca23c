#pragma once
// Entrylog Library - Core Types
// Qt-free types shared by the anchor builder, axis mapper and session.
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace entrylog {

// -----------------------------------------------------------------------------
// entry_t: one logged event
// -----------------------------------------------------------------------------
// Timestamps are UTC unix seconds. Entries are immutable once fetched.
struct entry_t
{
    std::int64_t               id        = 0;   ///< 0 until persisted
    double                     timestamp = 0.0;
    std::optional<std::string> description;
    std::optional<int>         energy;           ///< 1..10 when present

    bool operator==(const entry_t& other) const = default;
};

// -----------------------------------------------------------------------------
// anchor_t: a point on the entry-centric axis
// -----------------------------------------------------------------------------
// The first anchor of a map is the synthetic "now" anchor: position 0, no
// gap and no source entry.
struct anchor_t
{
    double                 time     = 0.0;
    double                 position = 0.0;
    std::optional<double>  gap_from_newer;  ///< Seconds to the newer anchor
    std::optional<double>  gap_span;        ///< position - previous position
    std::optional<entry_t> source_entry;

    bool is_synthetic() const { return !source_entry.has_value(); }

    bool operator==(const anchor_t& other) const = default;
};

// -----------------------------------------------------------------------------
// anchor_map_t: ordered anchors for one render pass
// -----------------------------------------------------------------------------
// Anchors run newest first. Positions are non-decreasing, times are
// non-increasing. extrapolation_rate (px per second) maps time outside the
// anchored range.
struct anchor_map_t
{
    std::vector<anchor_t> anchors;
    double                extrapolation_rate = 0.0;

    bool empty() const { return anchors.empty(); }
    std::size_t size() const { return anchors.size(); }

    // Time of the synthetic "now" anchor (0 for an unbuilt map).
    double now() const { return anchors.empty() ? 0.0 : anchors.front().time; }

    const anchor_t& oldest() const { return anchors.back(); }

    bool operator==(const anchor_map_t& other) const = default;
};

// -----------------------------------------------------------------------------
// draft_t: the entry under composition
// -----------------------------------------------------------------------------
struct draft_t
{
    std::string        text;
    std::optional<int> energy;
    double             timestamp = 0.0;

    bool has_content() const { return !text.empty() || energy.has_value(); }

    bool operator==(const draft_t& other) const = default;
};

// -----------------------------------------------------------------------------
// entry_request_t: payload for creating an entry
// -----------------------------------------------------------------------------
struct entry_request_t
{
    double                     timestamp = 0.0;
    std::optional<std::string> description;
    std::optional<int>         energy;
};

} // namespace entrylog
