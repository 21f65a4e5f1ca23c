#pragma once
// Entrylog Library - Anchor Builder
// Builds the anchor map for one render pass from the entry list and a
// single sampled "now".

#include "timeline_config.h"
#include "types.h"

#include <vector>

namespace entrylog {

// Builds the anchor map:
//   - entries are ordered newest first (stable among equal timestamps),
//   - a synthetic anchor for `now` sits at position 0,
//   - each entry adds allocate_gap_span(previous time - entry time),
//     with negative gaps (entries newer than `now`) clamped to zero.
// Entries newer than `now` are pinned to `now` on the axis; their
// source_entry keeps the original timestamp. Entries with a non-finite
// timestamp are skipped.
// The result depends only on the inputs, so rebuilding is idempotent.
anchor_map_t build_anchor_map(
    const std::vector<entry_t>& entries,
    double now,
    const Timeline_config& config);

} // namespace entrylog
