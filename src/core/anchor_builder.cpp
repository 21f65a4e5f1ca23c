#include <entrylog/core/anchor_builder.h>
#include <entrylog/core/algo.h>
#include <entrylog/core/gap_allocation.h>

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

namespace entrylog {

anchor_map_t build_anchor_map(
    const std::vector<entry_t>& entries,
    double now,
    const Timeline_config& config)
{
    ENTRYLOG_PROFILE_SCOPE(config.profiler.get(), "entrylog.build_anchor_map");

    if (!std::isfinite(now)) {
        if (config.log_error) {
            config.log_error("build_anchor_map: non-finite now, using 0");
        }
        now = 0.0;
    }

    const gap_table_t table = normalize_gap_table(config.gap_table);

    anchor_map_t map;
    map.extrapolation_rate = extrapolation_rate_for(table, config.extrapolation_window_s);
    map.anchors.reserve(entries.size() + 1);

    anchor_t now_anchor;
    now_anchor.time = now;
    now_anchor.position = 0.0;
    map.anchors.push_back(now_anchor);

    std::vector<const entry_t*> ordered;
    ordered.reserve(entries.size());
    std::size_t skipped = 0;
    for (const auto& entry : entries) {
        if (std::isfinite(entry.timestamp)) {
            ordered.push_back(&entry);
        }
        else {
            ++skipped;
        }
    }

    if (skipped > 0 && config.log_debug) {
        config.log_debug("build_anchor_map: skipped " + std::to_string(skipped) +
            " entries with non-finite timestamps");
    }

    std::stable_sort(ordered.begin(), ordered.end(),
        [](const entry_t* a, const entry_t* b) { return a->timestamp > b->timestamp; });

    double position = 0.0;
    double previous_time = now;
    for (const entry_t* entry : ordered) {
        const double gap = detail::non_negative_duration(previous_time - entry->timestamp);
        const double span = allocate_gap_span(gap, table);
        position += span;

        anchor_t anchor;
        anchor.time = std::min(entry->timestamp, previous_time);
        anchor.position = position;
        anchor.gap_from_newer = gap;
        anchor.gap_span = span;
        anchor.source_entry = *entry;
        map.anchors.push_back(std::move(anchor));

        previous_time = map.anchors.back().time;
    }

    return map;
}

} // namespace entrylog
