#include <entrylog/core/timeline_layout.h>
#include <entrylog/core/axis_mapper.h>
#include <entrylog/core/constants.h>
#include <entrylog/core/time_format.h>

#include <utility>

namespace entrylog {

glm::vec4 energy_color_for(std::optional<int> energy, const Color_palette& palette)
{
    if (!energy) {
        return glm::vec4(0.0f);
    }
    const float factor = static_cast<float>(*energy) / static_cast<float>(core::constants::k_energy_max);
    return with_alpha_scale(palette.energy_fill, factor);
}

std::vector<timeline_row_t> build_timeline_rows(const anchor_map_t& anchors, const Timeline_config& config)
{
    ENTRYLOG_PROFILE_SCOPE(config.profiler.get(), "entrylog.build_timeline_rows");

    std::vector<timeline_row_t> rows;
    if (anchors.size() < 2) {
        return rows;
    }
    rows.reserve(anchors.size() * 2);

    const double now = anchors.now();
    const anchor_t* previous = nullptr;

    for (std::size_t i = 1; i < anchors.size(); ++i) {
        const anchor_t& anchor = anchors.anchors[i];
        if (!anchor.source_entry) {
            continue;
        }
        const entry_t& entry = *anchor.source_entry;

        if (previous && is_different_day(entry.timestamp, previous->source_entry->timestamp, config)) {
            timeline_row_t separator;
            separator.kind = Row_kind::DAY_SEPARATOR;
            separator.y = 0.5 * (previous->position + anchor.position);
            separator.time = entry.timestamp;
            separator.label = day_label(entry.timestamp, config);
            rows.push_back(std::move(separator));
        }

        timeline_row_t row;
        row.kind = Row_kind::ENTRY;
        row.y = anchor.position;
        row.time = entry.timestamp;
        row.entry_id = entry.id;
        row.label = format_time_ago(entry.timestamp, now, config);
        row.description = entry.description;
        row.energy = entry.energy;
        row.energy_color = energy_color_for(entry.energy, config.palette);
        rows.push_back(std::move(row));

        previous = &anchor;
    }

    return rows;
}

double draft_preview_position(const draft_t& draft, const anchor_map_t& anchors)
{
    return time_to_position(draft.timestamp, anchors);
}

double timeline_extent(const anchor_map_t& anchors)
{
    return anchors.empty() ? 0.0 : anchors.oldest().position;
}

} // namespace entrylog
