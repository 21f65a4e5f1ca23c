#pragma once
// Entrylog Library - Timeline Layout
// Presentation-agnostic rows for one render pass. Any display surface
// (Qt Quick, canvas, terminal) can draw these at their y coordinates.

#include "timeline_config.h"
#include "types.h"

#include <glm/vec4.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace entrylog {

enum class Row_kind
{
    ENTRY,
    DAY_SEPARATOR
};

struct timeline_row_t
{
    Row_kind                   kind     = Row_kind::ENTRY;
    double                     y        = 0.0;   ///< Axis position in pixels
    double                     time     = 0.0;   ///< Entry timestamp / separator day
    std::int64_t               entry_id = 0;
    std::string                label;            ///< "5m ago" or "MON"
    std::optional<std::string> description;
    std::optional<int>         energy;
    glm::vec4                  energy_color = glm::vec4(0.0f);
};

// Rows for every entry anchor (newest first), with a day separator midway
// between consecutive entries on different calendar days.
std::vector<timeline_row_t> build_timeline_rows(const anchor_map_t& anchors, const Timeline_config& config);

// Energy box color: palette.energy_fill with alpha energy / 10.
glm::vec4 energy_color_for(std::optional<int> energy, const Color_palette& palette);

// Where the draft preview sits on the axis.
double draft_preview_position(const draft_t& draft, const anchor_map_t& anchors);

// Axis length needed to show every anchor.
double timeline_extent(const anchor_map_t& anchors);

} // namespace entrylog
