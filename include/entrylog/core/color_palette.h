#pragma once

// Entrylog Library - Core Color Palette
// Timeline colors for light and dark modes.

#include <glm/vec4.hpp>

#include <algorithm>

namespace entrylog {

// -----------------------------------------------------------------------------
// Color Utilities
// -----------------------------------------------------------------------------

constexpr int hex_char_to_int(char c)
{
    if (c >= '0' && c <= '9') { return c - '0';      }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return 0;
}

constexpr float hex2f(const char* str)
{
    return static_cast<float>(hex_char_to_int(str[0]) * 16 + hex_char_to_int(str[1])) / 255.0f;
}

// Converts "aarrggbb" hex string to glm::vec4(r, g, b, a)
constexpr glm::vec4 hex_to_vec4(const char* str)
{
    return glm::vec4(hex2f(str + 2), hex2f(str + 4), hex2f(str + 6), hex2f(str));
}

// Same color with its alpha scaled by a factor in [0, 1].
inline glm::vec4 with_alpha_scale(const glm::vec4& color, float factor)
{
    return glm::vec4(color.r, color.g, color.b, color.a * std::clamp(factor, 0.0f, 1.0f));
}

// -----------------------------------------------------------------------------
// Color Palette
// -----------------------------------------------------------------------------
struct Color_palette
{
    glm::vec4 energy_fill    = hex_to_vec4("fff2c14e");
    glm::vec4 energy_idle    = hex_to_vec4("1af2c14e");
    glm::vec4 day_separator  = hex_to_vec4("ff5a5f66");
    glm::vec4 draft_marker   = hex_to_vec4("ff4ea3f2");
    glm::vec4 entry_text     = hex_to_vec4("ffe6e6e6");

    static Color_palette dark()
    {
        return Color_palette();
    }

    static Color_palette light()
    {
        Color_palette p;
        p.energy_fill   = hex_to_vec4("ffd98e04");
        p.energy_idle   = hex_to_vec4("1ad98e04");
        p.day_separator = hex_to_vec4("ffb0b4ba");
        p.draft_marker  = hex_to_vec4("ff1f6fbf");
        p.entry_text    = hex_to_vec4("ff1c1e22");
        return p;
    }

    static Color_palette for_theme(bool dark_mode)
    {
        return dark_mode ? dark() : light();
    }
};

} // namespace entrylog
