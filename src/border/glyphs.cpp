//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/border/glyphs.cpp
// Purpose: Hold the glyph table for the ascii, light and thick border sets.
// Key invariants: Table rows are indexed by GlyphSet and columns by GlyphKind
//                 in declaration order.
// Ownership/Lifetime: Static, immutable data.
// Links: include/tbox/border/glyphs.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/border/glyphs.hpp"

#include <array>

namespace tbox::border
{

namespace
{
using Row = std::array<std::string_view, kGlyphKindCount>;

// clang-format off
constexpr std::array<Row, 3> kGlyphs = {{
    // ┘    ┐    ┌    └    ┤    ┴    ┬    ├    ─    │    ┼
    {"+", "+", "+", "+", "+", "+", "+", "+", "-", "|", "+"},
    {"┘", "┐", "┌", "└", "┤", "┴", "┬", "├", "─", "│", "┼"},
    {"╝", "╗", "╔", "╚", "╣", "╩", "╦", "╠", "═", "║", "╬"},
}};
// clang-format on

constexpr std::array<std::string_view, kGlyphKindCount> kKindNames = {
    "corner_bottom_right",
    "corner_top_right",
    "corner_top_left",
    "corner_bottom_left",
    "divider_left",
    "divider_up",
    "divider_down",
    "divider_right",
    "line",
    "pipe",
    "cross",
};

constexpr std::array<std::string_view, 3> kSetNames = {"ascii", "light", "thick"};
} // namespace

std::string_view glyph(GlyphKind kind, GlyphSet set)
{
    return kGlyphs[static_cast<std::size_t>(set)][static_cast<std::size_t>(kind)];
}

std::optional<GlyphSet> parseGlyphSet(std::string_view name)
{
    for (std::size_t i = 0; i < kSetNames.size(); ++i)
    {
        if (kSetNames[i] == name)
            return static_cast<GlyphSet>(i);
    }
    return std::nullopt;
}

std::optional<GlyphKind> parseGlyphKind(std::string_view name)
{
    for (std::size_t i = 0; i < kKindNames.size(); ++i)
    {
        if (kKindNames[i] == name)
            return static_cast<GlyphKind>(i);
    }
    return std::nullopt;
}

const char *toString(GlyphSet set)
{
    return kSetNames[static_cast<std::size_t>(set)].data();
}

const char *toString(GlyphKind kind)
{
    return kKindNames[static_cast<std::size_t>(kind)].data();
}

} // namespace tbox::border
