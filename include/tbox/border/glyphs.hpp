//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/border/glyphs.hpp
// Purpose: Border glyph sets and the single lookup table used to draw every
//          border fragment.
// Key invariants: Each glyph set defines exactly one glyph for every kind.
// Ownership/Lifetime: Returned views refer to static storage.
// Links: src/border/glyphs.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string_view>

namespace tbox::border
{

/// @brief Named family of border-drawing glyphs.
enum class GlyphSet
{
    Ascii,
    Light,
    Thick
};

/// @brief Role a glyph plays in a border, independent of the glyph set.
enum class GlyphKind
{
    CornerBottomRight,
    CornerTopRight,
    CornerTopLeft,
    CornerBottomLeft,
    DividerLeft,
    DividerUp,
    DividerDown,
    DividerRight,
    Line,
    Pipe,
    Cross
};

/// @brief Number of GlyphKind enumerators.
inline constexpr int kGlyphKindCount = 11;

/// @brief UTF-8 glyph for @p kind in @p set.
std::string_view glyph(GlyphKind kind, GlyphSet set);

/// @brief Public accessor for callers composing their own layouts.
inline std::string_view cornerChar(GlyphKind kind, GlyphSet set = GlyphSet::Light)
{
    return glyph(kind, set);
}

/// @brief Parse a set name: "ascii", "light" or "thick".
std::optional<GlyphSet> parseGlyphSet(std::string_view name);

/// @brief Parse a kind name such as "corner_top_left", "line" or "cross".
std::optional<GlyphKind> parseGlyphKind(std::string_view name);

const char *toString(GlyphSet set);

const char *toString(GlyphKind kind);

} // namespace tbox::border
