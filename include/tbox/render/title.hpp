//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/render/title.hpp
// Purpose: Titles embedded in the top and bottom border lines and the
//          construction of those lines.
// Key invariants: A border line built for width W holds exactly W glyph and
//                 title codepoints whenever the titles and corners fit.
// Ownership/Lifetime: Title is a value type; border lines are returned owned.
// Links: src/render/title.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/border/border_spec.hpp"
#include "tbox/style/color.hpp"

#include <string>

namespace tbox::render
{

/// @brief Up to three titles per horizontal border; empty means unset.
struct Title
{
    std::string topLeft;
    std::string topCenter;
    std::string topRight;
    std::string bottomLeft;
    std::string bottomCenter;
    std::string bottomRight;
};

/// @brief Horizontal border being drawn.
enum class Edge
{
    Top,
    Bottom
};

/// @brief Glyph for the left corner of @p edge, or "" when not drawn.
/// @details A corner is drawn only if it is enabled and the left side is.
std::string leftCorner(const border::BorderSpec &border, Edge edge);

/// @brief Glyph for the right corner of @p edge, or "" when not drawn.
std::string rightCorner(const border::BorderSpec &border, Edge edge);

/// @brief Summed codepoint length of the three titles on @p edge.
int titlesSize(const Title &title, Edge edge);

/// @brief Columns consumed by the titles and corners on @p edge.
/// @details Used as a lower bound on box width so titles are never clipped.
int spaceTaken(const Title &title, const border::BorderSpec &border, Edge edge);

inline int topSpaceTaken(const Title &title, const border::BorderSpec &border)
{
    return spaceTaken(title, border, Edge::Top);
}

inline int bottomSpaceTaken(const Title &title, const border::BorderSpec &border)
{
    return spaceTaken(title, border, Edge::Bottom);
}

/// @brief Build one horizontal border line @p width columns wide.
/// @details Layout: corner, left title, floor(rest / 2) line glyphs, centre
///          title, ceil(rest / 2) line glyphs, right title, corner. Each
///          segment is painted with @p brush on its own. A negative rest is
///          treated as zero.
std::string borderLine(const Title &title,
                       int width,
                       const border::BorderSpec &border,
                       const style::Brush &brush,
                       Edge edge);

inline std::string topBorder(const Title &title,
                             int width,
                             const border::BorderSpec &border,
                             const style::Brush &brush)
{
    return borderLine(title, width, border, brush, Edge::Top);
}

inline std::string bottomBorder(const Title &title,
                                int width,
                                const border::BorderSpec &border,
                                const style::Brush &brush)
{
    return borderLine(title, width, border, brush, Edge::Bottom);
}

} // namespace tbox::render
