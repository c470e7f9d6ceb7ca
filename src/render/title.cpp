//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/render/title.cpp
// Purpose: Place titles and corners on horizontal border lines.
// Key invariants: Hidden corners and unset titles contribute nothing, so the
//                 line glyph runs grow to fill their space.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/render/title.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/render/title.hpp"

#include "tbox/border/glyphs.hpp"
#include "tbox/text/ansi.hpp"

#include <algorithm>

namespace tbox::render
{

namespace
{
std::string repeat(std::string_view glyph, int n)
{
    std::string out;
    for (int i = 0; i < n; ++i)
    {
        out.append(glyph);
    }
    return out;
}

std::string cornerGlyph(const std::optional<border::GlyphKind> &kind,
                        bool sideVisible,
                        border::GlyphSet set)
{
    if (!kind || !sideVisible)
    {
        return std::string();
    }
    return std::string(border::glyph(*kind, set));
}
} // namespace

std::string leftCorner(const border::BorderSpec &border, Edge edge)
{
    const auto &kind = edge == Edge::Top ? border.topLeft : border.bottomLeft;
    return cornerGlyph(kind, border.left, border.type);
}

std::string rightCorner(const border::BorderSpec &border, Edge edge)
{
    const auto &kind = edge == Edge::Top ? border.topRight : border.bottomRight;
    return cornerGlyph(kind, border.right, border.type);
}

int titlesSize(const Title &title, Edge edge)
{
    if (edge == Edge::Top)
    {
        return static_cast<int>(text::length(title.topLeft) + text::length(title.topCenter) +
                                text::length(title.topRight));
    }
    return static_cast<int>(text::length(title.bottomLeft) + text::length(title.bottomCenter) +
                            text::length(title.bottomRight));
}

int spaceTaken(const Title &title, const border::BorderSpec &border, Edge edge)
{
    return titlesSize(title, edge) + static_cast<int>(text::length(leftCorner(border, edge))) +
           static_cast<int>(text::length(rightCorner(border, edge)));
}

std::string borderLine(const Title &title,
                       int width,
                       const border::BorderSpec &border,
                       const style::Brush &brush,
                       Edge edge)
{
    const bool top = edge == Edge::Top;
    const int rest = std::max(0, width - spaceTaken(title, border, edge));
    const int before = rest / 2;
    const int after = rest - before;
    const std::string_view line = border::glyph(border::GlyphKind::Line, border.type);

    std::string out;
    out += brush(leftCorner(border, edge));
    out += brush(top ? title.topLeft : title.bottomLeft);
    out += brush(repeat(line, before));
    out += brush(top ? title.topCenter : title.bottomCenter);
    out += brush(repeat(line, after));
    out += brush(top ? title.topRight : title.bottomRight);
    out += brush(rightCorner(border, edge));
    return out;
}

} // namespace tbox::render
