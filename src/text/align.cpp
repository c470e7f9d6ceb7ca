//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/text/align.cpp
// Purpose: Implement row alignment and padding.
// Key invariants: See include/tbox/text/align.hpp.
// Ownership/Lifetime: Stateless helpers.
// Links: include/tbox/text/align.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/text/align.hpp"

#include "tbox/text/ansi.hpp"

#include <algorithm>
#include <cctype>

namespace tbox::text
{

namespace
{
std::string spaces(int n)
{
    return n > 0 ? std::string(static_cast<std::size_t>(n), ' ') : std::string();
}
} // namespace

std::optional<Align> parseAlign(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "left")
        return Align::Left;
    if (lower == "center")
        return Align::Center;
    if (lower == "right")
        return Align::Right;
    return std::nullopt;
}

const char *toString(Align align)
{
    switch (align)
    {
        case Align::Left:
            return "left";
        case Align::Center:
            return "center";
        case Align::Right:
            return "right";
    }
    return "left";
}

std::vector<std::string> align(const std::vector<std::string> &rows, int width, Align direction)
{
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto &row : rows)
    {
        const int diff = width - static_cast<int>(visibleWidth(row));
        if (diff <= 0)
        {
            out.push_back(row);
            continue;
        }
        switch (direction)
        {
            case Align::Left:
                out.push_back(row + spaces(diff));
                break;
            case Align::Right:
                out.push_back(spaces(diff) + row);
                break;
            case Align::Center:
            {
                const int before = diff / 2;
                out.push_back(spaces(before) + row + spaces(diff - before));
                break;
            }
        }
    }
    return out;
}

std::vector<std::string> pad(const std::vector<std::string> &rows, const Padding &padding)
{
    int rowWidth = 0;
    for (const auto &row : rows)
    {
        rowWidth = std::max(rowWidth, static_cast<int>(visibleWidth(row)));
    }
    const std::string filler = spaces(rowWidth);
    const std::string before = spaces(padding.left);
    const std::string after = spaces(padding.right);

    std::vector<std::string> out;
    out.reserve(rows.size() + static_cast<std::size_t>(padding.top + padding.bottom));
    for (int i = 0; i < padding.top; ++i)
    {
        out.push_back(before + filler + after);
    }
    for (const auto &row : rows)
    {
        out.push_back(before + (row.empty() ? filler : row) + after);
    }
    for (int i = 0; i < padding.bottom; ++i)
    {
        out.push_back(before + filler + after);
    }
    return out;
}

} // namespace tbox::text
