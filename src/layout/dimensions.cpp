//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/layout/dimensions.cpp
// Purpose: Infer content-area dimensions.
// Key invariants: See include/tbox/layout/dimensions.hpp.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/layout/dimensions.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/layout/dimensions.hpp"

#include "tbox/text/ansi.hpp"

#include <algorithm>

namespace tbox::layout
{

Dimensions inferDimensions(const std::vector<std::string> &lines, const text::Padding &padding)
{
    std::size_t longest = 0;
    for (const auto &line : lines)
    {
        longest = std::max(longest, text::length(line));
    }
    const int contentWidth = lines.empty() ? 1 : static_cast<int>(longest);
    const int contentHeight = static_cast<int>(lines.size());

    Dimensions dims;
    dims.width = padding.left + contentWidth + padding.right;
    dims.height = padding.top + contentHeight + padding.bottom;
    return dims;
}

} // namespace tbox::layout
