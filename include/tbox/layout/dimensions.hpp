//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/layout/dimensions.hpp
// Purpose: Interior size of a box inferred from its content and padding.
// Key invariants: The inferred width is at least left + 1 + right padding.
// Ownership/Lifetime: Value types.
// Links: src/layout/dimensions.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/text/padding.hpp"

#include <string>
#include <vector>

namespace tbox::layout
{

/// @brief Width and height in terminal cells.
struct Dimensions
{
    int width{0};
    int height{0};
};

/// @brief Size of the content area needed by @p lines surrounded by @p padding.
/// @details Width is the longest line measured in codepoints plus horizontal
///          padding, with an empty line list counting as width 1. Height is
///          the line count plus vertical padding. Borders are not included.
Dimensions inferDimensions(const std::vector<std::string> &lines, const text::Padding &padding);

} // namespace tbox::layout
