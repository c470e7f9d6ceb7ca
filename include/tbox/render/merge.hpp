//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/render/merge.hpp
// Purpose: Place two rendered boxes side by side.
// Links: src/render/merge.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>

namespace tbox::render
{

/// @brief Concatenate two flowed boxes row by row with a two-space gutter.
/// @details Each box's width is taken from its first row, so both inputs must
///          be flowed output whose rows share one width; positioned output or
///          ragged rows misalign. The shorter box is extended with rows of
///          spaces. Rows are joined with "\n" and the result has no trailing
///          separator.
/// @pre @p main and @p addition are flowed frames with uniform row widths.
std::string mergeBoxes(std::string_view main, std::string_view addition);

} // namespace tbox::render
