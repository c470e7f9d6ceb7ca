//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/layout/formatter.hpp
// Purpose: Turn raw content into the interior rows of a box.
// Key invariants: Every produced row comes from wrap, then align, then pad.
// Ownership/Lifetime: Returned rows are owned by the caller.
// Links: src/layout/formatter.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/text/align.hpp"
#include "tbox/text/padding.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tbox::layout
{

/// @brief Wrap, align and pad @p content for a box @p totalWidth wide.
/// @details The column budget is totalWidth - 2 - padding.left -
///          padding.right; the 2 reserves the left and right border columns
///          even when a side is hidden so layout does not shift.
/// @return One entry per interior row; empty when @p content is empty.
std::vector<std::string> formatContent(std::string_view content,
                                       int totalWidth,
                                       const text::Padding &padding,
                                       text::Align align);

} // namespace tbox::layout
