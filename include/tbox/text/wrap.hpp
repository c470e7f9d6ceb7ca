//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/wrap.hpp
// Purpose: Word wrapping of ANSI-decorated text to a column budget.
// Key invariants: Escape sequences are never split and never counted; no
//                 produced row is wider than the budget unless the budget is
//                 narrower than a single wide character.
// Ownership/Lifetime: Returned rows are owned by the caller.
// Links: src/text/wrap.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace tbox::text
{

/// @brief Wrap @p text into rows of at most @p width columns.
/// @details The text is first split on its own line separator. Rows that fit
///          are kept verbatim. Longer rows break greedily at spaces; words
///          wider than @p width are cut at the column limit. A @p width of
///          zero or less disables wrapping.
std::vector<std::string> wrap(std::string_view text, int width);

} // namespace tbox::text
