//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/align.hpp
// Purpose: Horizontal alignment and padding of content rows.
// Key invariants: Alignment and padding only ever add spaces; they never
//                 truncate a row.
// Ownership/Lifetime: Returned rows are owned by the caller.
// Links: src/text/align.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/text/padding.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tbox::text
{

/// @brief Horizontal placement of a row inside its column budget.
enum class Align
{
    Left,
    Center,
    Right
};

/// @brief Parse "left", "center" or "right".
std::optional<Align> parseAlign(std::string_view name);

const char *toString(Align align);

/// @brief Fill every row with spaces up to @p width visible columns.
/// @details Center places floor(diff / 2) spaces before the row and the rest
///          after it. Rows already @p width columns or wider are unchanged.
std::vector<std::string> align(const std::vector<std::string> &rows, int width, Align direction);

/// @brief Surround @p rows with spaces as described by @p padding.
/// @details Horizontal padding is added to each row; empty rows are first
///          filled to the widest row. Vertical padding adds blank rows as wide
///          as the padded rows.
std::vector<std::string> pad(const std::vector<std::string> &rows, const Padding &padding);

} // namespace tbox::text
