//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/text/padding.hpp
// Purpose: Normalise CSS-style padding shorthands into four side values.
// Key invariants: A parsed Padding never holds a negative side.
// Ownership/Lifetime: Value type.
// Links: src/text/padding.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/support/expected.hpp"

#include <string_view>
#include <vector>

namespace tbox::text
{

/// @brief Spacing around box content, one value per side.
struct Padding
{
    int top{0};
    int right{0};
    int bottom{0};
    int left{0};

    /// @brief Padding with the same value on all four sides.
    static Padding uniform(int value)
    {
        return Padding{value, value, value, value};
    }

    bool operator==(const Padding &other) const
    {
        return top == other.top && right == other.right && bottom == other.bottom &&
               left == other.left;
    }
};

/// @brief Expand a 1 to 4 value shorthand.
/// @details One value applies to all sides; two are vertical/horizontal;
///          three are top/horizontal/bottom; four are top/right/bottom/left.
/// @return Padding, or ErrorCode::InvalidPadding for another arity or a
///         negative value.
support::Expected<Padding> parsePadding(const std::vector<int> &shorthand);

/// @brief Parse a textual shorthand such as "1", "1 2" or "1,2,3,4".
support::Expected<Padding> parsePadding(std::string_view text);

} // namespace tbox::text
