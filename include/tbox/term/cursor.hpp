//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/term/cursor.hpp
// Purpose: Cursor positioning escape sequences for absolutely placed boxes.
// Key invariants: Coordinates are zero-based on input and one-based in the
//                 emitted sequence.
// Ownership/Lifetime: Returns owned strings.
// Links: src/term/cursor.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace tbox::term
{

/// @brief Build the CUP sequence moving the cursor to column @p col, row @p row.
/// @return "ESC[<row+1>;<col+1>H".
std::string moveTo(int col, int row);

} // namespace tbox::term
