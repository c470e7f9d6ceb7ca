//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/term/cursor.cpp
// Purpose: Emit cursor positioning sequences.
// Key invariants: Output is a single CSI ... H sequence.
// Ownership/Lifetime: Stateless.
// Links: include/tbox/term/cursor.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/term/cursor.hpp"

namespace tbox::term
{

std::string moveTo(int col, int row)
{
    return "\x1b[" + std::to_string(row + 1) + ";" + std::to_string(col + 1) + 'H';
}

} // namespace tbox::term
