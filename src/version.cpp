//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/version.cpp
// Purpose: Provide the version query for the box rendering library so
//          embedders can assert compatibility.
// Key invariants: Returned string remains valid for the process lifetime and
//                 matches the version recorded in CMake metadata.
// Ownership/Lifetime: Returns a pointer to a string with static storage
//                     duration; callers must not attempt to free it.
//
//===----------------------------------------------------------------------===//

#include "tbox/version.hpp"

namespace tbox
{
/// @brief Report the "major.minor.patch" version of the library.
const char *tbox_version() noexcept
{
    return TBOX_VERSION_STRING;
}
} // namespace tbox
