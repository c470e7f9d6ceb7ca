// include/tbox/version.hpp
#pragma once

/// @brief Returns the tbox version string.
/// @invariant The returned pointer is non-null and points to a null-terminated string.
/// @ownership The returned string has static storage duration and must not be freed.
namespace tbox
{
const char *tbox_version() noexcept;
} // namespace tbox
