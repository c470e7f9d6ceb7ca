//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/support/log.hpp
// Purpose: Simple leveled logging writing timestamped messages to stderr with
//          DEBUG/INFO/WARN/ERROR levels and a configurable minimum level.
//
// Key invariants:
//   - Levels are ordered: Debug < Info < Warn < Error < Off.
//   - Messages below the current minimum level are discarded.
//   - Output format is: [LEVEL] HH:MM:SS message
//   - The default minimum level is Info.
//
// Ownership/Lifetime:
//   - Log functions do not retain message strings.
//   - The minimum level and sink are process-wide state with no thread
//     safety guarantees.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace tbox::log
{

enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// @brief Current minimum level.
Level level() noexcept;

/// @brief Set the minimum level; messages below it are dropped.
void setLevel(Level level) noexcept;

/// @brief Check whether messages at @p level would be written.
bool enabled(Level level) noexcept;

/// @brief Redirect output to @p sink; nullptr restores stderr.
/// @details The stream is borrowed and must outlive its use as sink.
void setSink(std::ostream *sink) noexcept;

/// @brief Parse "debug", "info", "warn", "error" or "off" (case-insensitive).
std::optional<Level> parseLevel(std::string_view name);

/// @brief Uppercase label used in the log prefix.
const char *toString(Level level) noexcept;

void write(Level level, std::string_view message);

inline void debug(std::string_view message)
{
    write(Level::Debug, message);
}

inline void info(std::string_view message)
{
    write(Level::Info, message);
}

inline void warn(std::string_view message)
{
    write(Level::Warn, message);
}

inline void error(std::string_view message)
{
    write(Level::Error, message);
}

} // namespace tbox::log
