//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/log.cpp
// Purpose: Implement the leveled logger declared in tbox/support/log.hpp.
// Key invariants: A message is written only when its level is at or above the
//                 current minimum; each message occupies exactly one line.
// Ownership/Lifetime: The sink stream is borrowed; the default is std::cerr.
// Links: include/tbox/support/log.hpp
//
//===----------------------------------------------------------------------===//

#include "tbox/support/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>

namespace tbox::log
{

namespace
{
Level g_level = Level::Info;
std::ostream *g_sink = nullptr;

/// @brief Format the wall-clock time as HH:MM:SS.
std::string timestamp()
{
    const auto now = std::chrono::system_clock::now();
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
#ifdef _WIN32
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}
} // namespace

Level level() noexcept
{
    return g_level;
}

void setLevel(Level level) noexcept
{
    g_level = level;
}

bool enabled(Level level) noexcept
{
    return level != Level::Off && static_cast<int>(level) >= static_cast<int>(g_level);
}

void setSink(std::ostream *sink) noexcept
{
    g_sink = sink;
}

std::optional<Level> parseLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(lower.begin(),
                   lower.end(),
                   lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warn" || lower == "warning")
        return Level::Warn;
    if (lower == "error")
        return Level::Error;
    if (lower == "off")
        return Level::Off;
    return std::nullopt;
}

const char *toString(Level level) noexcept
{
    switch (level)
    {
        case Level::Debug:
            return "DEBUG";
        case Level::Info:
            return "INFO";
        case Level::Warn:
            return "WARN";
        case Level::Error:
            return "ERROR";
        case Level::Off:
            return "OFF";
    }
    return "OFF";
}

void write(Level level, std::string_view message)
{
    if (!enabled(level))
    {
        return;
    }
    std::ostream &os = g_sink ? *g_sink : std::cerr;
    os << '[' << toString(level) << "] " << timestamp() << ' ' << message << '\n';
}

} // namespace tbox::log
