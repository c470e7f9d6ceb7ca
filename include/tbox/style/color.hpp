//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/style/color.hpp
// Purpose: Colour names, the style application capability and the brushes
//          the renderer paints fragments with.
// Key invariants: Styling an empty fragment yields an empty string; every
//                 styled fragment ends with a reset so styling stays scoped.
// Ownership/Lifetime: Brushes borrow their Styler, which must outlive them.
// Links: src/style/color.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/support/expected.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace tbox::style
{

/// @brief Which half of a colour pair a name is applied to.
enum class Channel
{
    Foreground,
    Background
};

/// @brief Optional foreground and background colour names.
struct ColorPair
{
    std::optional<std::string> fg;
    std::optional<std::string> bg;

    [[nodiscard]] bool empty() const
    {
        return !fg && !bg;
    }
};

/// @brief Styling of a frame: content colours plus border colours.
/// @details Border colours also apply to titles.
struct StyleSpec
{
    std::optional<std::string> fg;
    std::optional<std::string> bg;
    ColorPair border;

    [[nodiscard]] ColorPair content() const
    {
        return ColorPair{fg, bg};
    }
};

/// @brief Capability that decorates text with named colours.
class Styler
{
  public:
    virtual ~Styler() = default;

    /// @brief Decorate @p text with foreground colour or attribute @p name.
    virtual std::string applyFg(std::string_view name, std::string_view text) const = 0;

    /// @brief Decorate @p text with background colour @p name.
    virtual std::string applyBg(std::string_view name, std::string_view text) const = 0;

    /// @brief Check that @p name is usable on @p channel.
    virtual support::Expected<void> validate(Channel channel, std::string_view name) const = 0;
};

/// @brief Styler emitting ANSI SGR sequences.
/// @details Accepts the eight basic colours, their bright_ variants, text
///          attributes (foreground only) and #rrggbb truecolour values. A
///          disabled styler validates names but returns text unchanged.
class AnsiStyler final : public Styler
{
  public:
    explicit AnsiStyler(bool enabled = true) : enabled_(enabled) {}

    std::string applyFg(std::string_view name, std::string_view text) const override;
    std::string applyBg(std::string_view name, std::string_view text) const override;
    support::Expected<void> validate(Channel channel, std::string_view name) const override;

    [[nodiscard]] bool enabled() const
    {
        return enabled_;
    }

  private:
    bool enabled_;
};

/// @brief Process-wide enabled AnsiStyler, created on first use.
const Styler &defaultStyler();

/// @brief SGR parameter string for @p name on @p channel, e.g. "34" or "48;2;1;2;3".
std::optional<std::string> sgrParameters(Channel channel, std::string_view name);

/// @brief Validate every colour name present in @p spec.
support::Expected<void> validate(const StyleSpec &spec, const Styler &styler);

/// @brief Foreground and background applied together to fragments.
/// @details Unset channels act as identity. The foreground is applied first
///          and the background wraps the result.
class Brush
{
  public:
    Brush(const Styler &styler, ColorPair colors) : styler_(&styler), colors_(std::move(colors)) {}

    std::string operator()(std::string_view text) const;

    /// @brief True when at least one channel is set.
    [[nodiscard]] bool active() const
    {
        return !colors_.empty();
    }

  private:
    const Styler *styler_;
    ColorPair colors_;
};

} // namespace tbox::style
