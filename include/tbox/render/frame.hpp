//===----------------------------------------------------------------------===//
//
// Part of the tbox project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/tbox/render/frame.hpp
// Purpose: Frame renderer composing borders, titles and styled content into
//          either flowed text or cursor-positioned output.
// Key invariants:
//   - Positioned mode is selected iff both top and left are set.
//   - Flowed output ends every row, border rows included, with the content's
//     line separator; positioned output carries no separators.
//   - Every option is validated before the first fragment is produced.
// Ownership/Lifetime: FrameRenderer borrows its Styler.
// Links: src/render/frame.cpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "tbox/border/border_spec.hpp"
#include "tbox/render/title.hpp"
#include "tbox/style/color.hpp"
#include "tbox/support/expected.hpp"
#include "tbox/text/align.hpp"

#include <functional>
#include <initializer_list>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tbox::render
{

/// @brief Box content: literal text blocks or a callback producing the text.
class Content
{
  public:
    using Producer = std::function<std::string()>;

    /// @brief Empty content.
    Content() = default;

    Content(std::string text) : value_(std::vector<std::string>{std::move(text)}) {}

    Content(const char *text) : Content(std::string(text)) {}

    Content(std::vector<std::string> blocks) : value_(std::move(blocks)) {}

    Content(std::initializer_list<std::string> blocks) : value_(std::vector<std::string>(blocks))
    {
    }

    /// @brief Content computed when the frame is rendered.
    static Content computed(Producer producer)
    {
        Content c;
        c.value_ = std::move(producer);
        return c;
    }

    /// @brief Produce the text: blocks joined by "\n", or the callback result.
    [[nodiscard]] std::string resolve() const;

  private:
    std::variant<std::vector<std::string>, Producer> value_;
};

/// @brief Everything that shapes a frame apart from its content.
struct FrameOptions
{
    std::optional<int> top;
    std::optional<int> left;
    std::optional<int> width;
    std::optional<int> height;
    text::Align align{text::Align::Left};
    std::vector<int> padding{0};
    Title title;
    border::BorderValue border{border::GlyphSet::Light};
    style::StyleSpec style;
    int count{1};

    [[nodiscard]] bool positioned() const
    {
        return top.has_value() && left.has_value();
    }
};

/// @brief Renders frames using a borrowed style capability.
class FrameRenderer
{
  public:
    explicit FrameRenderer(const style::Styler &styler) : styler_(styler) {}

    /// @brief Render @p content framed as described by @p options.
    /// @return The rendered string, or the first validation error.
    support::Expected<std::string> render(const Content &content, const FrameOptions &options) const;

  private:
    const style::Styler &styler_;
};

/// @brief Render with the process-wide default styler.
support::Expected<std::string> frame(const Content &content, const FrameOptions &options = {});

/// @brief Render an empty frame.
support::Expected<std::string> frame(const FrameOptions &options);

} // namespace tbox::render
