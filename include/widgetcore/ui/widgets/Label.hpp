#pragma once

#include <widgetcore/ui/DrawCommands.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/Style.hpp>
#include <widgetcore/ui/TextShaper.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace WC::UI::Widgets {

struct LabelPrimitives {
    std::optional<Scene::TextCommand> text;
    std::optional<Scene::QuadCommand> bg_quad;
};

// Single line of text over an optional background quad. Reused by the button
// widgets; the unclipped text size is cached and only re-measured when the
// text or its properties change.
class Label {
public:
    Label(std::string text, Point text_offset, LabelStyle const& style, TextShaper const& shaper);

    // Returns true if the text changed.
    auto set_text(std::string_view text, TextShaper const& shaper) -> bool;
    [[nodiscard]] auto text() const -> std::string const& { return text_; }

    auto set_style(LabelStyle const& style, TextShaper const& shaper) -> void;

    // Shifts the text without moving the background quad. Returns true if
    // the offset changed.
    auto set_text_offset(Point offset) -> bool;
    [[nodiscard]] auto text_offset() const -> Point { return text_offset_; }

    [[nodiscard]] auto unclipped_text_size() const -> Size { return unclipped_size_; }
    [[nodiscard]] auto desired_padded_size(LabelStyle const& style) const -> Size;

    [[nodiscard]] auto render_primitives(Rect const& bounds,
                                         LabelStyle const& style,
                                         TextShaper const& shaper) const -> LabelPrimitives;

private:
    auto remeasure(TextShaper const& shaper) -> void;

    std::string    text_;
    Point          text_offset_;
    TextProperties properties_;
    Size           unclipped_size_{};
};

struct DualLabelPrimitives {
    std::optional<Scene::TextCommand> left_text;
    std::optional<Scene::TextCommand> right_text;
};

// Left-aligned and right-aligned text sharing one row.
class DualLabel {
public:
    DualLabel(std::string left_text, std::string right_text, DualLabelStyle const& style, TextShaper const& shaper);

    [[nodiscard]] auto left_text() const -> std::string const& { return left_text_; }
    [[nodiscard]] auto right_text() const -> std::string const& { return right_text_; }

    auto set_style(DualLabelStyle const& style, TextShaper const& shaper) -> void;

    [[nodiscard]] auto left_unclipped_size() const -> Size { return left_size_; }
    [[nodiscard]] auto right_unclipped_size() const -> Size { return right_size_; }
    [[nodiscard]] auto desired_padded_size(DualLabelStyle const& style) const -> Size;

    [[nodiscard]] auto render_primitives(Rect const& bounds,
                                         DualLabelStyle const& style,
                                         TextShaper const& shaper) const -> DualLabelPrimitives;

private:
    std::string    left_text_;
    std::string    right_text_;
    TextProperties left_properties_;
    TextProperties right_properties_;
    Size           left_size_{};
    Size           right_size_{};
};

// Box left after removing `padding` from `bounds`, never negative.
[[nodiscard]] auto PaddedRect(Rect const& bounds, Padding const& padding) -> Rect;

} // namespace WC::UI::Widgets
