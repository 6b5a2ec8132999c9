#pragma once

#include <widgetcore/ui/ButtonState.hpp>
#include <widgetcore/ui/Style.hpp>

namespace WC::UI {

struct ButtonStyle {
    TextProperties properties{};
    Align vertical_align = Align::Center;
    Size min_clipped_size{5.0f, 5.0f};
    Padding padding{};

    ButtonStylePart idle{};
    ButtonStylePart hovered{};
    ButtonStylePart down{};
    ButtonStylePart disabled{};

    friend auto operator==(ButtonStyle const&, ButtonStyle const&) -> bool = default;
};

struct ToggleButtonStyle {
    TextProperties properties{};
    Align vertical_align = Align::Center;
    Size min_clipped_size{5.0f, 5.0f};
    Padding padding{};

    ButtonStylePart idle_on{};
    ButtonStylePart hovered_on{};
    ButtonStylePart disabled_on{};

    ButtonStylePart idle_off{};
    ButtonStylePart hovered_off{};
    ButtonStylePart disabled_off{};

    friend auto operator==(ToggleButtonStyle const&, ToggleButtonStyle const&) -> bool = default;
};

struct DropDownMenuStyle {
    TextProperties left_text_properties{};
    TextProperties right_text_properties{};

    Color left_text_color_idle = Colors::kWhite;
    Color right_text_color_idle = Colors::kWhite;
    Color left_text_color_hover = Colors::kWhite;
    Color right_text_color_hover = Colors::kWhite;

    QuadStyle back_quad{};
    QuadStyle text_bg_quad_hover{};

    float outer_padding = 4.0f;
    Padding left_text_padding{};
    Padding right_text_padding{};

    Color divider_color = Colors::kTransparent;
    float divider_width = 1.0f;
    float divider_padding = 2.0f;

    friend auto operator==(DropDownMenuStyle const&, DropDownMenuStyle const&) -> bool = default;
};

auto MakeDefaultButtonStyle() -> ButtonStyle;
auto MakeDefaultToggleButtonStyle() -> ToggleButtonStyle;
auto MakeDefaultDropDownMenuStyle() -> DropDownMenuStyle;

// Total over every (state, toggled) combination.
[[nodiscard]] auto ResolvePart(ButtonStyle const& style, ButtonState state) -> ButtonStylePart const&;
[[nodiscard]] auto ResolvePart(ToggleButtonStyle const& style,
                               ButtonState state,
                               bool toggled) -> ButtonStylePart const&;

[[nodiscard]] auto ResolveLabelStyle(ButtonStyle const& style, ButtonState state) -> LabelStyle;
[[nodiscard]] auto ResolveLabelStyle(ToggleButtonStyle const& style,
                                     ButtonState state,
                                     bool toggled) -> LabelStyle;

[[nodiscard]] auto ResolveDualLabelStyle(DropDownMenuStyle const& style, bool hovered) -> DualLabelStyle;

// Height of one option row: the taller of the two padded label columns.
[[nodiscard]] auto TextRowHeight(DropDownMenuStyle const& style) -> float;

} // namespace WC::UI
