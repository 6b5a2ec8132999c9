#include <widgetcore/ui/StyleResolver.hpp>

#include <algorithm>

namespace WC::UI {

namespace {

template <typename Style>
auto make_label_style(Style const& style, ButtonStylePart const& part) -> LabelStyle {
    LabelStyle label{};
    label.properties = style.properties;
    label.font_color = part.font_color;
    label.vertical_align = style.vertical_align;
    label.min_clipped_size = style.min_clipped_size;
    label.back_quad = part.back_quad;
    label.padding = style.padding;
    return label;
}

} // namespace

auto ResolvePart(ButtonStyle const& style, ButtonState state) -> ButtonStylePart const& {
    switch (state) {
    case ButtonState::Idle:
        return style.idle;
    case ButtonState::Hovered:
        return style.hovered;
    case ButtonState::Down:
        return style.down;
    case ButtonState::Disabled:
        return style.disabled;
    }
    return style.idle;
}

auto ResolvePart(ToggleButtonStyle const& style,
                 ButtonState state,
                 bool toggled) -> ButtonStylePart const& {
    // A pressed toggle shows the hovered look of its current value.
    switch (state) {
    case ButtonState::Idle:
        return toggled ? style.idle_on : style.idle_off;
    case ButtonState::Hovered:
    case ButtonState::Down:
        return toggled ? style.hovered_on : style.hovered_off;
    case ButtonState::Disabled:
        return toggled ? style.disabled_on : style.disabled_off;
    }
    return toggled ? style.idle_on : style.idle_off;
}

auto ResolveLabelStyle(ButtonStyle const& style, ButtonState state) -> LabelStyle {
    return make_label_style(style, ResolvePart(style, state));
}

auto ResolveLabelStyle(ToggleButtonStyle const& style,
                       ButtonState state,
                       bool toggled) -> LabelStyle {
    return make_label_style(style, ResolvePart(style, state, toggled));
}

auto ResolveDualLabelStyle(DropDownMenuStyle const& style, bool hovered) -> DualLabelStyle {
    DualLabelStyle dual{};
    dual.left_properties = style.left_text_properties;
    dual.right_properties = style.right_text_properties;
    dual.left_font_color = hovered ? style.left_text_color_hover : style.left_text_color_idle;
    dual.right_font_color = hovered ? style.right_text_color_hover : style.right_text_color_idle;
    dual.vertical_align = Align::Center;
    dual.left_padding = style.left_text_padding;
    dual.right_padding = style.right_text_padding;
    return dual;
}

auto TextRowHeight(DropDownMenuStyle const& style) -> float {
    float const left = style.left_text_properties.line_height
                       + style.left_text_padding.top
                       + style.left_text_padding.bottom;
    float const right = style.right_text_properties.line_height
                        + style.right_text_padding.top
                        + style.right_text_padding.bottom;
    return std::max(left, right);
}

} // namespace WC::UI
