#include <widgetcore/ui/StyleResolver.hpp>

namespace WC::UI {

namespace {

constexpr Color kBorderIdle = rgba8(105, 105, 105);
constexpr Color kBorderHover = rgba8(135, 135, 135);
constexpr Color kBorderDisabled = rgba8(80, 80, 80);
constexpr Color kFillDark = rgba8(40, 40, 40);
constexpr Color kFillHover = rgba8(65, 65, 65);
constexpr Color kFillDisabledOn = rgba8(76, 76, 76);
constexpr Color kTextDisabled = rgba8(150, 150, 150);

auto rounded(Color bg, Color border) -> QuadStyle {
    return QuadStyle{bg, BorderStyle{border, 1.0f, 4.0f}};
}

auto with_border(ButtonStylePart part, Color border) -> ButtonStylePart {
    part.back_quad.border.color = border;
    return part;
}

} // namespace

auto QuadStyle::create_primitive(Rect const& bounds) const -> Scene::QuadCommand {
    Scene::QuadCommand quad{};
    quad.min_x = bounds.min_x();
    quad.min_y = bounds.min_y();
    quad.max_x = bounds.max_x();
    quad.max_y = bounds.max_y();
    quad.radius_top_left = border.radius;
    quad.radius_top_right = border.radius;
    quad.radius_bottom_right = border.radius;
    quad.radius_bottom_left = border.radius;
    quad.border_width = border.width;
    quad.color = bg;
    quad.border_color = border.color;
    return quad;
}

auto MakeDefaultButtonStyle() -> ButtonStyle {
    ButtonStyle style{};
    style.properties.align = Align::Center;
    style.padding = Padding{6.0f, 6.0f, 6.0f, 6.0f};

    style.idle = ButtonStylePart{Colors::kWhite, rounded(kFillDark, kBorderIdle)};
    style.hovered = with_border(style.idle, kBorderHover);
    style.down = ButtonStylePart{Colors::kWhite, rounded(kFillHover, kBorderHover)};
    style.disabled = ButtonStylePart{kTextDisabled, rounded(kFillDark, kBorderDisabled)};
    return style;
}

auto MakeDefaultToggleButtonStyle() -> ToggleButtonStyle {
    ToggleButtonStyle style{};
    style.properties.align = Align::Center;
    style.padding = Padding{6.0f, 6.0f, 6.0f, 6.0f};

    auto const idle_on = ButtonStylePart{Colors::kWhite, rounded(Colors::kAccent, kBorderIdle)};
    auto idle_off = idle_on;
    idle_off.back_quad.bg = kFillDark;

    style.idle_on = idle_on;
    style.hovered_on = with_border(idle_on, kBorderHover);
    style.disabled_on = ButtonStylePart{kTextDisabled, rounded(kFillDisabledOn, kBorderDisabled)};

    style.idle_off = idle_off;
    style.hovered_off = with_border(idle_off, kBorderHover);
    style.disabled_off = ButtonStylePart{kTextDisabled, rounded(kFillDark, kBorderDisabled)};
    return style;
}

auto MakeDefaultDropDownMenuStyle() -> DropDownMenuStyle {
    DropDownMenuStyle style{};
    style.back_quad = rounded(kFillDark, kBorderIdle);
    style.text_bg_quad_hover = rounded(kFillHover, kBorderIdle);
    style.outer_padding = 4.0f;
    style.left_text_padding = Padding{5.0f, 10.0f, 5.0f, 10.0f};
    style.right_text_padding = Padding{5.0f, 10.0f, 5.0f, 30.0f};
    style.divider_color = rgba8(105, 105, 105, 150);
    style.divider_width = 1.0f;
    style.divider_padding = 2.0f;
    return style;
}

} // namespace WC::UI
