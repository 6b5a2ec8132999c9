#pragma once

#include <widgetcore/ui/DrawCommands.hpp>
#include <widgetcore/ui/Geometry.hpp>

#include <array>
#include <optional>
#include <string>

namespace WC::UI {

using Color = std::array<float, 4>;

namespace Colors {
inline constexpr Color kTransparent{0.0f, 0.0f, 0.0f, 0.0f};
inline constexpr Color kWhite{1.0f, 1.0f, 1.0f, 1.0f};
inline constexpr Color kBlack{0.0f, 0.0f, 0.0f, 1.0f};
inline constexpr Color kAccent{0.176f, 0.353f, 0.914f, 1.0f};
} // namespace Colors

[[nodiscard]] constexpr auto rgba8(int r, int g, int b, int a = 255) -> Color {
    return Color{static_cast<float>(r) / 255.0f,
                 static_cast<float>(g) / 255.0f,
                 static_cast<float>(b) / 255.0f,
                 static_cast<float>(a) / 255.0f};
}

struct BorderStyle {
    Color color = Colors::kTransparent;
    float width = 0.0f;
    float radius = 0.0f;

    friend auto operator==(BorderStyle const&, BorderStyle const&) -> bool = default;
};

struct QuadStyle {
    Color bg = Colors::kTransparent;
    BorderStyle border{};

    [[nodiscard]] auto is_transparent() const -> bool {
        return bg[3] <= 0.0f && (border.width <= 0.0f || border.color[3] <= 0.0f);
    }

    [[nodiscard]] auto create_primitive(Rect const& bounds) const -> Scene::QuadCommand;

    friend auto operator==(QuadStyle const&, QuadStyle const&) -> bool = default;
};

struct TextProperties {
    float font_size = 14.0f;
    float line_height = 16.0f;
    float letter_spacing = 0.0f;
    std::string font_family = "system-ui";
    // Horizontal alignment of the text inside its padded box.
    Align align = Align::Start;

    friend auto operator==(TextProperties const&, TextProperties const&) -> bool = default;
};

// The paint parameters resolved for one (interaction state, toggled) pair.
struct ButtonStylePart {
    Color font_color = Colors::kWhite;
    QuadStyle back_quad{};

    friend auto operator==(ButtonStylePart const&, ButtonStylePart const&) -> bool = default;
};

struct LabelStyle {
    TextProperties properties{};
    Color font_color = Colors::kWhite;
    Align vertical_align = Align::Center;
    Size min_clipped_size{5.0f, 5.0f};
    QuadStyle back_quad{};
    Padding padding{};

    friend auto operator==(LabelStyle const&, LabelStyle const&) -> bool = default;
};

struct DualLabelStyle {
    TextProperties left_properties{};
    TextProperties right_properties{};
    Color left_font_color = Colors::kWhite;
    Color right_font_color = Colors::kWhite;
    Align vertical_align = Align::Center;
    Size min_clipped_size{5.0f, 5.0f};
    Padding left_padding{};
    Padding right_padding{};

    friend auto operator==(DualLabelStyle const&, DualLabelStyle const&) -> bool = default;
};

} // namespace WC::UI
