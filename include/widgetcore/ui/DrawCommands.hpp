#pragma once

#include <widgetcore/ui/Geometry.hpp>

#include <array>
#include <cstdint>
#include <string>

namespace WC::UI::Scene {

using Color = std::array<float, 4>;

enum class DrawCommandKind : std::uint32_t {
    SolidQuad = 0,
    Quad = 1,
    Text = 2,
};

struct SolidQuadCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    Color color{0.0f, 0.0f, 0.0f, 1.0f};

    friend auto operator==(SolidQuadCommand const&, SolidQuadCommand const&) -> bool = default;
};

struct QuadCommand {
    float min_x = 0.0f;
    float min_y = 0.0f;
    float max_x = 0.0f;
    float max_y = 0.0f;
    float radius_top_left = 0.0f;
    float radius_top_right = 0.0f;
    float radius_bottom_right = 0.0f;
    float radius_bottom_left = 0.0f;
    float border_width = 0.0f;
    Color color{0.0f, 0.0f, 0.0f, 1.0f};
    Color border_color{0.0f, 0.0f, 0.0f, 0.0f};

    friend auto operator==(QuadCommand const&, QuadCommand const&) -> bool = default;
};

struct TextCommand {
    std::string text;
    // Position of the unclipped text box.
    float origin_x = 0.0f;
    float origin_y = 0.0f;
    // Clip rectangle the text is confined to.
    float clip_min_x = 0.0f;
    float clip_min_y = 0.0f;
    float clip_max_x = 0.0f;
    float clip_max_y = 0.0f;
    float font_size = 14.0f;
    float line_height = 16.0f;
    Color color{1.0f, 1.0f, 1.0f, 1.0f};

    friend auto operator==(TextCommand const&, TextCommand const&) -> bool = default;
};

[[nodiscard]] inline auto make_solid_quad(Rect const& rect, Color const& color) -> SolidQuadCommand {
    return SolidQuadCommand{rect.min_x(), rect.min_y(), rect.max_x(), rect.max_y(), color};
}

[[nodiscard]] inline auto command_rect(SolidQuadCommand const& cmd) -> Rect {
    return Rect{Point{cmd.min_x, cmd.min_y}, Size{cmd.max_x - cmd.min_x, cmd.max_y - cmd.min_y}};
}

[[nodiscard]] inline auto command_rect(QuadCommand const& cmd) -> Rect {
    return Rect{Point{cmd.min_x, cmd.min_y}, Size{cmd.max_x - cmd.min_x, cmd.max_y - cmd.min_y}};
}

} // namespace WC::UI::Scene
