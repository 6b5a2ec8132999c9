#pragma once

#include <algorithm>
#include <cstdint>

namespace WC::UI {

using ZIndex = std::uint16_t;
using ScissorRectID = std::uint32_t;

inline constexpr ScissorRectID kMainScissorRect = 0;

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    friend auto operator==(Point const&, Point const&) -> bool = default;
};

struct Size {
    float width = 0.0f;
    float height = 0.0f;

    [[nodiscard]] auto is_empty() const -> bool { return width <= 0.0f || height <= 0.0f; }

    friend auto operator==(Size const&, Size const&) -> bool = default;
};

struct Rect {
    Point origin{};
    Size size{};

    [[nodiscard]] static auto from_size(Size s) -> Rect { return Rect{Point{}, s}; }

    [[nodiscard]] auto min_x() const -> float { return origin.x; }
    [[nodiscard]] auto min_y() const -> float { return origin.y; }
    [[nodiscard]] auto max_x() const -> float { return origin.x + size.width; }
    [[nodiscard]] auto max_y() const -> float { return origin.y + size.height; }
    [[nodiscard]] auto width() const -> float { return size.width; }
    [[nodiscard]] auto height() const -> float { return size.height; }

    // Half-open: a zero-sized rect never contains a point.
    [[nodiscard]] auto contains(Point p) const -> bool {
        return p.x >= min_x() && p.x < max_x() && p.y >= min_y() && p.y < max_y();
    }

    friend auto operator==(Rect const&, Rect const&) -> bool = default;
};

struct Padding {
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;

    friend auto operator==(Padding const&, Padding const&) -> bool = default;
};

enum class Align {
    Start,
    Center,
    End,
};

struct Align2 {
    Align horizontal = Align::Center;
    Align vertical = Align::Center;

    static constexpr auto TopCenter() -> Align2 { return Align2{Align::Center, Align::Start}; }
    static constexpr auto BottomCenter() -> Align2 { return Align2{Align::Center, Align::End}; }
    static constexpr auto CenterLeft() -> Align2 { return Align2{Align::Start, Align::Center}; }
    static constexpr auto CenterRight() -> Align2 { return Align2{Align::End, Align::Center}; }

    friend auto operator==(Align2 const&, Align2 const&) -> bool = default;
};

[[nodiscard]] inline auto intersect(Rect const& a, Rect const& b) -> Rect {
    float const min_x = std::max(a.min_x(), b.min_x());
    float const min_y = std::max(a.min_y(), b.min_y());
    float const max_x = std::min(a.max_x(), b.max_x());
    float const max_y = std::min(a.max_y(), b.max_y());
    return Rect{Point{min_x, min_y},
                Size{std::max(0.0f, max_x - min_x), std::max(0.0f, max_y - min_y)}};
}

} // namespace WC::UI
