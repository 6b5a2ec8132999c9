#pragma once

#include <widgetcore/ui/Geometry.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <variant>

namespace WC::UI {

// Public menu content as supplied by application code.
namespace MenuEntries {
struct Option {
    std::string left_text;
    std::string right_text;
    std::size_t unique_id = 0;

    friend auto operator==(Option const&, Option const&) -> bool = default;
};
struct Divider {
    friend auto operator==(Divider const&, Divider const&) -> bool = default;
};
} // namespace MenuEntries

using MenuEntry = std::variant<MenuEntries::Option, MenuEntries::Divider>;

[[nodiscard]] inline auto MenuOption(std::string left, std::string right, std::size_t unique_id) -> MenuEntry {
    return MenuEntries::Option{std::move(left), std::move(right), unique_id};
}

[[nodiscard]] inline auto MenuDivider() -> MenuEntry {
    return MenuEntries::Divider{};
}

// Laid-out rows. Offsets are relative to the menu's top edge and are only
// meaningful after MeasureMenuRows.
struct OptionRow {
    std::size_t unique_id = 0;
    // Desired padded width of the row's labels.
    float width = 0.0f;
    float start_y = 0.0f;
    float end_y = 0.0f;
};

struct DividerRow {
    // Top of the divider stroke.
    float y = 0.0f;
};

using MenuRow = std::variant<OptionRow, DividerRow>;

struct MenuLayoutMetrics {
    float row_height = 0.0f;
    float outer_padding = 0.0f;
    float divider_width = 0.0f;
    float divider_padding = 0.0f;
};

// Assigns row offsets in order and returns the menu size; empty rows yield a
// zero size.
auto MeasureMenuRows(std::span<MenuRow> rows, MenuLayoutMetrics const& metrics) -> Size;

// Index of the first option row whose [start_y, end_y) contains `y`.
// Dividers are never hit.
[[nodiscard]] auto HitTestMenuRows(std::span<MenuRow const> rows, float y) -> std::optional<std::size_t>;

} // namespace WC::UI
