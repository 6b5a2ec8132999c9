#include <widgetcore/ui/MenuLayout.hpp>

#include <algorithm>
#include <cmath>

namespace WC::UI {

auto MeasureMenuRows(std::span<MenuRow> rows, MenuLayoutMetrics const& metrics) -> Size {
    if (rows.empty()) {
        return Size{};
    }

    float max_width = 0.0f;
    float total_height = metrics.outer_padding;
    for (auto& row : rows) {
        if (auto* option = std::get_if<OptionRow>(&row)) {
            max_width = std::max(max_width, option->width);
            option->start_y = total_height;
            total_height += metrics.row_height;
            option->end_y = total_height;
        } else if (auto* divider = std::get_if<DividerRow>(&row)) {
            divider->y = total_height + metrics.divider_padding;
            total_height += metrics.divider_width + metrics.divider_padding * 2.0f;
        }
    }

    return Size{std::ceil(max_width) + metrics.outer_padding * 2.0f, total_height + metrics.outer_padding};
}

auto HitTestMenuRows(std::span<MenuRow const> rows, float y) -> std::optional<std::size_t> {
    for (std::size_t i = 0; i < rows.size(); ++i) {
        auto const* option = std::get_if<OptionRow>(&rows[i]);
        if (option && y >= option->start_y && y < option->end_y) {
            return i;
        }
    }
    return std::nullopt;
}

} // namespace WC::UI
