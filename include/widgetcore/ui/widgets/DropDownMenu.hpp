#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/ActionQueue.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/MenuLayout.hpp>
#include <widgetcore/ui/SharedCell.hpp>
#include <widgetcore/ui/StyleResolver.hpp>
#include <widgetcore/ui/View.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace WC::UI::Widgets {

namespace Detail {
struct DropDownMenuState;
}

struct DropDownMenuArgs {
    // Invoked with the unique id of the selected option.
    WidgetAction<std::size_t>                action;
    std::vector<MenuEntry>                   entries;
    std::shared_ptr<DropDownMenuStyle const> style;
    ZIndex                                   z_index = 0;
    Point                                    position{};
    ScissorRectID                            scissor_rect_id = kMainScissorRect;
};

// Handle to a drop-down menu overlay. The menu stays collapsed to a zero-size
// rect at its position until open() is called, and closes again on selection
// or when the user clicks outside of it.
class DropDownMenu {
public:
    static auto Create(View& view, DropDownMenuArgs args) -> Expected<DropDownMenu>;

    [[nodiscard]] auto element() const -> ElementHandle const& { return el_; }

    // Reference-identical styles are ignored.
    auto set_style(std::shared_ptr<DropDownMenuStyle const> style) -> Expected<void>;
    [[nodiscard]] auto style() const -> std::shared_ptr<DropDownMenuStyle const>;

    // Replaces any replacement not yet applied by the element.
    auto set_entries(std::vector<MenuEntry> entries) -> void;
    auto set_position(Point position) -> void;
    auto open(std::optional<Point> position = std::nullopt) -> void;

private:
    DropDownMenu(ElementHandle el, std::shared_ptr<SharedCell<Detail::DropDownMenuState>> shared);

    ElementHandle                                           el_;
    std::shared_ptr<SharedCell<Detail::DropDownMenuState>> shared_;
};

} // namespace WC::UI::Widgets
