#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/ActionQueue.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/SharedCell.hpp>
#include <widgetcore/ui/StyleResolver.hpp>
#include <widgetcore/ui/View.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace WC::UI::Widgets {

namespace Detail {
struct ToggleButtonState;
}

struct ToggleButtonArgs {
    // Invoked with the new toggled value on every primary press.
    WidgetAction<bool>                       action;
    std::optional<std::string>               tooltip_message;
    Align2                                   tooltip_align = Align2::TopCenter();
    bool                                     toggled = false;
    std::string                              text;
    Point                                    text_offset{};
    std::shared_ptr<ToggleButtonStyle const> style;
    ZIndex                                   z_index = 0;
    Rect                                     bounding_rect{};
    bool                                     manually_hidden = false;
    ScissorRectID                            scissor_rect_id = kMainScissorRect;
};

// Handle to a toggle button element living in a View.
class ToggleButton {
public:
    static auto Create(View& view, ToggleButtonArgs args) -> Expected<ToggleButton>;

    [[nodiscard]] auto element() const -> ElementHandle const& { return el_; }

    // Size of the padded background if it covered the whole unclipped text.
    [[nodiscard]] auto desired_padded_size() const -> Size;
    [[nodiscard]] auto unclipped_text_size() const -> Size;

    auto set_text(std::string_view text) -> void;
    [[nodiscard]] auto text() const -> std::string;

    auto set_style(std::shared_ptr<ToggleButtonStyle const> style) -> Expected<void>;
    [[nodiscard]] auto style() const -> std::shared_ptr<ToggleButtonStyle const>;

    auto set_toggled(bool toggled) -> void;
    [[nodiscard]] auto toggled() const -> bool;

    auto set_disabled(bool disabled) -> void;
    [[nodiscard]] auto disabled() const -> bool;

    // Moves the text only; the background quad stays put.
    auto set_text_offset(Point offset) -> void;

private:
    ToggleButton(ElementHandle el, std::shared_ptr<SharedCell<Detail::ToggleButtonState>> shared);

    ElementHandle                                           el_;
    std::shared_ptr<SharedCell<Detail::ToggleButtonState>> shared_;
};

} // namespace WC::UI::Widgets
