#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/ActionQueue.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/SharedCell.hpp>
#include <widgetcore/ui/StyleResolver.hpp>
#include <widgetcore/ui/View.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace WC::UI::Widgets {

namespace Detail {
struct PushButtonState;
}

using ButtonAction = std::function<Expected<void>()>;

struct ButtonArgs {
    // Invoked once per primary press.
    ButtonAction                       action;
    std::optional<std::string>         tooltip_message;
    Align2                             tooltip_align = Align2::TopCenter();
    std::string                        text;
    Point                              text_offset{};
    std::shared_ptr<ButtonStyle const> style;
    ZIndex                             z_index = 0;
    Rect                               bounding_rect{};
    bool                               manually_hidden = false;
    ScissorRectID                      scissor_rect_id = kMainScissorRect;
};

class Button {
public:
    static auto Create(View& view, ButtonArgs args) -> Expected<Button>;

    [[nodiscard]] auto element() const -> ElementHandle const& { return el_; }

    [[nodiscard]] auto desired_padded_size() const -> Size;
    [[nodiscard]] auto unclipped_text_size() const -> Size;

    auto set_text(std::string_view text) -> void;
    [[nodiscard]] auto text() const -> std::string;

    auto set_style(std::shared_ptr<ButtonStyle const> style) -> Expected<void>;
    [[nodiscard]] auto style() const -> std::shared_ptr<ButtonStyle const>;

    auto set_disabled(bool disabled) -> void;
    [[nodiscard]] auto disabled() const -> bool;

private:
    Button(ElementHandle el, std::shared_ptr<SharedCell<Detail::PushButtonState>> shared);

    ElementHandle                                     el_;
    std::shared_ptr<SharedCell<Detail::PushButtonState>> shared_;
};

} // namespace WC::UI::Widgets
