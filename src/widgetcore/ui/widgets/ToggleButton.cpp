#include <widgetcore/ui/widgets/ToggleButton.hpp>

#include <widgetcore/ui/ButtonStateMachine.hpp>
#include <widgetcore/ui/widgets/Label.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <variant>

namespace WC::UI::Widgets {

namespace Detail {

struct ToggleButtonState {
    ToggleButtonState(std::string text,
                      Point text_offset,
                      bool toggled,
                      std::shared_ptr<ToggleButtonStyle const> style_in,
                      std::shared_ptr<TextShaper const> shaper_in)
        : machine(toggled)
        , style(std::move(style_in))
        , shaper(std::move(shaper_in))
        , label(std::move(text), text_offset, ResolveLabelStyle(*style, ButtonState::Idle, toggled), *shaper) {}

    [[nodiscard]] auto label_style() const -> LabelStyle {
        return ResolveLabelStyle(*style, machine.state(), machine.toggled());
    }

    ButtonStateMachine                       machine;
    std::shared_ptr<ToggleButtonStyle const> style;
    std::shared_ptr<TextShaper const>        shaper;
    Label                                    label;
};

} // namespace Detail

namespace {

using State = SharedCell<Detail::ToggleButtonState>;

class ToggleButtonElement final : public Element {
public:
    ToggleButtonElement(std::shared_ptr<State> shared,
                        WidgetAction<bool> action,
                        std::optional<std::string> tooltip_message,
                        Align2 tooltip_align)
        : shared_(std::move(shared))
        , action_(std::move(action))
        , tooltip_message_(std::move(tooltip_message))
        , tooltip_align_(tooltip_align) {}

    auto flags() const -> ElementFlags override {
        return ElementFlags::Paints | ElementFlags::ListensToPointerInsideBounds;
    }

    auto on_event(ElementEvent const& event, ElementContext& cx) -> Expected<EventCaptureStatus> override {
        if (std::holds_alternative<ElementEvents::CustomStateChanged>(event)) {
            cx.request_repaint();
            return EventCaptureStatus::NotCaptured;
        }
        auto const* pointer = std::get_if<ElementEvents::Pointer>(&event);
        if (!pointer) {
            return EventCaptureStatus::NotCaptured;
        }
        return std::visit([&](auto const& e) { return this->on_pointer(e, cx); }, pointer->event);
    }

    auto render_primitives(RenderContext const& cx, PrimitiveGroup& primitives) -> void override {
        auto state = shared_->borrow();
        auto const label = state->label.render_primitives(Rect::from_size(cx.bounds_size), state->label_style(), cx.shaper);
        if (label.bg_quad) {
            primitives.add(*label.bg_quad);
        }
        if (label.text) {
            primitives.set_z_index(1);
            primitives.add_text(*label.text);
        }
    }

private:
    auto on_pointer(PointerEvents::Moved const& moved, ElementContext& cx) -> Expected<EventCaptureStatus> {
        auto state = shared_->borrow_mut();
        if (state->machine.disabled()) {
            return EventCaptureStatus::NotCaptured;
        }
        cx.set_cursor_icon(CursorIcon::Pointer);
        if (moved.just_entered && tooltip_message_) {
            cx.start_hover_timeout();
        }
        if (state->machine.pointer_moved(*state->style).needs_repaint) {
            cx.request_repaint();
        }
        return EventCaptureStatus::Captured;
    }

    auto on_pointer(PointerEvents::Left const&, ElementContext& cx) -> Expected<EventCaptureStatus> {
        auto state = shared_->borrow_mut();
        auto const res = state->machine.pointer_left(*state->style);
        if (!res.state_changed) {
            return EventCaptureStatus::NotCaptured;
        }
        if (res.needs_repaint) {
            cx.request_repaint();
        }
        return EventCaptureStatus::Captured;
    }

    auto on_pointer(PointerEvents::ButtonJustPressed const& pressed, ElementContext& cx)
        -> Expected<EventCaptureStatus> {
        if (pressed.button != PointerButton::Primary) {
            return EventCaptureStatus::NotCaptured;
        }
        bool toggled = false;
        {
            auto state = shared_->borrow_mut();
            auto const res = state->machine.press_toggle(*state->style);
            if (!res.state_changed) {
                return EventCaptureStatus::NotCaptured;
            }
            if (res.needs_repaint) {
                cx.request_repaint();
            }
            toggled = state->machine.toggled();
            wc_log("ToggleButton: " + std::string(buttonStateToString(state->machine.state()))
                       + (toggled ? ", on" : ", off"),
                   "Widget");
        }
        // The cell is released before the action runs so the callback may use the handle.
        if (action_) {
            if (auto sent = action_(toggled); !sent) {
                wc_log("ToggleButton: action delivery failed: " + describeError(sent.error()), "Widget", "Error");
                return std::unexpected(sent.error());
            }
        }
        return EventCaptureStatus::Captured;
    }

    auto on_pointer(PointerEvents::ButtonJustReleased const& released, ElementContext& cx)
        -> Expected<EventCaptureStatus> {
        if (released.button != PointerButton::Primary) {
            return EventCaptureStatus::NotCaptured;
        }
        auto state = shared_->borrow_mut();
        auto const res = state->machine.release(cx.is_point_within_visible_bounds(released.position), *state->style);
        if (!res.state_changed) {
            return EventCaptureStatus::NotCaptured;
        }
        if (res.needs_repaint) {
            cx.request_repaint();
        }
        return EventCaptureStatus::Captured;
    }

    auto on_pointer(PointerEvents::HoverTimeout const&, ElementContext& cx) -> Expected<EventCaptureStatus> {
        if (tooltip_message_) {
            cx.show_tooltip(TooltipInfo{*tooltip_message_, cx.rect(), tooltip_align_});
        }
        return EventCaptureStatus::NotCaptured;
    }

    std::shared_ptr<State>     shared_;
    WidgetAction<bool>         action_;
    std::optional<std::string> tooltip_message_;
    Align2                     tooltip_align_;
};

} // namespace

ToggleButton::ToggleButton(ElementHandle el, std::shared_ptr<SharedCell<Detail::ToggleButtonState>> shared)
    : el_(std::move(el)), shared_(std::move(shared)) {}

auto ToggleButton::Create(View& view, ToggleButtonArgs args) -> Expected<ToggleButton> {
    if (!args.style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "toggle button requires a style"});
    }
    auto shared = MakeSharedCell<Detail::ToggleButtonState>(std::move(args.text),
                                                            args.text_offset,
                                                            args.toggled,
                                                            std::move(args.style),
                                                            view.shared_text_shaper());

    ElementBuilder builder{};
    builder.element = std::make_unique<ToggleButtonElement>(shared,
                                                            std::move(args.action),
                                                            std::move(args.tooltip_message),
                                                            args.tooltip_align);
    builder.z_index = args.z_index;
    builder.bounding_rect = args.bounding_rect;
    builder.manually_hidden = args.manually_hidden;
    builder.scissor_rect_id = args.scissor_rect_id;

    auto el = view.add_element(std::move(builder));
    if (!el) {
        return std::unexpected(el.error());
    }
    wc_log("ToggleButton: created element " + std::to_string(el->id()), "Widget");
    return ToggleButton{*el, std::move(shared)};
}

auto ToggleButton::desired_padded_size() const -> Size {
    auto state = shared_->borrow();
    return state->label.desired_padded_size(state->label_style());
}

auto ToggleButton::unclipped_text_size() const -> Size {
    return shared_->borrow()->label.unclipped_text_size();
}

auto ToggleButton::set_text(std::string_view text) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->label.set_text(text, *state->shaper);
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

auto ToggleButton::text() const -> std::string {
    return shared_->borrow()->label.text();
}

auto ToggleButton::set_style(std::shared_ptr<ToggleButtonStyle const> style) -> Expected<void> {
    if (!style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "toggle button requires a style"});
    }
    {
        auto state = shared_->borrow_mut();
        if (state->style == style) {
            return {};
        }
        state->style = std::move(style);
        state->label.set_style(state->label_style(), *state->shaper);
    }
    el_.notify_custom_state_change();
    return {};
}

auto ToggleButton::style() const -> std::shared_ptr<ToggleButtonStyle const> {
    return shared_->borrow()->style;
}

auto ToggleButton::set_toggled(bool toggled) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->machine.set_toggled(toggled, *state->style).state_changed;
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

auto ToggleButton::toggled() const -> bool {
    return shared_->borrow()->machine.toggled();
}

auto ToggleButton::set_disabled(bool disabled) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->machine.set_disabled(disabled, *state->style).state_changed;
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

auto ToggleButton::disabled() const -> bool {
    return shared_->borrow()->machine.disabled();
}

auto ToggleButton::set_text_offset(Point offset) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->label.set_text_offset(offset);
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

} // namespace WC::UI::Widgets
