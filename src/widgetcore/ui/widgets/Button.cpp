#include <widgetcore/ui/widgets/Button.hpp>

#include <widgetcore/ui/ButtonStateMachine.hpp>
#include <widgetcore/ui/widgets/Label.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <variant>

namespace WC::UI::Widgets {

namespace Detail {

struct PushButtonState {
    PushButtonState(std::string text,
                    Point text_offset,
                    std::shared_ptr<ButtonStyle const> style_in,
                    std::shared_ptr<TextShaper const> shaper_in)
        : style(std::move(style_in))
        , shaper(std::move(shaper_in))
        , label(std::move(text), text_offset, ResolveLabelStyle(*style, ButtonState::Idle), *shaper) {}

    [[nodiscard]] auto label_style() const -> LabelStyle { return ResolveLabelStyle(*style, machine.state()); }

    ButtonStateMachine                 machine{};
    std::shared_ptr<ButtonStyle const> style;
    std::shared_ptr<TextShaper const>  shaper;
    Label                              label;
};

} // namespace Detail

namespace {

using State = SharedCell<Detail::PushButtonState>;

class ButtonElement final : public Element {
public:
    ButtonElement(std::shared_ptr<State> shared,
                  ButtonAction action,
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

        if (auto const* moved = std::get_if<PointerEvents::Moved>(&pointer->event)) {
            auto state = shared_->borrow_mut();
            if (state->machine.disabled()) {
                return EventCaptureStatus::NotCaptured;
            }
            cx.set_cursor_icon(CursorIcon::Pointer);
            if (moved->just_entered && tooltip_message_) {
                cx.start_hover_timeout();
            }
            if (state->machine.pointer_moved(*state->style).needs_repaint) {
                cx.request_repaint();
            }
            return EventCaptureStatus::Captured;
        }

        if (std::holds_alternative<PointerEvents::Left>(pointer->event)) {
            auto state = shared_->borrow_mut();
            auto const res = state->machine.pointer_left(*state->style);
            if (res.needs_repaint) {
                cx.request_repaint();
            }
            return res.state_changed ? EventCaptureStatus::Captured : EventCaptureStatus::NotCaptured;
        }

        if (auto const* pressed = std::get_if<PointerEvents::ButtonJustPressed>(&pointer->event)) {
            if (pressed->button != PointerButton::Primary) {
                return EventCaptureStatus::NotCaptured;
            }
            {
                auto state = shared_->borrow_mut();
                auto const res = state->machine.press(*state->style);
                if (!res.state_changed) {
                    return EventCaptureStatus::NotCaptured;
                }
                wc_log("Button: " + std::string(buttonStateToString(state->machine.state())), "Widget");
                if (res.needs_repaint) {
                    cx.request_repaint();
                }
            }
            if (action_) {
                if (auto sent = action_(); !sent) {
                    wc_log("Button: action delivery failed: " + describeError(sent.error()), "Widget", "Error");
                    return std::unexpected(sent.error());
                }
            }
            return EventCaptureStatus::Captured;
        }

        if (auto const* released = std::get_if<PointerEvents::ButtonJustReleased>(&pointer->event)) {
            if (released->button != PointerButton::Primary) {
                return EventCaptureStatus::NotCaptured;
            }
            auto state = shared_->borrow_mut();
            auto const inside = cx.is_point_within_visible_bounds(released->position);
            auto const res = state->machine.release(inside, *state->style);
            if (res.needs_repaint) {
                cx.request_repaint();
            }
            return res.state_changed ? EventCaptureStatus::Captured : EventCaptureStatus::NotCaptured;
        }

        if (std::holds_alternative<PointerEvents::HoverTimeout>(pointer->event) && tooltip_message_) {
            cx.show_tooltip(TooltipInfo{*tooltip_message_, cx.rect(), tooltip_align_});
        }
        return EventCaptureStatus::NotCaptured;
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
    std::shared_ptr<State>     shared_;
    ButtonAction               action_;
    std::optional<std::string> tooltip_message_;
    Align2                     tooltip_align_;
};

} // namespace

Button::Button(ElementHandle el, std::shared_ptr<SharedCell<Detail::PushButtonState>> shared)
    : el_(std::move(el)), shared_(std::move(shared)) {}

auto Button::Create(View& view, ButtonArgs args) -> Expected<Button> {
    if (!args.style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "button requires a style"});
    }
    auto shared = MakeSharedCell<Detail::PushButtonState>(std::move(args.text),
                                                          args.text_offset,
                                                          std::move(args.style),
                                                          view.shared_text_shaper());

    ElementBuilder builder{};
    builder.element = std::make_unique<ButtonElement>(shared,
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
    return Button{*el, std::move(shared)};
}

auto Button::desired_padded_size() const -> Size {
    auto state = shared_->borrow();
    return state->label.desired_padded_size(state->label_style());
}

auto Button::unclipped_text_size() const -> Size {
    return shared_->borrow()->label.unclipped_text_size();
}

auto Button::set_text(std::string_view text) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->label.set_text(text, *state->shaper);
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

auto Button::text() const -> std::string {
    return shared_->borrow()->label.text();
}

auto Button::set_style(std::shared_ptr<ButtonStyle const> style) -> Expected<void> {
    if (!style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "button requires a style"});
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

auto Button::style() const -> std::shared_ptr<ButtonStyle const> {
    return shared_->borrow()->style;
}

auto Button::set_disabled(bool disabled) -> void {
    bool changed = false;
    {
        auto state = shared_->borrow_mut();
        changed = state->machine.set_disabled(disabled, *state->style).state_changed;
    }
    if (changed) {
        el_.notify_custom_state_change();
    }
}

auto Button::disabled() const -> bool {
    return shared_->borrow()->machine.disabled();
}

} // namespace WC::UI::Widgets
