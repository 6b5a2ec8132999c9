#pragma once

#include <widgetcore/ui/ButtonState.hpp>
#include <widgetcore/ui/StyleResolver.hpp>

namespace WC::UI {

namespace Detail {

[[nodiscard]] inline auto part_for(ButtonStyle const& style, ButtonState state, bool) -> ButtonStylePart const& {
    return ResolvePart(style, state);
}

[[nodiscard]] inline auto part_for(ToggleButtonStyle const& style, ButtonState state, bool toggled)
    -> ButtonStylePart const& {
    return ResolvePart(style, state, toggled);
}

} // namespace Detail

// Visual interaction state of a button-class control plus the orthogonal
// toggled flag. Every transition reports whether the resolved style part
// changed, which is the only case that needs a repaint.
class ButtonStateMachine {
public:
    explicit ButtonStateMachine(bool toggled = false)
        : toggled_(toggled) {}

    [[nodiscard]] auto state() const -> ButtonState { return state_; }
    [[nodiscard]] auto toggled() const -> bool { return toggled_; }
    [[nodiscard]] auto disabled() const -> bool { return state_ == ButtonState::Disabled; }

    template <typename Style>
    auto set_state(ButtonState next, Style const& style) -> StateChangeResult {
        if (state_ == next) {
            return {};
        }
        auto const& before = Detail::part_for(style, state_, toggled_);
        auto const& after = Detail::part_for(style, next, toggled_);
        bool const needs_repaint = !(before == after);
        state_ = next;
        return StateChangeResult{true, needs_repaint};
    }

    template <typename Style>
    auto set_toggled(bool toggled, Style const& style) -> StateChangeResult {
        if (toggled_ == toggled) {
            return {};
        }
        auto const& before = Detail::part_for(style, state_, toggled_);
        auto const& after = Detail::part_for(style, state_, toggled);
        bool const needs_repaint = !(before == after);
        toggled_ = toggled;
        return StateChangeResult{true, needs_repaint};
    }

    template <typename Style>
    auto pointer_moved(Style const& style) -> StateChangeResult {
        if (state_ != ButtonState::Idle) {
            return {};
        }
        return set_state(ButtonState::Hovered, style);
    }

    template <typename Style>
    auto pointer_left(Style const& style) -> StateChangeResult {
        if (state_ != ButtonState::Hovered && state_ != ButtonState::Down) {
            return {};
        }
        return set_state(ButtonState::Idle, style);
    }

    template <typename Style>
    auto press(Style const& style) -> StateChangeResult {
        if (state_ != ButtonState::Idle && state_ != ButtonState::Hovered) {
            return {};
        }
        return set_state(ButtonState::Down, style);
    }

    // Press edge of a toggle control: enters Down and flips the toggled flag
    // in the same step.
    template <typename Style>
    auto press_toggle(Style const& style) -> StateChangeResult {
        if (state_ != ButtonState::Idle && state_ != ButtonState::Hovered) {
            return {};
        }
        auto const pressed = set_state(ButtonState::Down, style);
        return pressed.merged(set_toggled(!toggled_, style));
    }

    template <typename Style>
    auto release(bool inside_bounds, Style const& style) -> StateChangeResult {
        if (state_ != ButtonState::Down && state_ != ButtonState::Hovered) {
            return {};
        }
        return set_state(inside_bounds ? ButtonState::Hovered : ButtonState::Idle, style);
    }

    template <typename Style>
    auto set_disabled(bool disabled, Style const& style) -> StateChangeResult {
        if (disabled && state_ != ButtonState::Disabled) {
            return set_state(ButtonState::Disabled, style);
        }
        if (!disabled && state_ == ButtonState::Disabled) {
            return set_state(ButtonState::Idle, style);
        }
        return {};
    }

private:
    ButtonState state_ = ButtonState::Idle;
    bool toggled_ = false;
};

} // namespace WC::UI
