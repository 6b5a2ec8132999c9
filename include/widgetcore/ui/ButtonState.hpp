#pragma once

#include <string_view>

namespace WC::UI {

enum class ButtonState {
    Idle,
    Hovered,
    Down,
    Disabled,
};

struct StateChangeResult {
    bool state_changed = false;
    bool needs_repaint = false;

    [[nodiscard]] auto merged(StateChangeResult other) const -> StateChangeResult {
        return StateChangeResult{state_changed || other.state_changed,
                                 needs_repaint || other.needs_repaint};
    }

    friend auto operator==(StateChangeResult const&, StateChangeResult const&) -> bool = default;
};

[[nodiscard]] inline auto buttonStateToString(ButtonState state) -> std::string_view {
    switch (state) {
    case ButtonState::Idle:
        return "idle";
    case ButtonState::Hovered:
        return "hovered";
    case ButtonState::Down:
        return "down";
    case ButtonState::Disabled:
        return "disabled";
    }
    return "idle";
}

} // namespace WC::UI
