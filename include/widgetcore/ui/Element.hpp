#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/PrimitiveGroup.hpp>
#include <widgetcore/ui/TextShaper.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace WC::UI {

enum class ElementFlags : std::uint32_t {
    None                                   = 0,
    Paints                                 = 1u << 0,
    ListensToPointerInsideBounds           = 1u << 1,
    ListensToFocusChange                   = 1u << 2,
    ListensToPointerOutsideBoundsWhenFocused = 1u << 3,
    ListensToPositionChange                = 1u << 4,
};

[[nodiscard]] constexpr auto operator|(ElementFlags a, ElementFlags b) -> ElementFlags {
    return static_cast<ElementFlags>(static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b));
}

[[nodiscard]] constexpr auto has_flag(ElementFlags flags, ElementFlags flag) -> bool {
    return (static_cast<std::uint32_t>(flags) & static_cast<std::uint32_t>(flag)) != 0;
}

enum class PointerButton {
    Primary,
    Secondary,
    Middle,
};

namespace PointerEvents {
struct Moved {
    Point position{};
    bool  just_entered = false;
};
struct Left {};
struct ButtonJustPressed {
    Point         position{};
    PointerButton button = PointerButton::Primary;
};
struct ButtonJustReleased {
    Point         position{};
    PointerButton button = PointerButton::Primary;
};
struct HoverTimeout {};
} // namespace PointerEvents

using PointerEvent = std::variant<PointerEvents::Moved,
                                  PointerEvents::Left,
                                  PointerEvents::ButtonJustPressed,
                                  PointerEvents::ButtonJustReleased,
                                  PointerEvents::HoverTimeout>;

namespace ElementEvents {
// Out-of-band "configuration changed" notification raised through a handle.
struct CustomStateChanged {};
// A press landed outside the focused element that asked to be told.
struct ClickedOff {};
struct ExclusiveFocus {
    bool gained = false;
};
struct PositionChanged {};
struct Pointer {
    PointerEvent event;
};
} // namespace ElementEvents

using ElementEvent = std::variant<ElementEvents::CustomStateChanged,
                                  ElementEvents::ClickedOff,
                                  ElementEvents::ExclusiveFocus,
                                  ElementEvents::PositionChanged,
                                  ElementEvents::Pointer>;

enum class EventCaptureStatus {
    NotCaptured,
    Captured,
};

enum class CursorIcon {
    Default,
    Pointer,
};

struct TooltipInfo {
    std::string message;
    Rect        element_bounds{};
    Align2      align{};

    friend auto operator==(TooltipInfo const&, TooltipInfo const&) -> bool = default;
};

// Per-dispatch window into the view. An element records its requests here;
// the view applies them once the handler has returned.
class ElementContext {
public:
    struct Requests {
        std::optional<Rect>        bounding_rect;
        bool                       repaint = false;
        bool                       steal_focus = false;
        bool                       release_focus = false;
        bool                       clicked_off = false;
        bool                       hover_timeout = false;
        std::optional<TooltipInfo> tooltip;
        std::optional<CursorIcon>  cursor_icon;
    };

    ElementContext(Rect bounds, Size window_size, bool has_focus, TextShaper const& shaper)
        : bounds_(bounds), window_size_(window_size), has_focus_(has_focus), shaper_(&shaper) {}

    // Bounds as passed to this dispatch, updated by set_bounding_rect.
    [[nodiscard]] auto rect() const -> Rect { return bounds_; }
    [[nodiscard]] auto window_size() const -> Size { return window_size_; }
    [[nodiscard]] auto has_focus() const -> bool { return has_focus_; }
    [[nodiscard]] auto text_shaper() const -> TextShaper const& { return *shaper_; }

    [[nodiscard]] auto is_point_within_visible_bounds(Point p) const -> bool {
        return intersect(bounds_, Rect::from_size(window_size_)).contains(p);
    }

    auto set_bounding_rect(Rect rect) -> void {
        bounds_ = rect;
        requests_.bounding_rect = rect;
    }
    auto request_repaint() -> void { requests_.repaint = true; }
    auto steal_temporary_focus() -> void {
        requests_.steal_focus = true;
        requests_.release_focus = false;
    }
    auto release_focus() -> void {
        requests_.release_focus = true;
        requests_.steal_focus = false;
    }
    auto listen_to_pointer_clicked_off() -> void { requests_.clicked_off = true; }
    auto start_hover_timeout() -> void { requests_.hover_timeout = true; }
    auto show_tooltip(TooltipInfo info) -> void { requests_.tooltip = std::move(info); }
    auto set_cursor_icon(CursorIcon icon) -> void { requests_.cursor_icon = icon; }

    [[nodiscard]] auto requests() const -> Requests const& { return requests_; }

private:
    Rect              bounds_;
    Size              window_size_;
    bool              has_focus_;
    TextShaper const* shaper_;
    Requests          requests_{};
};

struct RenderContext {
    Size              bounds_size{};
    TextShaper const& shaper;
};

// View-tree-resident half of a widget. Receives events and emits primitives
// in element-local coordinates.
class Element {
public:
    virtual ~Element() = default;

    [[nodiscard]] virtual auto flags() const -> ElementFlags = 0;

    // An error means an action could not be delivered; the view surfaces it
    // to the caller of the dispatch.
    virtual auto on_event(ElementEvent const& event, ElementContext& cx) -> Expected<EventCaptureStatus> = 0;

    virtual auto render_primitives(RenderContext const& cx, PrimitiveGroup& primitives) -> void = 0;
};

struct ElementBuilder {
    std::unique_ptr<Element> element;
    ZIndex                   z_index = 0;
    Rect                     bounding_rect{};
    bool                     manually_hidden = false;
    ScissorRectID            scissor_rect_id = kMainScissorRect;
};

} // namespace WC::UI
