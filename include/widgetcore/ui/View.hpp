#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/Element.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/PrimitiveGroup.hpp>
#include <widgetcore/ui/TextShaper.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace WC::UI {

using ElementID = std::uint64_t;

namespace Detail {

struct Modification {
    struct Notify {};
    struct SetRect {
        Rect rect;
    };
    struct SetPos {
        Point position;
    };
    struct SetHidden {
        bool hidden = false;
    };

    ElementID                                        id = 0;
    std::variant<Notify, SetRect, SetPos, SetHidden> change;
};

struct ModificationQueue {
    std::vector<Modification> pending;
};

} // namespace Detail

// Cheap, copyable reference to an element owned by a View. Every call only
// enqueues a modification; the view applies it in process_updates(). Calls
// made after the view is destroyed are ignored.
class ElementHandle {
public:
    ElementHandle() = default;

    [[nodiscard]] auto id() const -> ElementID { return id_; }
    [[nodiscard]] auto valid() const -> bool { return !queue_.expired(); }

    auto notify_custom_state_change() const -> void;
    auto set_pos(Point position) const -> void;
    auto set_rect(Rect rect) const -> void;
    auto set_hidden(bool hidden) const -> void;

private:
    friend class View;
    ElementHandle(ElementID id, std::weak_ptr<Detail::ModificationQueue> queue)
        : id_(id), queue_(std::move(queue)) {}

    auto enqueue(Detail::Modification modification) const -> void;

    ElementID                                 id_ = 0;
    std::weak_ptr<Detail::ModificationQueue> queue_;
};

// Raw pointer input as delivered by the window's event pump.
struct PointerInput {
    enum class Kind {
        Moved,
        ButtonPressed,
        ButtonReleased,
        LeftWindow,
    };

    Kind          kind = Kind::Moved;
    Point         position{};
    PointerButton button = PointerButton::Primary;

    static auto moved(Point p) -> PointerInput { return {Kind::Moved, p, PointerButton::Primary}; }
    static auto pressed(Point p, PointerButton b = PointerButton::Primary) -> PointerInput {
        return {Kind::ButtonPressed, p, b};
    }
    static auto released(Point p, PointerButton b = PointerButton::Primary) -> PointerInput {
        return {Kind::ButtonReleased, p, b};
    }
    static auto left_window() -> PointerInput { return {Kind::LeftWindow, Point{}, PointerButton::Primary}; }
};

struct RenderedElement {
    ElementID      id = 0;
    Point          origin{};
    ZIndex         z_index = 0;
    ScissorRectID  scissor_rect_id = kMainScissorRect;
    PrimitiveGroup primitives;
};

// In-process view tree: owns elements, routes pointer and focus events to
// them, applies handle modifications and collects render output.
class View {
public:
    explicit View(Size window_size, std::shared_ptr<TextShaper const> shaper = nullptr);
    ~View();

    View(View const&) = delete;
    View& operator=(View const&) = delete;

    auto add_element(ElementBuilder builder) -> Expected<ElementHandle>;
    auto remove_element(ElementID id) -> bool;

    // Applies queued handle modifications in order, then delivers
    // CustomStateChanged once per notified element.
    auto process_updates() -> Expected<void>;
    auto handle_pointer_event(PointerInput const& input) -> Expected<void>;
    // Driven by the external timer service.
    auto fire_hover_timeout() -> Expected<void>;

    auto set_window_size(Size size) -> void { window_size_ = size; }
    [[nodiscard]] auto window_size() const -> Size { return window_size_; }
    [[nodiscard]] auto text_shaper() const -> TextShaper const& { return *shaper_; }
    [[nodiscard]] auto shared_text_shaper() const -> std::shared_ptr<TextShaper const> { return shaper_; }

    [[nodiscard]] auto element_count() const -> std::size_t { return entries_.size(); }
    [[nodiscard]] auto bounds(ElementID id) const -> std::optional<Rect>;
    [[nodiscard]] auto is_hidden(ElementID id) const -> bool;
    [[nodiscard]] auto focused() const -> std::optional<ElementID> { return focused_; }
    [[nodiscard]] auto hovered() const -> std::optional<ElementID> { return hovered_; }
    [[nodiscard]] auto has_pending_updates() const -> bool { return !queue_->pending.empty(); }
    [[nodiscard]] auto has_pending_hover_timeout() const -> bool { return hover_timeout_.has_value(); }
    [[nodiscard]] auto tooltip() const -> std::optional<TooltipInfo> const& { return tooltip_; }
    auto hide_tooltip() -> void { tooltip_.reset(); }
    [[nodiscard]] auto cursor_icon() const -> CursorIcon { return cursor_icon_; }

    [[nodiscard]] auto take_repaint_requests() -> std::vector<ElementID>;

    // Visible painting elements in ascending z-index, then insertion order.
    [[nodiscard]] auto render() -> std::vector<RenderedElement>;

private:
    struct Entry {
        ElementID                id = 0;
        std::unique_ptr<Element> element;
        ElementFlags             flags = ElementFlags::None;
        Rect                     rect{};
        ZIndex                   z_index = 0;
        bool                     hidden = false;
        ScissorRectID            scissor_rect_id = kMainScissorRect;
    };

    auto find(ElementID id) -> Entry*;
    auto find(ElementID id) const -> Entry const*;

    auto dispatch(ElementID id, ElementEvent const& event) -> Expected<EventCaptureStatus>;
    auto apply_requests(ElementID id, ElementContext::Requests const& requests) -> Expected<void>;
    auto apply_modification(Detail::Modification const& modification) -> Expected<void>;
    auto move_element(Entry& entry, Rect rect) -> Expected<void>;
    auto release_focus_of(ElementID id) -> Expected<void>;
    auto notify_focus_lost(ElementID id) -> Expected<void>;

    // Elements that may receive a pointer event at `p`, in delivery order.
    auto pointer_candidates(Point p) const -> std::vector<ElementID>;
    auto route_pointer(Point p, PointerEvent const& event) -> Expected<std::optional<ElementID>>;
    auto leave_hovered() -> Expected<void>;
    auto mark_dirty(ElementID id) -> void;

    Size                                       window_size_;
    std::shared_ptr<TextShaper const>          shaper_;
    std::shared_ptr<Detail::ModificationQueue> queue_;
    std::vector<Entry>                         entries_;
    ElementID                                  next_id_ = 1;

    std::optional<ElementID>   focused_;
    bool                       focused_listens_clicked_off_ = false;
    std::optional<ElementID>   hovered_;
    std::optional<ElementID>   pressed_;
    std::optional<ElementID>   hover_timeout_;
    std::optional<Point>       last_pointer_;
    std::optional<TooltipInfo> tooltip_;
    CursorIcon                 cursor_icon_ = CursorIcon::Default;
    std::vector<ElementID>     dirty_;
};

} // namespace WC::UI
