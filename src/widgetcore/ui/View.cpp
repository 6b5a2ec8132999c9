#include <widgetcore/ui/View.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace WC::UI {

auto ElementHandle::enqueue(Detail::Modification modification) const -> void {
    if (auto queue = queue_.lock()) {
        queue->pending.push_back(std::move(modification));
    }
}

auto ElementHandle::notify_custom_state_change() const -> void {
    enqueue(Detail::Modification{id_, Detail::Modification::Notify{}});
}

auto ElementHandle::set_pos(Point position) const -> void {
    enqueue(Detail::Modification{id_, Detail::Modification::SetPos{position}});
}

auto ElementHandle::set_rect(Rect rect) const -> void {
    enqueue(Detail::Modification{id_, Detail::Modification::SetRect{rect}});
}

auto ElementHandle::set_hidden(bool hidden) const -> void {
    enqueue(Detail::Modification{id_, Detail::Modification::SetHidden{hidden}});
}

View::View(Size window_size, std::shared_ptr<TextShaper const> shaper)
    : window_size_(window_size)
    , shaper_(shaper ? std::move(shaper) : std::make_shared<FixedAdvanceTextShaper>())
    , queue_(std::make_shared<Detail::ModificationQueue>()) {}

View::~View() = default;

auto View::add_element(ElementBuilder builder) -> Expected<ElementHandle> {
    if (!builder.element) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "element builder has no element"});
    }
    Entry entry{};
    entry.id = next_id_++;
    entry.flags = builder.element->flags();
    entry.element = std::move(builder.element);
    entry.rect = builder.bounding_rect;
    entry.z_index = builder.z_index;
    entry.hidden = builder.manually_hidden;
    entry.scissor_rect_id = builder.scissor_rect_id;

    auto const id = entry.id;
    entries_.push_back(std::move(entry));
    mark_dirty(id);
    wc_log("View: added element " + std::to_string(id), "View");
    return ElementHandle{id, queue_};
}

auto View::remove_element(ElementID id) -> bool {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](Entry const& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    if (focused_ == id) {
        focused_.reset();
        focused_listens_clicked_off_ = false;
    }
    if (hovered_ == id) {
        hovered_.reset();
    }
    if (pressed_ == id) {
        pressed_.reset();
    }
    if (hover_timeout_ == id) {
        hover_timeout_.reset();
    }
    std::erase(dirty_, id);
    return true;
}

auto View::find(ElementID id) -> Entry* {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](Entry const& e) { return e.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

auto View::find(ElementID id) const -> Entry const* {
    auto it = std::find_if(entries_.begin(), entries_.end(), [id](Entry const& e) { return e.id == id; });
    return it == entries_.end() ? nullptr : &*it;
}

auto View::bounds(ElementID id) const -> std::optional<Rect> {
    if (auto const* entry = find(id)) {
        return entry->rect;
    }
    return std::nullopt;
}

auto View::is_hidden(ElementID id) const -> bool {
    auto const* entry = find(id);
    return entry == nullptr || entry->hidden;
}

auto View::mark_dirty(ElementID id) -> void {
    if (std::find(dirty_.begin(), dirty_.end(), id) == dirty_.end()) {
        dirty_.push_back(id);
    }
}

auto View::take_repaint_requests() -> std::vector<ElementID> {
    return std::exchange(dirty_, {});
}

auto View::dispatch(ElementID id, ElementEvent const& event) -> Expected<EventCaptureStatus> {
    auto* entry = find(id);
    if (!entry) {
        return EventCaptureStatus::NotCaptured;
    }
    ElementContext cx{entry->rect, window_size_, focused_ == id, *shaper_};
    auto status = entry->element->on_event(event, cx);
    // Requests recorded before a failure still take effect.
    auto applied = apply_requests(id, cx.requests());
    if (!status) {
        wc_log("View: element " + std::to_string(id) + " failed: " + describeError(status.error()), "View", "Error");
        return std::unexpected(status.error());
    }
    if (!applied) {
        return std::unexpected(applied.error());
    }
    return *status;
}

auto View::apply_requests(ElementID id, ElementContext::Requests const& requests) -> Expected<void> {
    auto* entry = find(id);
    if (!entry) {
        return {};
    }
    if (requests.bounding_rect && *requests.bounding_rect != entry->rect) {
        entry->rect = *requests.bounding_rect;
        mark_dirty(id);
    }
    if (requests.repaint) {
        mark_dirty(id);
    }
    if (requests.cursor_icon) {
        cursor_icon_ = *requests.cursor_icon;
    }
    if (requests.tooltip) {
        tooltip_ = *requests.tooltip;
    }
    if (requests.hover_timeout) {
        hover_timeout_ = id;
    }
    if (requests.steal_focus && focused_ != id) {
        auto const previous = focused_;
        focused_ = id;
        focused_listens_clicked_off_ = false;
        if (previous) {
            if (auto lost = notify_focus_lost(*previous); !lost) {
                return lost;
            }
        }
    }
    if (requests.clicked_off && focused_ == id) {
        focused_listens_clicked_off_ = true;
    }
    if (requests.release_focus) {
        return release_focus_of(id);
    }
    return {};
}

auto View::release_focus_of(ElementID id) -> Expected<void> {
    if (focused_ != id) {
        return {};
    }
    focused_.reset();
    focused_listens_clicked_off_ = false;
    return notify_focus_lost(id);
}

auto View::notify_focus_lost(ElementID id) -> Expected<void> {
    auto const* entry = find(id);
    if (!entry || !has_flag(entry->flags, ElementFlags::ListensToFocusChange)) {
        return {};
    }
    auto status = dispatch(id, ElementEvents::ExclusiveFocus{false});
    if (!status) {
        return std::unexpected(status.error());
    }
    return {};
}

auto View::move_element(Entry& entry, Rect rect) -> Expected<void> {
    if (entry.rect == rect) {
        return {};
    }
    bool const moved = entry.rect.origin != rect.origin;
    entry.rect = rect;
    mark_dirty(entry.id);
    if (moved && has_flag(entry.flags, ElementFlags::ListensToPositionChange)) {
        auto status = dispatch(entry.id, ElementEvents::PositionChanged{});
        if (!status) {
            return std::unexpected(status.error());
        }
    }
    return {};
}

auto View::apply_modification(Detail::Modification const& modification) -> Expected<void> {
    auto* entry = find(modification.id);
    if (!entry) {
        return {};
    }
    if (auto const* set_rect = std::get_if<Detail::Modification::SetRect>(&modification.change)) {
        return move_element(*entry, set_rect->rect);
    }
    if (auto const* set_pos = std::get_if<Detail::Modification::SetPos>(&modification.change)) {
        return move_element(*entry, Rect{set_pos->position, entry->rect.size});
    }
    if (auto const* set_hidden = std::get_if<Detail::Modification::SetHidden>(&modification.change)) {
        if (entry->hidden == set_hidden->hidden) {
            return {};
        }
        entry->hidden = set_hidden->hidden;
        mark_dirty(entry->id);
        if (entry->hidden) {
            if (hovered_ == entry->id) {
                hovered_.reset();
            }
            if (pressed_ == entry->id) {
                pressed_.reset();
            }
            if (hover_timeout_ == entry->id) {
                hover_timeout_.reset();
            }
        }
    }
    return {};
}

auto View::process_updates() -> Expected<void> {
    // Handlers may notify again through handles; keep draining until quiet.
    while (!queue_->pending.empty()) {
        auto batch = std::move(queue_->pending);
        queue_->pending.clear();

        std::vector<ElementID> notified;
        for (auto const& modification : batch) {
            if (std::holds_alternative<Detail::Modification::Notify>(modification.change)) {
                if (std::find(notified.begin(), notified.end(), modification.id) == notified.end()) {
                    notified.push_back(modification.id);
                }
                continue;
            }
            if (auto applied = apply_modification(modification); !applied) {
                return applied;
            }
        }

        for (auto id : notified) {
            auto status = dispatch(id, ElementEvents::CustomStateChanged{});
            if (!status) {
                return std::unexpected(status.error());
            }
        }
    }
    return {};
}

auto View::pointer_candidates(Point p) const -> std::vector<ElementID> {
    std::vector<ElementID> out;
    bool focus_first = false;
    if (focused_) {
        auto const* entry = find(*focused_);
        if (entry && !entry->hidden
            && has_flag(entry->flags, ElementFlags::ListensToPointerOutsideBoundsWhenFocused)) {
            out.push_back(entry->id);
            focus_first = true;
        }
    }

    // Later insertion is on top among equal z-indices.
    std::vector<Entry const*> inside;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->hidden || !has_flag(it->flags, ElementFlags::ListensToPointerInsideBounds)) {
            continue;
        }
        if (focus_first && it->id == *focused_) {
            continue;
        }
        if (it->rect.contains(p)) {
            inside.push_back(&*it);
        }
    }
    std::stable_sort(inside.begin(), inside.end(), [](Entry const* a, Entry const* b) {
        return a->z_index > b->z_index;
    });
    for (auto const* entry : inside) {
        out.push_back(entry->id);
    }
    return out;
}

auto View::route_pointer(Point p, PointerEvent const& event) -> Expected<std::optional<ElementID>> {
    for (auto id : pointer_candidates(p)) {
        PointerEvent delivered = event;
        if (auto* moved = std::get_if<PointerEvents::Moved>(&delivered)) {
            moved->just_entered = hovered_ != id;
        }
        auto status = dispatch(id, ElementEvents::Pointer{delivered});
        if (!status) {
            return std::unexpected(status.error());
        }
        if (*status == EventCaptureStatus::Captured) {
            return std::optional<ElementID>{id};
        }
    }
    return std::optional<ElementID>{};
}

auto View::leave_hovered() -> Expected<void> {
    if (!hovered_) {
        return {};
    }
    auto const id = *hovered_;
    hovered_.reset();
    // A pending hover timeout for the element can no longer fire.
    if (hover_timeout_ == id) {
        hover_timeout_.reset();
    }
    tooltip_.reset();
    auto status = dispatch(id, ElementEvents::Pointer{PointerEvents::Left{}});
    if (!status) {
        return std::unexpected(status.error());
    }
    return {};
}

auto View::handle_pointer_event(PointerInput const& input) -> Expected<void> {
    auto const p = input.position;
    switch (input.kind) {
    case PointerInput::Kind::Moved: {
        last_pointer_ = p;
        cursor_icon_ = CursorIcon::Default;
        auto target = route_pointer(p, PointerEvents::Moved{p, false});
        if (!target) {
            return std::unexpected(target.error());
        }
        if (hovered_ && *target != hovered_) {
            if (auto left = leave_hovered(); !left) {
                return left;
            }
        }
        hovered_ = *target;
        return {};
    }
    case PointerInput::Kind::ButtonPressed: {
        last_pointer_ = p;
        tooltip_.reset();
        if (focused_ && focused_listens_clicked_off_) {
            auto const* entry = find(*focused_);
            if (entry && !entry->rect.contains(p)) {
                auto status = dispatch(*focused_, ElementEvents::ClickedOff{});
                if (!status) {
                    return std::unexpected(status.error());
                }
            }
        }
        auto target = route_pointer(p, PointerEvents::ButtonJustPressed{p, input.button});
        if (!target) {
            return std::unexpected(target.error());
        }
        pressed_ = *target;
        // A press without a preceding move still hovers its target, so a later
        // move away delivers Left.
        if (*target && hovered_ != *target) {
            if (auto left = leave_hovered(); !left) {
                return left;
            }
            hovered_ = *target;
        }
        return {};
    }
    case PointerInput::Kind::ButtonReleased: {
        last_pointer_ = p;
        PointerEvent const released = PointerEvents::ButtonJustReleased{p, input.button};
        // The element that captured the press gets the release, wherever it lands.
        if (pressed_ && find(*pressed_)) {
            auto const id = *pressed_;
            pressed_.reset();
            auto status = dispatch(id, ElementEvents::Pointer{released});
            if (!status) {
                return std::unexpected(status.error());
            }
            return {};
        }
        pressed_.reset();
        auto target = route_pointer(p, released);
        if (!target) {
            return std::unexpected(target.error());
        }
        return {};
    }
    case PointerInput::Kind::LeftWindow:
        last_pointer_.reset();
        return leave_hovered();
    }
    return {};
}

auto View::fire_hover_timeout() -> Expected<void> {
    if (!hover_timeout_) {
        return {};
    }
    auto const id = *hover_timeout_;
    hover_timeout_.reset();

    auto const* entry = find(id);
    if (!entry || entry->hidden || hovered_ != id || !last_pointer_ || !entry->rect.contains(*last_pointer_)) {
        return {};
    }
    auto status = dispatch(id, ElementEvents::Pointer{PointerEvents::HoverTimeout{}});
    if (!status) {
        return std::unexpected(status.error());
    }
    return {};
}

auto View::render() -> std::vector<RenderedElement> {
    std::vector<Entry*> visible;
    for (auto& entry : entries_) {
        if (entry.hidden || !has_flag(entry.flags, ElementFlags::Paints) || entry.rect.size.is_empty()) {
            continue;
        }
        visible.push_back(&entry);
    }
    std::stable_sort(visible.begin(), visible.end(), [](Entry const* a, Entry const* b) {
        return a->z_index < b->z_index;
    });

    std::vector<RenderedElement> out;
    out.reserve(visible.size());
    for (auto* entry : visible) {
        RenderedElement rendered{};
        rendered.id = entry->id;
        rendered.origin = entry->rect.origin;
        rendered.z_index = entry->z_index;
        rendered.scissor_rect_id = entry->scissor_rect_id;
        RenderContext cx{entry->rect.size, *shaper_};
        entry->element->render_primitives(cx, rendered.primitives);
        out.push_back(std::move(rendered));
    }
    return out;
}

} // namespace WC::UI
