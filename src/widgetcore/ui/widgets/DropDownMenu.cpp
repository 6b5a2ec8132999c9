#include <widgetcore/ui/widgets/DropDownMenu.hpp>

#include <widgetcore/ui/OverlayLayout.hpp>
#include <widgetcore/ui/widgets/Label.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <variant>

namespace WC::UI::Widgets {

namespace Detail {

struct DropDownMenuState {
    std::shared_ptr<DropDownMenuStyle const> style;
    std::optional<std::vector<MenuEntry>>    new_entries;
    bool                                     open_requested = false;
    bool                                     style_changed = false;
};

} // namespace Detail

namespace {

using State = SharedCell<Detail::DropDownMenuState>;

auto metrics_for(DropDownMenuStyle const& style) -> MenuLayoutMetrics {
    return MenuLayoutMetrics{TextRowHeight(style), style.outer_padding, style.divider_width, style.divider_padding};
}

class DropDownMenuElement final : public Element {
public:
    DropDownMenuElement(std::shared_ptr<State> shared,
                        WidgetAction<std::size_t> action,
                        std::vector<MenuEntry> entries,
                        DropDownMenuStyle const& style,
                        TextShaper const& shaper)
        : shared_(std::move(shared)), action_(std::move(action)) {
        build_rows(std::move(entries), style, shaper);
        measure(style);
    }

    auto flags() const -> ElementFlags override {
        return ElementFlags::Paints | ElementFlags::ListensToPointerInsideBounds | ElementFlags::ListensToFocusChange
               | ElementFlags::ListensToPointerOutsideBoundsWhenFocused | ElementFlags::ListensToPositionChange;
    }

    auto on_event(ElementEvent const& event, ElementContext& cx) -> Expected<EventCaptureStatus> override {
        if (std::holds_alternative<ElementEvents::CustomStateChanged>(event)) {
            drain(cx);
            return EventCaptureStatus::NotCaptured;
        }
        if (std::holds_alternative<ElementEvents::ClickedOff>(event)) {
            cx.release_focus();
            return EventCaptureStatus::NotCaptured;
        }
        if (auto const* focus = std::get_if<ElementEvents::ExclusiveFocus>(&event)) {
            if (!focus->gained) {
                active_ = false;
                hovered_.reset();
                cx.release_focus();
                collapse(cx);
            }
            return EventCaptureStatus::NotCaptured;
        }
        if (std::holds_alternative<ElementEvents::PositionChanged>(event)) {
            if (active_) {
                auto const layout = LayoutOverlay(cx.rect(), cx.window_size());
                if (layout.new_bounds) {
                    cx.set_bounding_rect(*layout.new_bounds);
                }
            }
            return EventCaptureStatus::NotCaptured;
        }

        auto const& pointer = std::get<ElementEvents::Pointer>(event).event;
        if (!active_) {
            return EventCaptureStatus::NotCaptured;
        }
        if (auto const* moved = std::get_if<PointerEvents::Moved>(&pointer)) {
            auto const hit = hit_test(cx.rect(), moved->position);
            if (hit != hovered_) {
                hovered_ = hit;
                cx.request_repaint();
            }
            if (hovered_) {
                cx.set_cursor_icon(CursorIcon::Pointer);
            }
            return EventCaptureStatus::Captured;
        }
        if (auto const* pressed = std::get_if<PointerEvents::ButtonJustPressed>(&pointer)) {
            if (pressed->button != PointerButton::Primary) {
                return EventCaptureStatus::Captured;
            }
            auto const hit = hit_test(cx.rect(), pressed->position);
            if (!hit) {
                return EventCaptureStatus::Captured;
            }
            auto const id = std::get<OptionRow>(rows_[*hit]).unique_id;
            cx.release_focus();
            cx.set_cursor_icon(CursorIcon::Default);
            if (action_) {
                if (auto sent = action_(id); !sent) {
                    wc_log("DropDownMenu: action delivery failed: " + describeError(sent.error()), "Widget", "Error");
                    return std::unexpected(sent.error());
                }
            }
            return EventCaptureStatus::Captured;
        }
        return EventCaptureStatus::Captured;
    }

    auto render_primitives(RenderContext const& cx, PrimitiveGroup& primitives) -> void override {
        auto state = shared_->borrow();
        auto const& style = *state->style;

        auto const idle = ResolveDualLabelStyle(style, false);
        auto const hover = ResolveDualLabelStyle(style, true);
        Size const label_size{size_.width - style.outer_padding * 2.0f, TextRowHeight(style)};

        std::vector<Scene::TextCommand>      texts;
        std::vector<Scene::SolidQuadCommand> dividers;
        texts.reserve(rows_.size() * 2);

        primitives.add(style.back_quad.create_primitive(Rect::from_size(cx.bounds_size)));

        for (std::size_t i = 0; i < rows_.size(); ++i) {
            if (auto const* option = std::get_if<OptionRow>(&rows_[i])) {
                bool const hovered = hovered_ == i;
                Rect const row{Point{style.outer_padding, option->start_y}, label_size};
                if (hovered) {
                    primitives.set_z_index(1);
                    primitives.add(style.text_bg_quad_hover.create_primitive(row));
                }
                auto p = labels_[i]->render_primitives(row, hovered ? hover : idle, cx.shaper);
                if (p.left_text) {
                    texts.push_back(std::move(*p.left_text));
                }
                if (p.right_text) {
                    texts.push_back(std::move(*p.right_text));
                }
            } else {
                auto const& divider = std::get<DividerRow>(rows_[i]);
                Rect const stroke{Point{style.outer_padding, divider.y}, Size{label_size.width, style.divider_width}};
                dividers.push_back(Scene::make_solid_quad(stroke, style.divider_color));
            }
        }

        primitives.set_z_index(2);
        primitives.add_text_batch(std::move(texts));
        primitives.add_solid_quad_batch(std::move(dividers));
    }

private:
    // Applies pending configuration: content, then style, then an open request.
    auto drain(ElementContext& cx) -> void {
        auto const& shaper = cx.text_shaper();
        bool measure_needed = false;
        bool show = false;
        std::shared_ptr<DropDownMenuStyle const> style;
        {
            auto state = shared_->borrow_mut();
            style = state->style;
            if (state->new_entries) {
                build_rows(std::move(*state->new_entries), *style, shaper);
                state->new_entries.reset();
                // The rebuilt rows already use the current style.
                state->style_changed = false;
                hovered_.reset();
                measure_needed = true;
            }
            if (state->style_changed) {
                state->style_changed = false;
                auto const dual = ResolveDualLabelStyle(*style, false);
                for (auto& label : labels_) {
                    if (label) {
                        label->set_style(dual, shaper);
                    }
                }
                measure_needed = true;
            }
            if (state->open_requested) {
                state->open_requested = false;
                if (!active_) {
                    active_ = true;
                    show = true;
                }
            }
        }

        if (measure_needed) {
            measure(*style);
            wc_log("DropDownMenu: measured " + std::to_string(rows_.size()) + " rows", "Widget");
            if (active_) {
                relayout(cx);
                cx.request_repaint();
            } else {
                collapse(cx);
            }
        } else if (show) {
            relayout(cx);
            cx.request_repaint();
        }

        if (show) {
            cx.steal_temporary_focus();
            cx.listen_to_pointer_clicked_off();
        }
    }

    auto build_rows(std::vector<MenuEntry> entries, DropDownMenuStyle const& style, TextShaper const& shaper) -> void {
        auto const dual = ResolveDualLabelStyle(style, false);
        rows_.clear();
        labels_.clear();
        rows_.reserve(entries.size());
        labels_.reserve(entries.size());
        for (auto& entry : entries) {
            if (auto* option = std::get_if<MenuEntries::Option>(&entry)) {
                rows_.push_back(OptionRow{option->unique_id});
                labels_.emplace_back(std::in_place,
                                     std::move(option->left_text),
                                     std::move(option->right_text),
                                     dual,
                                     shaper);
            } else {
                rows_.push_back(DividerRow{});
                labels_.emplace_back(std::nullopt);
            }
        }
    }

    auto measure(DropDownMenuStyle const& style) -> void {
        auto const dual = ResolveDualLabelStyle(style, false);
        for (std::size_t i = 0; i < rows_.size(); ++i) {
            if (auto* option = std::get_if<OptionRow>(&rows_[i])) {
                option->width = labels_[i]->desired_padded_size(dual).width;
            }
        }
        size_ = MeasureMenuRows(rows_, metrics_for(style));
    }

    auto relayout(ElementContext& cx) const -> void {
        Rect const desired{cx.rect().origin, size_};
        auto const layout = LayoutOverlay(desired, cx.window_size());
        cx.set_bounding_rect(layout.new_bounds.value_or(desired));
    }

    static auto collapse(ElementContext& cx) -> void {
        cx.set_bounding_rect(Rect{cx.rect().origin, Size{}});
    }

    auto hit_test(Rect const& bounds, Point position) const -> std::optional<std::size_t> {
        if (!bounds.contains(position)) {
            return std::nullopt;
        }
        return HitTestMenuRows(rows_, position.y - bounds.min_y());
    }

    std::shared_ptr<State>                shared_;
    WidgetAction<std::size_t>             action_;
    std::vector<MenuRow>                  rows_;
    std::vector<std::optional<DualLabel>> labels_;
    Size                                  size_{};
    bool                                  active_ = false;
    std::optional<std::size_t>            hovered_;
};

} // namespace

DropDownMenu::DropDownMenu(ElementHandle el, std::shared_ptr<SharedCell<Detail::DropDownMenuState>> shared)
    : el_(std::move(el)), shared_(std::move(shared)) {}

auto DropDownMenu::Create(View& view, DropDownMenuArgs args) -> Expected<DropDownMenu> {
    if (!args.style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "drop-down menu requires a style"});
    }
    auto shared = MakeSharedCell<Detail::DropDownMenuState>();
    shared->borrow_mut()->style = args.style;

    ElementBuilder builder{};
    builder.element = std::make_unique<DropDownMenuElement>(shared,
                                                            std::move(args.action),
                                                            std::move(args.entries),
                                                            *args.style,
                                                            view.text_shaper());
    builder.z_index = args.z_index;
    builder.bounding_rect = Rect{args.position, Size{}};
    builder.scissor_rect_id = args.scissor_rect_id;

    auto el = view.add_element(std::move(builder));
    if (!el) {
        return std::unexpected(el.error());
    }
    wc_log("DropDownMenu: created element " + std::to_string(el->id()), "Widget");
    return DropDownMenu{*el, std::move(shared)};
}

auto DropDownMenu::set_style(std::shared_ptr<DropDownMenuStyle const> style) -> Expected<void> {
    if (!style) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "drop-down menu requires a style"});
    }
    {
        auto state = shared_->borrow_mut();
        if (state->style == style) {
            return {};
        }
        state->style = std::move(style);
        state->style_changed = true;
    }
    el_.notify_custom_state_change();
    return {};
}

auto DropDownMenu::style() const -> std::shared_ptr<DropDownMenuStyle const> {
    return shared_->borrow()->style;
}

auto DropDownMenu::set_entries(std::vector<MenuEntry> entries) -> void {
    shared_->borrow_mut()->new_entries = std::move(entries);
    el_.notify_custom_state_change();
}

auto DropDownMenu::set_position(Point position) -> void {
    el_.set_pos(position);
}

auto DropDownMenu::open(std::optional<Point> position) -> void {
    if (position) {
        set_position(*position);
    }
    shared_->borrow_mut()->open_requested = true;
    el_.notify_custom_state_change();
}

} // namespace WC::UI::Widgets
