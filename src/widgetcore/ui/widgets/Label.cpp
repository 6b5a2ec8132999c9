#include <widgetcore/ui/widgets/Label.hpp>

#include <algorithm>
#include <utility>

namespace WC::UI::Widgets {

namespace {

auto align_start(Align align, float box_start, float box_extent, float content_extent) -> float {
    switch (align) {
    case Align::Start:
        return box_start;
    case Align::Center:
        return box_start + (box_extent - content_extent) * 0.5f;
    case Align::End:
        return box_start + box_extent - content_extent;
    }
    return box_start;
}

struct TextPlacement {
    Align horizontal = Align::Start;
    Align vertical = Align::Center;
    Point offset{};
    Size  min_clipped_size{};
};

auto place_text(std::string_view text,
                TextProperties const& properties,
                Color const& color,
                Size text_size,
                Rect const& box,
                TextPlacement const& placement,
                TextShaper const& shaper) -> std::optional<Scene::TextCommand> {
    if (text.empty()) {
        return std::nullopt;
    }
    if (box.width() < placement.min_clipped_size.width || box.height() < placement.min_clipped_size.height) {
        return std::nullopt;
    }
    Point const origin{
        align_start(placement.horizontal, box.min_x(), box.width(), text_size.width) + placement.offset.x,
        align_start(placement.vertical, box.min_y(), box.height(), text_size.height) + placement.offset.y,
    };
    return shaper.shape(text, properties, color, origin, box);
}

} // namespace

auto PaddedRect(Rect const& bounds, Padding const& padding) -> Rect {
    return Rect{Point{bounds.min_x() + padding.left, bounds.min_y() + padding.top},
                Size{std::max(0.0f, bounds.width() - padding.left - padding.right),
                     std::max(0.0f, bounds.height() - padding.top - padding.bottom)}};
}

Label::Label(std::string text, Point text_offset, LabelStyle const& style, TextShaper const& shaper)
    : text_(std::move(text)), text_offset_(text_offset), properties_(style.properties) {
    remeasure(shaper);
}

auto Label::remeasure(TextShaper const& shaper) -> void {
    unclipped_size_ = shaper.measure(text_, properties_);
}

auto Label::set_text(std::string_view text, TextShaper const& shaper) -> bool {
    if (text_ == text) {
        return false;
    }
    text_ = std::string{text};
    remeasure(shaper);
    return true;
}

auto Label::set_style(LabelStyle const& style, TextShaper const& shaper) -> void {
    if (properties_ == style.properties) {
        return;
    }
    properties_ = style.properties;
    remeasure(shaper);
}

auto Label::set_text_offset(Point offset) -> bool {
    if (text_offset_ == offset) {
        return false;
    }
    text_offset_ = offset;
    return true;
}

auto Label::desired_padded_size(LabelStyle const& style) const -> Size {
    return Size{unclipped_size_.width + style.padding.left + style.padding.right,
                unclipped_size_.height + style.padding.top + style.padding.bottom};
}

auto Label::render_primitives(Rect const& bounds, LabelStyle const& style, TextShaper const& shaper) const
    -> LabelPrimitives {
    LabelPrimitives out{};
    if (!style.back_quad.is_transparent()) {
        out.bg_quad = style.back_quad.create_primitive(bounds);
    }
    TextPlacement const placement{style.properties.align, style.vertical_align, text_offset_, style.min_clipped_size};
    out.text = place_text(text_,
                          style.properties,
                          style.font_color,
                          unclipped_size_,
                          PaddedRect(bounds, style.padding),
                          placement,
                          shaper);
    return out;
}

DualLabel::DualLabel(std::string left_text,
                     std::string right_text,
                     DualLabelStyle const& style,
                     TextShaper const& shaper)
    : left_text_(std::move(left_text))
    , right_text_(std::move(right_text))
    , left_properties_(style.left_properties)
    , right_properties_(style.right_properties) {
    left_size_ = shaper.measure(left_text_, left_properties_);
    right_size_ = shaper.measure(right_text_, right_properties_);
}

auto DualLabel::set_style(DualLabelStyle const& style, TextShaper const& shaper) -> void {
    if (left_properties_ != style.left_properties) {
        left_properties_ = style.left_properties;
        left_size_ = shaper.measure(left_text_, left_properties_);
    }
    if (right_properties_ != style.right_properties) {
        right_properties_ = style.right_properties;
        right_size_ = shaper.measure(right_text_, right_properties_);
    }
}

auto DualLabel::desired_padded_size(DualLabelStyle const& style) const -> Size {
    float const left_width = left_size_.width + style.left_padding.left + style.left_padding.right;
    float const right_width = right_text_.empty()
                                  ? 0.0f
                                  : right_size_.width + style.right_padding.left + style.right_padding.right;
    float const left_height = left_size_.height + style.left_padding.top + style.left_padding.bottom;
    float const right_height = right_size_.height + style.right_padding.top + style.right_padding.bottom;
    return Size{left_width + right_width, std::max(left_height, right_height)};
}

auto DualLabel::render_primitives(Rect const& bounds, DualLabelStyle const& style, TextShaper const& shaper) const
    -> DualLabelPrimitives {
    DualLabelPrimitives out{};
    out.left_text = place_text(left_text_,
                               style.left_properties,
                               style.left_font_color,
                               left_size_,
                               PaddedRect(bounds, style.left_padding),
                               TextPlacement{Align::Start, style.vertical_align, Point{}, style.min_clipped_size},
                               shaper);
    out.right_text = place_text(right_text_,
                                style.right_properties,
                                style.right_font_color,
                                right_size_,
                                PaddedRect(bounds, style.right_padding),
                                TextPlacement{Align::End, style.vertical_align, Point{}, style.min_clipped_size},
                                shaper);
    return out;
}

} // namespace WC::UI::Widgets
