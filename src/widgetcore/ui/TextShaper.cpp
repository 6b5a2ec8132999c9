#include <widgetcore/ui/TextShaper.hpp>

#include <algorithm>

namespace WC::UI {

auto CountCodePoints(std::string_view text) -> std::size_t {
    std::size_t count = 0;
    for (char raw : text) {
        auto const byte = static_cast<unsigned char>(raw);
        // Skip UTF-8 continuation bytes.
        if ((byte & 0xC0u) != 0x80u) {
            ++count;
        }
    }
    return count;
}

auto TextShaper::shape(std::string_view text,
                       TextProperties const& properties,
                       Color const& color,
                       Point origin,
                       Rect const& clip) const -> Scene::TextCommand {
    Scene::TextCommand command{};
    command.text = std::string{text};
    command.origin_x = origin.x;
    command.origin_y = origin.y;
    command.clip_min_x = clip.min_x();
    command.clip_min_y = clip.min_y();
    command.clip_max_x = clip.max_x();
    command.clip_max_y = clip.max_y();
    command.font_size = properties.font_size;
    command.line_height = properties.line_height;
    command.color = color;
    return command;
}

auto FixedAdvanceTextShaper::measure(std::string_view text, TextProperties const& properties) const -> Size {
    auto const glyphs = CountCodePoints(text);
    if (glyphs == 0) {
        return Size{0.0f, properties.line_height};
    }
    float const spacing = std::max(0.0f, properties.letter_spacing);
    float const advance = properties.font_size * advance_ratio_ + spacing;
    float width = advance * static_cast<float>(glyphs);
    // No trailing spacing after the last glyph.
    width -= spacing;
    return Size{width, properties.line_height};
}

} // namespace WC::UI
