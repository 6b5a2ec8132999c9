#pragma once

#include <widgetcore/ui/DrawCommands.hpp>
#include <widgetcore/ui/Geometry.hpp>
#include <widgetcore/ui/Style.hpp>

#include <cstddef>
#include <string_view>

namespace WC::UI {

// Text measurement and shaping service consumed by labels. Implementations
// must be deterministic for a given (text, properties) pair.
class TextShaper {
public:
    virtual ~TextShaper() = default;

    // Unclipped size of a single line of text.
    [[nodiscard]] virtual auto measure(std::string_view text, TextProperties const& properties) const -> Size = 0;

    // Paint-ready text primitive with its unclipped box at `origin`, confined
    // to `clip`.
    [[nodiscard]] virtual auto shape(std::string_view text,
                                     TextProperties const& properties,
                                     Color const& color,
                                     Point origin,
                                     Rect const& clip) const -> Scene::TextCommand;
};

// Monospace approximation used when no font backend is attached: every code
// point advances by `font_size * advance_ratio` plus letter spacing.
class FixedAdvanceTextShaper final : public TextShaper {
public:
    explicit FixedAdvanceTextShaper(float advance_ratio = 0.5f)
        : advance_ratio_(advance_ratio) {}

    [[nodiscard]] auto measure(std::string_view text, TextProperties const& properties) const -> Size override;

    [[nodiscard]] auto advance_ratio() const -> float { return advance_ratio_; }

private:
    float advance_ratio_;
};

[[nodiscard]] auto CountCodePoints(std::string_view text) -> std::size_t;

} // namespace WC::UI
