#include <widgetcore/ui/OverlayLayout.hpp>

#include "log/TaggedLogger.hpp"

#include <string>

namespace WC::UI {

namespace {

struct AxisPlacement {
    float position = 0.0f;
    bool  moved = false;
};

auto place_on_axis(float start, float extent, float viewport_extent) -> AxisPlacement {
    if (start <= 0.0f) {
        // Already at 0 is not a correction.
        return AxisPlacement{0.0f, start != 0.0f};
    }
    if (start + extent > viewport_extent) {
        // A snapped origin can still overshoot by an ulp; compare the result, not the test.
        float const snapped = viewport_extent - extent;
        return AxisPlacement{snapped, snapped != start};
    }
    return AxisPlacement{start, false};
}

} // namespace

auto LayoutOverlay(Rect const& desired, Size viewport) -> OverlayLayoutResult {
    OverlayLayoutResult result{};

    float width = desired.width();
    if (width > viewport.width) {
        width = viewport.width;
        result.width_clipped = true;
    }
    float height = desired.height();
    if (height > viewport.height) {
        height = viewport.height;
        result.height_clipped = true;
    }

    auto const x = place_on_axis(desired.min_x(), width, viewport.width);
    auto const y = place_on_axis(desired.min_y(), height, viewport.height);

    if (result.width_clipped || result.height_clipped || x.moved || y.moved) {
        result.new_bounds = Rect{Point{x.position, y.position}, Size{width, height}};
        wc_log("OverlayLayout: corrected to (" + std::to_string(x.position) + ", "
                   + std::to_string(y.position) + ", " + std::to_string(width) + ", "
                   + std::to_string(height) + ")",
               "Layout");
    }
    return result;
}

} // namespace WC::UI
