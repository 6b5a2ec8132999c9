#pragma once

#include <widgetcore/ui/Geometry.hpp>

#include <optional>

namespace WC::UI {

struct OverlayLayoutResult {
    // Empty when the desired rect already fits; callers then keep their rect
    // and skip the bounds update.
    std::optional<Rect> new_bounds;
    bool                width_clipped = false;
    bool                height_clipped = false;

    [[nodiscard]] auto corrected() const -> bool { return new_bounds.has_value(); }
};

// Clamps an overlay's size to the viewport and moves it so it lies fully
// inside the viewport. An edge at or before the viewport's leading edge is
// snapped to 0; an overflowing trailing edge is aligned with the viewport's.
[[nodiscard]] auto LayoutOverlay(Rect const& desired, Size viewport) -> OverlayLayoutResult;

} // namespace WC::UI
