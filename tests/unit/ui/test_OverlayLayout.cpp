#include <widgetcore/ui/OverlayLayout.hpp>

#include <doctest/doctest.h>

#include <random>

using namespace WC::UI;

TEST_SUITE("ui.overlay_layout") {
    TEST_CASE("Rect inside the viewport is left alone") {
        auto result = LayoutOverlay(Rect{Point{10.0f, 20.0f}, Size{100.0f, 50.0f}}, Size{800.0f, 600.0f});
        CHECK_FALSE(result.corrected());
        CHECK_FALSE(result.width_clipped);
        CHECK_FALSE(result.height_clipped);
    }

    TEST_CASE("Negative leading edge snaps to zero") {
        auto result = LayoutOverlay(Rect{Point{-10.0f, 50.0f}, Size{200.0f, 100.0f}}, Size{800.0f, 600.0f});
        REQUIRE(result.new_bounds.has_value());
        CHECK(*result.new_bounds == Rect{Point{0.0f, 50.0f}, Size{200.0f, 100.0f}});
        CHECK_FALSE(result.width_clipped);
        CHECK_FALSE(result.height_clipped);
    }

    TEST_CASE("Overflowing trailing edge is pulled back inside") {
        auto result = LayoutOverlay(Rect{Point{700.0f, 50.0f}, Size{200.0f, 100.0f}}, Size{800.0f, 600.0f});
        REQUIRE(result.new_bounds.has_value());
        CHECK(*result.new_bounds == Rect{Point{600.0f, 50.0f}, Size{200.0f, 100.0f}});

        auto bottom = LayoutOverlay(Rect{Point{10.0f, 580.0f}, Size{50.0f, 40.0f}}, Size{800.0f, 600.0f});
        REQUIRE(bottom.new_bounds.has_value());
        CHECK(bottom.new_bounds->origin == Point{10.0f, 560.0f});
    }

    TEST_CASE("Oversized rect is clipped to the viewport") {
        auto result = LayoutOverlay(Rect{Point{30.0f, 40.0f}, Size{1000.0f, 700.0f}}, Size{800.0f, 600.0f});
        REQUIRE(result.new_bounds.has_value());
        CHECK(result.width_clipped);
        CHECK(result.height_clipped);
        CHECK(result.new_bounds->size == Size{800.0f, 600.0f});
        CHECK(result.new_bounds->origin == Point{0.0f, 0.0f});
    }

    TEST_CASE("Applying the corrected rect again is a no-op") {
        Size const viewport{800.0f, 600.0f};
        for (auto desired : {Rect{Point{-10.0f, 50.0f}, Size{200.0f, 100.0f}},
                             Rect{Point{700.0f, 550.0f}, Size{200.0f, 100.0f}},
                             Rect{Point{-5.0f, -5.0f}, Size{900.0f, 900.0f}}}) {
            auto first = LayoutOverlay(desired, viewport);
            REQUIRE(first.new_bounds.has_value());
            auto second = LayoutOverlay(*first.new_bounds, viewport);
            CHECK_FALSE(second.corrected());
        }
    }

    TEST_CASE("Trailing edge snap is stable for fractional sizes") {
        // 744.473145 + 221.396698 against 734.245056 overshoots by an ulp once snapped.
        Size const viewport{734.245056f, 600.0f};
        auto first = LayoutOverlay(Rect{Point{744.473145f, 10.0f}, Size{221.396698f, 40.0f}}, viewport);
        REQUIRE(first.new_bounds.has_value());
        CHECK_FALSE(LayoutOverlay(*first.new_bounds, viewport).corrected());
    }

    TEST_CASE("Layout is idempotent over random fractional rects") {
        std::mt19937                          rng{20241019u};
        std::uniform_real_distribution<float> viewport_extent{1.0f, 2000.0f};
        std::uniform_real_distribution<float> unit{-0.5f, 1.5f};
        std::uniform_real_distribution<float> scale{0.0f, 1.25f};

        int corrected = 0;
        int unstable = 0;
        for (int i = 0; i < 20000; ++i) {
            Size const viewport{viewport_extent(rng), viewport_extent(rng)};
            Rect const desired{Point{unit(rng) * viewport.width, unit(rng) * viewport.height},
                               Size{scale(rng) * viewport.width, scale(rng) * viewport.height}};
            auto first = LayoutOverlay(desired, viewport);
            auto const settled = first.new_bounds.value_or(desired);
            if (first.corrected()) {
                ++corrected;
            }
            if (LayoutOverlay(settled, viewport).corrected()) {
                ++unstable;
            }
        }
        CHECK(corrected > 0);
        CHECK(unstable == 0);
    }

    TEST_CASE("Edge exactly at zero is not a correction") {
        auto result = LayoutOverlay(Rect{Point{0.0f, 0.0f}, Size{100.0f, 100.0f}}, Size{800.0f, 600.0f});
        CHECK_FALSE(result.corrected());
    }
}
