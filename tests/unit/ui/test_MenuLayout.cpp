#include <widgetcore/ui/MenuLayout.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace WC::UI;

namespace {

auto option_divider_option() -> std::vector<MenuRow> {
    return {OptionRow{0, 80.0f}, DividerRow{}, OptionRow{1, 120.4f}};
}

} // namespace

TEST_SUITE("ui.menu_layout") {
    TEST_CASE("Rows are stacked below the outer padding") {
        auto rows = option_divider_option();
        auto size = MeasureMenuRows(rows, MenuLayoutMetrics{20.0f, 4.0f, 1.0f, 2.0f});

        auto const& first = std::get<OptionRow>(rows[0]);
        CHECK(first.start_y == doctest::Approx(4.0f));
        CHECK(first.end_y == doctest::Approx(24.0f));
        CHECK(std::get<DividerRow>(rows[1]).y == doctest::Approx(26.0f));
        auto const& second = std::get<OptionRow>(rows[2]);
        CHECK(second.start_y == doctest::Approx(29.0f));
        CHECK(second.end_y == doctest::Approx(49.0f));

        // Width is the ceiled widest row plus both outer paddings.
        CHECK(size.width == doctest::Approx(121.0f + 8.0f));
        CHECK(size.height == doctest::Approx(53.0f));
    }

    TEST_CASE("Wider dividers push later rows down") {
        auto rows = option_divider_option();
        auto size = MeasureMenuRows(rows, MenuLayoutMetrics{20.0f, 4.0f, 2.0f, 4.0f});

        CHECK(std::get<OptionRow>(rows[0]).start_y == doctest::Approx(4.0f));
        CHECK(std::get<OptionRow>(rows[0]).end_y == doctest::Approx(24.0f));
        CHECK(std::get<DividerRow>(rows[1]).y == doctest::Approx(28.0f));
        CHECK(std::get<OptionRow>(rows[2]).start_y == doctest::Approx(34.0f));
        CHECK(std::get<OptionRow>(rows[2]).end_y == doctest::Approx(54.0f));
        CHECK(size.height == doctest::Approx(58.0f));
    }

    TEST_CASE("Empty menu measures to zero") {
        std::vector<MenuRow> rows;
        CHECK(MeasureMenuRows(rows, MenuLayoutMetrics{20.0f, 4.0f, 1.0f, 2.0f}) == Size{});
    }

    TEST_CASE("Hit testing finds options and skips dividers") {
        for (auto metrics : {MenuLayoutMetrics{20.0f, 4.0f, 1.0f, 2.0f}, MenuLayoutMetrics{20.0f, 4.0f, 2.0f, 4.0f}}) {
            auto rows = option_divider_option();
            MeasureMenuRows(rows, metrics);

            auto top = HitTestMenuRows(rows, 10.0f);
            REQUIRE(top.has_value());
            CHECK(*top == 0);

            auto bottom = HitTestMenuRows(rows, 40.0f);
            REQUIRE(bottom.has_value());
            CHECK(*bottom == 2);
            CHECK(std::get<OptionRow>(rows[*bottom]).unique_id == 1);

            CHECK_FALSE(HitTestMenuRows(rows, 27.0f).has_value());
            CHECK_FALSE(HitTestMenuRows(rows, 2.0f).has_value());
            CHECK_FALSE(HitTestMenuRows(rows, 500.0f).has_value());
        }
    }

    TEST_CASE("Row end is exclusive") {
        std::vector<MenuRow> rows{OptionRow{7, 10.0f}, OptionRow{8, 10.0f}};
        MeasureMenuRows(rows, MenuLayoutMetrics{10.0f, 0.0f, 1.0f, 2.0f});
        auto hit = HitTestMenuRows(rows, 10.0f);
        REQUIRE(hit.has_value());
        CHECK(*hit == 1);
    }
}
