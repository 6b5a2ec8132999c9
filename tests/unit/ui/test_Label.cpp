#include <widgetcore/ui/StyleResolver.hpp>
#include <widgetcore/ui/TextShaper.hpp>
#include <widgetcore/ui/widgets/Label.hpp>

#include <doctest/doctest.h>

using namespace WC::UI;
using WC::UI::Widgets::DualLabel;
using WC::UI::Widgets::Label;
using WC::UI::Widgets::PaddedRect;

namespace {

// Counts measure() calls so tests can check the size cache.
class CountingShaper final : public TextShaper {
public:
    auto measure(std::string_view text, TextProperties const& properties) const -> Size override {
        ++calls;
        return inner.measure(text, properties);
    }

    FixedAdvanceTextShaper inner{};
    mutable int            calls = 0;
};

} // namespace

TEST_SUITE("ui.text_shaper") {
    TEST_CASE("Fixed advance measurement") {
        FixedAdvanceTextShaper shaper{};
        TextProperties props{};
        CHECK(shaper.measure("Hello", props) == Size{35.0f, 16.0f});
        CHECK(shaper.measure("", props) == Size{0.0f, 16.0f});

        props.letter_spacing = 1.0f;
        CHECK(shaper.measure("ab", props).width == doctest::Approx(15.0f));
    }

    TEST_CASE("Code points, not bytes, advance the pen") {
        CHECK(CountCodePoints("abc") == 3);
        CHECK(CountCodePoints("\xC3\xA9t\xC3\xA9") == 3);
        CHECK(CountCodePoints("") == 0);
    }

    TEST_CASE("Default shaping copies placement and paint") {
        FixedAdvanceTextShaper shaper{};
        TextProperties props{};
        props.font_size = 20.0f;
        auto cmd = shaper.shape("x", props, Colors::kAccent, Point{3.0f, 4.0f}, Rect{Point{1.0f, 2.0f}, Size{10.0f, 20.0f}});
        CHECK(cmd.text == "x");
        CHECK(cmd.origin_x == doctest::Approx(3.0f));
        CHECK(cmd.clip_max_y == doctest::Approx(22.0f));
        CHECK(cmd.font_size == doctest::Approx(20.0f));
        CHECK(cmd.color == Colors::kAccent);
    }
}

TEST_SUITE("ui.label") {
    TEST_CASE("Unpadded label is vertically centred") {
        FixedAdvanceTextShaper shaper{};
        LabelStyle style{};
        Label label{"OK", Point{}, style, shaper};
        CHECK(label.unclipped_text_size() == Size{14.0f, 16.0f});

        auto p = label.render_primitives(Rect::from_size(Size{100.0f, 40.0f}), style, shaper);
        CHECK_FALSE(p.bg_quad.has_value());
        REQUIRE(p.text.has_value());
        CHECK(p.text->origin_x == doctest::Approx(0.0f));
        CHECK(p.text->origin_y == doctest::Approx(12.0f));
    }

    TEST_CASE("Button label is centred inside its padding") {
        FixedAdvanceTextShaper shaper{};
        auto style = ResolveLabelStyle(MakeDefaultButtonStyle(), ButtonState::Idle);
        Label label{"OK", Point{}, style, shaper};

        CHECK(label.desired_padded_size(style) == Size{26.0f, 28.0f});

        auto p = label.render_primitives(Rect::from_size(Size{100.0f, 40.0f}), style, shaper);
        REQUIRE(p.bg_quad.has_value());
        CHECK(p.bg_quad->max_x == doctest::Approx(100.0f));
        REQUIRE(p.text.has_value());
        CHECK(p.text->origin_x == doctest::Approx(43.0f));
        CHECK(p.text->origin_y == doctest::Approx(12.0f));
        CHECK(p.text->clip_min_x == doctest::Approx(6.0f));
        CHECK(p.text->clip_max_x == doctest::Approx(94.0f));
    }

    TEST_CASE("Text offset moves the text but not the background") {
        FixedAdvanceTextShaper shaper{};
        auto style = ResolveLabelStyle(MakeDefaultButtonStyle(), ButtonState::Idle);
        Label label{"OK", Point{}, style, shaper};
        CHECK(label.set_text_offset(Point{2.0f, -1.0f}));
        CHECK_FALSE(label.set_text_offset(Point{2.0f, -1.0f}));
        CHECK(label.text_offset() == Point{2.0f, -1.0f});

        auto p = label.render_primitives(Rect::from_size(Size{100.0f, 40.0f}), style, shaper);
        REQUIRE(p.text.has_value());
        CHECK(p.text->origin_x == doctest::Approx(45.0f));
        CHECK(p.text->origin_y == doctest::Approx(11.0f));
        REQUIRE(p.bg_quad.has_value());
        CHECK(p.bg_quad->min_x == doctest::Approx(0.0f));
    }

    TEST_CASE("Text is dropped below the minimum clipped size") {
        FixedAdvanceTextShaper shaper{};
        auto style = ResolveLabelStyle(MakeDefaultButtonStyle(), ButtonState::Idle);
        Label label{"OK", Point{}, style, shaper};
        auto p = label.render_primitives(Rect::from_size(Size{10.0f, 10.0f}), style, shaper);
        CHECK_FALSE(p.text.has_value());
        CHECK(p.bg_quad.has_value());
    }

    TEST_CASE("Size is re-measured only when text or properties change") {
        CountingShaper shaper{};
        LabelStyle style{};
        Label label{"abc", Point{}, style, shaper};
        CHECK(shaper.calls == 1);

        CHECK_FALSE(label.set_text("abc", shaper));
        CHECK(shaper.calls == 1);

        CHECK(label.set_text("abcd", shaper));
        CHECK(shaper.calls == 2);
        CHECK(label.unclipped_text_size().width == doctest::Approx(28.0f));

        // Only the colour differs: no new measurement.
        auto recoloured = style;
        recoloured.font_color = Colors::kBlack;
        label.set_style(recoloured, shaper);
        CHECK(shaper.calls == 2);

        auto bigger = style;
        bigger.properties.font_size = 28.0f;
        label.set_style(bigger, shaper);
        CHECK(shaper.calls == 3);
        CHECK(label.unclipped_text_size().width == doctest::Approx(56.0f));
    }

    TEST_CASE("Padded rect never goes negative") {
        auto r = PaddedRect(Rect::from_size(Size{10.0f, 10.0f}), Padding{8.0f, 8.0f, 8.0f, 8.0f});
        CHECK(r.size == Size{0.0f, 0.0f});
        CHECK(r.origin == Point{8.0f, 8.0f});
    }
}

TEST_SUITE("ui.dual_label") {
    TEST_CASE("Desired size adds both padded columns") {
        FixedAdvanceTextShaper shaper{};
        auto style = ResolveDualLabelStyle(MakeDefaultDropDownMenuStyle(), false);

        DualLabel both{"Open", "Ctrl+O", style, shaper};
        CHECK(both.left_unclipped_size().width == doctest::Approx(28.0f));
        CHECK(both.right_unclipped_size().width == doctest::Approx(42.0f));
        CHECK(both.desired_padded_size(style) == Size{130.0f, 26.0f});

        DualLabel left_only{"Open", "", style, shaper};
        CHECK(left_only.right_unclipped_size().width == doctest::Approx(0.0f));
        CHECK(left_only.desired_padded_size(style) == Size{48.0f, 26.0f});
    }

    TEST_CASE("Columns are aligned to opposite edges") {
        FixedAdvanceTextShaper shaper{};
        auto style = ResolveDualLabelStyle(MakeDefaultDropDownMenuStyle(), false);
        DualLabel label{"Open", "Ctrl+O", style, shaper};

        auto p = label.render_primitives(Rect{Point{4.0f, 4.0f}, Size{200.0f, 26.0f}}, style, shaper);
        REQUIRE(p.left_text.has_value());
        REQUIRE(p.right_text.has_value());
        CHECK(p.left_text->origin_x == doctest::Approx(14.0f));
        // Right column ends at 204 - 10 padding; the text is 42 wide.
        CHECK(p.right_text->origin_x == doctest::Approx(152.0f));
        CHECK(p.left_text->origin_y == doctest::Approx(9.0f));
    }
}
