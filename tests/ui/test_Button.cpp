#include <widgetcore/ui/widgets/Button.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <utility>

using namespace WC;
using namespace WC::UI;
using WC::UI::Widgets::Button;
using WC::UI::Widgets::ButtonArgs;

namespace {

Rect const kButtonRect{Point{0.0f, 0.0f}, Size{80.0f, 28.0f}};

auto make_args(int& presses) -> ButtonArgs {
    ButtonArgs args{};
    args.action = [&presses]() -> Expected<void> {
        ++presses;
        return {};
    };
    args.text = "OK";
    args.style = std::make_shared<ButtonStyle const>(MakeDefaultButtonStyle());
    args.bounding_rect = kButtonRect;
    return args;
}

} // namespace

TEST_SUITE("ui.button") {
    TEST_CASE("Action fires once per press") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());

        REQUIRE(view.handle_pointer_event(PointerInput::moved(Point{5.0f, 5.0f})).has_value());
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 1);
        REQUIRE(view.handle_pointer_event(PointerInput::released(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 1);

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{6.0f, 5.0f})).has_value());
        CHECK(presses == 2);
    }

    TEST_CASE("Held button does not fire again") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 1);
    }

    TEST_CASE("Click without a prior move still returns to idle when the pointer leaves") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());
        auto const style = MakeDefaultButtonStyle();
        REQUIRE(style.idle.back_quad.border.color != style.hovered.back_quad.border.color);

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{10.0f, 10.0f})).has_value());
        REQUIRE(view.handle_pointer_event(PointerInput::released(Point{10.0f, 10.0f})).has_value());
        CHECK(presses == 1);
        CHECK(view.hovered() == button->element().id());

        auto hovered = view.render();
        REQUIRE(hovered.size() == 1);
        auto hovered_quads = hovered[0].primitives.quads();
        REQUIRE(hovered_quads.size() == 1);
        CHECK(hovered_quads[0].border_color == style.hovered.back_quad.border.color);

        REQUIRE(view.handle_pointer_event(PointerInput::moved(Point{500.0f, 500.0f})).has_value());
        CHECK_FALSE(view.hovered().has_value());

        auto left = view.render();
        REQUIRE(left.size() == 1);
        auto idle_quads = left[0].primitives.quads();
        REQUIRE(idle_quads.size() == 1);
        CHECK(idle_quads[0].border_color == style.idle.back_quad.border.color);
    }

    TEST_CASE("Disabled button does not fire") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());
        button->set_disabled(true);
        CHECK(button->disabled());

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 0);

        button->set_disabled(false);
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 1);
    }

    TEST_CASE("Text and sizing") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());

        CHECK(button->unclipped_text_size() == Size{14.0f, 16.0f});
        CHECK(button->desired_padded_size() == Size{26.0f, 28.0f});

        button->set_text("Cancel");
        CHECK(button->text() == "Cancel");
        CHECK(button->desired_padded_size().width == doctest::Approx(54.0f));
        CHECK(view.has_pending_updates());
    }

    TEST_CASE("Style changes re-measure the text") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto button = Button::Create(view, make_args(presses));
        REQUIRE(button.has_value());

        auto bigger = MakeDefaultButtonStyle();
        bigger.properties.font_size = 28.0f;
        REQUIRE(button->set_style(std::make_shared<ButtonStyle const>(bigger)).has_value());
        CHECK(button->unclipped_text_size().width == doctest::Approx(28.0f));
        CHECK(button->style()->properties.font_size == doctest::Approx(28.0f));

        auto rejected = button->set_style(nullptr);
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Failing action is reported") {
        View view{Size{800.0f, 600.0f}};
        ButtonArgs args{};
        args.action = []() -> Expected<void> {
            return std::unexpected(Error{Error::Code::ChannelClosed, "receiver dropped"});
        };
        args.style = std::make_shared<ButtonStyle const>(MakeDefaultButtonStyle());
        args.bounding_rect = kButtonRect;
        auto button = Button::Create(view, std::move(args));
        REQUIRE(button.has_value());

        auto result = view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ChannelClosed);
    }

    TEST_CASE("Manually hidden button is neither rendered nor pressable") {
        View view{Size{800.0f, 600.0f}};
        int presses = 0;
        auto args = make_args(presses);
        args.manually_hidden = true;
        auto button = Button::Create(view, std::move(args));
        REQUIRE(button.has_value());

        CHECK(view.render().empty());
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{5.0f, 5.0f})).has_value());
        CHECK(presses == 0);

        button->element().set_hidden(false);
        REQUIRE(view.process_updates().has_value());
        CHECK(view.render().size() == 1);
    }
}
