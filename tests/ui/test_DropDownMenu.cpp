#include <widgetcore/ui/widgets/DropDownMenu.hpp>

#include <doctest/doctest.h>

#include <memory>
#include <optional>
#include <utility>
#include <vector>

using namespace WC;
using namespace WC::UI;
using WC::UI::Widgets::DropDownMenu;
using WC::UI::Widgets::DropDownMenuArgs;

namespace {

Point const kMenuPos{100.0f, 100.0f};

// Two options around a divider. With the default style and the fixed-advance
// shaper this measures 138 x 65: option rows at [4, 30) and [35, 61).
auto file_entries() -> std::vector<MenuEntry> {
    return {MenuOption("Open", "Ctrl+O", 10), MenuDivider(), MenuOption("Quit", "", 20)};
}

auto make_menu(View& view, ActionSender<std::size_t> sender, std::vector<MenuEntry> entries = file_entries())
    -> DropDownMenu {
    DropDownMenuArgs args{};
    args.action = ForwardTo<std::size_t>(std::move(sender), [](std::size_t id) { return id; });
    args.entries = std::move(entries);
    args.style = std::make_shared<DropDownMenuStyle const>(MakeDefaultDropDownMenuStyle());
    args.z_index = 10;
    args.position = kMenuPos;
    auto menu = DropDownMenu::Create(view, std::move(args));
    REQUIRE(menu.has_value());
    return *menu;
}

auto open_menu(View& view, DropDownMenu& menu, std::optional<Point> at = std::nullopt) -> void {
    menu.open(at);
    REQUIRE(view.process_updates().has_value());
}

auto find_rendered(std::vector<RenderedElement> const& rendered, ElementID id) -> RenderedElement const* {
    for (auto const& r : rendered) {
        if (r.id == id) {
            return &r;
        }
    }
    return nullptr;
}

} // namespace

TEST_SUITE("ui.drop_down_menu") {
    TEST_CASE("Menu starts collapsed at its position") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);

        CHECK(view.bounds(menu.element().id()) == Rect{kMenuPos, Size{}});
        CHECK(view.render().empty());
        CHECK_FALSE(view.focused().has_value());
    }

    TEST_CASE("Opening sizes the menu to its rows and takes focus") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);

        CHECK(view.bounds(menu.element().id()) == Rect{kMenuPos, Size{138.0f, 65.0f}});
        CHECK(view.focused() == menu.element().id());

        // A second open while shown changes nothing.
        open_menu(view, menu);
        CHECK(view.bounds(menu.element().id()) == Rect{kMenuPos, Size{138.0f, 65.0f}});
    }

    TEST_CASE("Selecting an option sends its id and closes the menu") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 140.0f})).has_value());
        CHECK(receiver.drain() == std::vector<std::size_t>{20});
        CHECK(view.bounds(menu.element().id())->size == Size{});
        CHECK_FALSE(view.focused().has_value());
        CHECK(view.cursor_icon() == CursorIcon::Default);

        open_menu(view, menu);
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 110.0f})).has_value());
        CHECK(receiver.drain() == std::vector<std::size_t>{10});
    }

    TEST_CASE("Dividers and padding are not selectable") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 132.5f})).has_value());
        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 102.0f})).has_value());
        CHECK(receiver.pending() == 0);
        CHECK(view.focused() == menu.element().id());
        CHECK(view.bounds(menu.element().id())->size == Size{138.0f, 65.0f});
    }

    TEST_CASE("Clicking outside closes without selecting") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{10.0f, 10.0f})).has_value());
        CHECK(receiver.pending() == 0);
        CHECK_FALSE(view.focused().has_value());
        CHECK(view.bounds(menu.element().id())->size == Size{});
    }

    TEST_CASE("Hovering an option highlights it") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);
        (void)view.take_repaint_requests();

        REQUIRE(view.handle_pointer_event(PointerInput::moved(Point{110.0f, 110.0f})).has_value());
        CHECK(view.cursor_icon() == CursorIcon::Pointer);
        CHECK(view.take_repaint_requests() == std::vector<ElementID>{menu.element().id()});

        // Same row again: nothing to repaint.
        REQUIRE(view.handle_pointer_event(PointerInput::moved(Point{120.0f, 112.0f})).has_value());
        CHECK(view.take_repaint_requests().empty());

        auto rendered = view.render();
        auto const* drawn = find_rendered(rendered, menu.element().id());
        REQUIRE(drawn != nullptr);
        auto quads = drawn->primitives.quads();
        REQUIRE(quads.size() == 2);
        CHECK(quads[1].min_y == doctest::Approx(4.0f));
        CHECK(quads[1].max_y == doctest::Approx(30.0f));
        CHECK(drawn->primitives.texts().size() == 3);
        auto dividers = drawn->primitives.solid_quads();
        REQUIRE(dividers.size() == 1);
        CHECK(dividers[0].min_y == doctest::Approx(32.0f));
        CHECK(dividers[0].max_y == doctest::Approx(33.0f));

        // Over the divider nothing is highlighted and the cursor resets.
        REQUIRE(view.handle_pointer_event(PointerInput::moved(Point{110.0f, 132.5f})).has_value());
        CHECK(view.cursor_icon() == CursorIcon::Default);
        auto rerendered = view.render();
        auto const* redrawn = find_rendered(rerendered, menu.element().id());
        REQUIRE(redrawn != nullptr);
        CHECK(redrawn->primitives.quads().size() == 1);
    }

    TEST_CASE("Opening near the edge keeps the menu inside the window") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu, Point{700.0f, 100.0f});

        CHECK(view.bounds(menu.element().id()) == Rect{Point{662.0f, 100.0f}, Size{138.0f, 65.0f}});

        // Moving an open menu re-applies containment.
        menu.set_position(Point{750.0f, 560.0f});
        REQUIRE(view.process_updates().has_value());
        CHECK(view.bounds(menu.element().id()) == Rect{Point{662.0f, 535.0f}, Size{138.0f, 65.0f}});
    }

    TEST_CASE("Latest entries replacement wins") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);

        menu.set_entries(file_entries());
        menu.set_entries({MenuOption("Only", "", 1)});
        open_menu(view, menu);
        CHECK(view.bounds(menu.element().id())->size == Size{56.0f, 34.0f});

        REQUIRE(view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 110.0f})).has_value());
        CHECK(receiver.drain() == std::vector<std::size_t>{1});
    }

    TEST_CASE("Entries replaced while open re-measure in place") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        open_menu(view, menu);

        menu.set_entries({MenuOption("Only", "", 1)});
        REQUIRE(view.process_updates().has_value());
        CHECK(view.bounds(menu.element().id()) == Rect{kMenuPos, Size{56.0f, 34.0f}});
        CHECK(view.focused() == menu.element().id());
    }

    TEST_CASE("New entries are built with the newest style") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);

        auto roomy = MakeDefaultDropDownMenuStyle();
        roomy.outer_padding = 10.0f;
        REQUIRE(menu.set_style(std::make_shared<DropDownMenuStyle const>(roomy)).has_value());
        menu.set_entries({MenuOption("Only", "", 1)});
        open_menu(view, menu);
        CHECK(view.bounds(menu.element().id())->size == Size{68.0f, 46.0f});
    }

    TEST_CASE("Style changes re-measure existing rows") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender, {MenuOption("Only", "", 1)});
        open_menu(view, menu);

        auto large = MakeDefaultDropDownMenuStyle();
        large.left_text_properties.font_size = 28.0f;
        REQUIRE(menu.set_style(std::make_shared<DropDownMenuStyle const>(large)).has_value());
        REQUIRE(view.process_updates().has_value());
        // "Only" doubles to 56 wide: 56 + 20 padding + 8 outer padding.
        CHECK(view.bounds(menu.element().id())->size.width == doctest::Approx(84.0f));
    }

    TEST_CASE("Same style object is a no-op") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender);
        REQUIRE(view.process_updates().has_value());

        REQUIRE(menu.set_style(menu.style()).has_value());
        CHECK_FALSE(view.has_pending_updates());

        auto rejected = menu.set_style(nullptr);
        REQUIRE_FALSE(rejected.has_value());
        CHECK(rejected.error().code == Error::Code::InvalidArgument);
    }

    TEST_CASE("Closed channel reports the failure and still closes") {
        View view{Size{800.0f, 600.0f}};
        auto channel = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, channel.first);
        open_menu(view, menu);
        {
            auto dropped = std::move(channel.second);
        }

        auto result = view.handle_pointer_event(PointerInput::pressed(Point{110.0f, 110.0f}));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::ChannelClosed);
        CHECK_FALSE(view.focused().has_value());
        CHECK(view.bounds(menu.element().id())->size == Size{});
    }

    TEST_CASE("Empty menu opens to nothing") {
        View view{Size{800.0f, 600.0f}};
        auto [sender, receiver] = MakeActionChannel<std::size_t>();
        auto menu = make_menu(view, sender, {});
        open_menu(view, menu);
        CHECK(view.bounds(menu.element().id())->size == Size{});
        CHECK(view.render().empty());
    }
}
