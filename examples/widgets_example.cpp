#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/ActionQueue.hpp>
#include <widgetcore/ui/ThemeConfig.hpp>
#include <widgetcore/ui/View.hpp>
#include <widgetcore/ui/widgets/Button.hpp>
#include <widgetcore/ui/widgets/DropDownMenu.hpp>
#include <widgetcore/ui/widgets/ToggleButton.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

using namespace WC::UI;

namespace {

constexpr float kWindowWidth = 640.0f;
constexpr float kWindowHeight = 360.0f;
constexpr std::string_view kAppName = "widgets_example";

enum class MenuCommand : std::size_t {
    New = 1,
    Open = 2,
    Quit = 3,
};

struct GridToggled {
    bool on = false;
};
struct MenuRequested {};
struct MenuSelected {
    std::size_t id = 0;
};

using AppAction = std::variant<GridToggled, MenuRequested, MenuSelected>;

auto fail(std::string_view message, std::optional<WC::Error> error = std::nullopt) -> int {
    std::cerr << kAppName << ": " << message;
    if (error) {
        std::cerr << ": " << WC::describeError(*error);
    }
    std::cerr << "\n";
    return 1;
}

auto report(WC::Expected<void> const& status, std::string const& context) -> bool {
    if (status) {
        return true;
    }
    std::cerr << kAppName << ": " << context << " failed: " << WC::describeError(status.error()) << "\n";
    return false;
}

auto print_frame(View& view) -> void {
    auto frame = view.render();
    std::cout << "frame: " << frame.size() << " element(s)\n";
    for (auto const& element : frame) {
        std::cout << "  #" << element.id << " z=" << element.z_index << " at (" << element.origin.x << ", "
                  << element.origin.y << ") primitives=" << element.primitives.primitive_count() << "\n";
        for (auto const& text : element.primitives.texts()) {
            std::cout << "    text \"" << text.text << "\"\n";
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> theme_path;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--theme" && idx + 1 < argc) {
            theme_path = argv[++idx];
        } else if (arg == "--dump-theme") {
            std::cout << ThemeConfig::ToJson(MakeDefaultWidgetTheme()) << "\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--theme <file.json>|--dump-theme]\n";
            return 1;
        }
    }

    auto theme = MakeDefaultWidgetTheme();
    if (theme_path) {
        auto loaded = ThemeConfig::LoadFromFile(*theme_path, theme);
        if (!loaded) {
            return fail("failed to load theme", loaded.error());
        }
        theme = *loaded;
    }

    View view{Size{kWindowWidth, kWindowHeight}};
    auto [sender, receiver] = MakeActionChannel<AppAction>();

    Widgets::ToggleButtonArgs grid_args{};
    grid_args.action = ForwardTo<bool>(sender, [](bool on) -> AppAction { return GridToggled{on}; });
    grid_args.tooltip_message = "Show the alignment grid";
    grid_args.text = "Grid";
    grid_args.style = theme.toggle_button;
    grid_args.bounding_rect = Rect{Point{20.0f, 20.0f}, Size{90.0f, 28.0f}};
    auto grid = Widgets::ToggleButton::Create(view, std::move(grid_args));
    if (!grid) {
        return fail("failed to create toggle button", grid.error());
    }

    Widgets::ButtonArgs file_args{};
    file_args.action = [sender = sender]() { return sender.send(MenuRequested{}); };
    file_args.text = "File";
    file_args.style = theme.button;
    file_args.bounding_rect = Rect{Point{120.0f, 20.0f}, Size{70.0f, 28.0f}};
    auto file = Widgets::Button::Create(view, std::move(file_args));
    if (!file) {
        return fail("failed to create button", file.error());
    }

    Widgets::DropDownMenuArgs menu_args{};
    menu_args.action = ForwardTo<std::size_t>(sender, [](std::size_t id) -> AppAction { return MenuSelected{id}; });
    menu_args.entries = {
        MenuOption("New", "Ctrl+N", static_cast<std::size_t>(MenuCommand::New)),
        MenuOption("Open...", "Ctrl+O", static_cast<std::size_t>(MenuCommand::Open)),
        MenuDivider(),
        MenuOption("Quit", "Ctrl+Q", static_cast<std::size_t>(MenuCommand::Quit)),
    };
    menu_args.style = theme.drop_down_menu;
    menu_args.z_index = 100;
    auto menu = Widgets::DropDownMenu::Create(view, std::move(menu_args));
    if (!menu) {
        return fail("failed to create drop-down menu", menu.error());
    }

    // Scripted pointer session standing in for a platform event loop.
    PointerInput const script[] = {
        PointerInput::moved(Point{40.0f, 30.0f}),
        PointerInput::pressed(Point{40.0f, 30.0f}),
        PointerInput::released(Point{40.0f, 30.0f}),
        PointerInput::moved(Point{140.0f, 30.0f}),
        PointerInput::pressed(Point{140.0f, 30.0f}),
        PointerInput::released(Point{140.0f, 30.0f}),
        PointerInput::moved(Point{150.0f, 60.0f}),
        PointerInput::pressed(Point{150.0f, 60.0f}),
    };

    bool running = true;
    for (auto const& input : script) {
        if (!running) {
            break;
        }
        if (!report(view.handle_pointer_event(input), "pointer event")) {
            return 1;
        }
        if (view.has_pending_hover_timeout() && !report(view.fire_hover_timeout(), "hover timeout")) {
            return 1;
        }
        if (auto const& tooltip = view.tooltip()) {
            std::cout << "tooltip: " << tooltip->message << "\n";
            view.hide_tooltip();
        }

        for (auto& action : receiver.drain()) {
            if (auto const* toggled = std::get_if<GridToggled>(&action)) {
                std::cout << "grid " << (toggled->on ? "on" : "off") << "\n";
            } else if (std::holds_alternative<MenuRequested>(action)) {
                auto const anchor = view.bounds(file->element().id());
                menu->open(anchor ? std::optional<Point>{Point{anchor->min_x(), anchor->max_y()}} : std::nullopt);
                std::cout << "menu opened\n";
            } else if (auto const* selected = std::get_if<MenuSelected>(&action)) {
                std::cout << "menu selected " << selected->id << "\n";
                if (selected->id == static_cast<std::size_t>(MenuCommand::Quit)) {
                    running = false;
                }
            }
        }

        if (!report(view.process_updates(), "process updates")) {
            return 1;
        }
        if (!view.take_repaint_requests().empty()) {
            print_frame(view);
        }
    }
    return 0;
}
