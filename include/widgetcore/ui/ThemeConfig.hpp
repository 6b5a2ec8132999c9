#pragma once

#include <widgetcore/core/Error.hpp>
#include <widgetcore/ui/StyleResolver.hpp>

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace WC::UI {

// One shared, immutable style per widget kind.
struct WidgetTheme {
    std::shared_ptr<ButtonStyle const>       button;
    std::shared_ptr<ToggleButtonStyle const> toggle_button;
    std::shared_ptr<DropDownMenuStyle const> drop_down_menu;
};

auto MakeDefaultWidgetTheme() -> WidgetTheme;

namespace ThemeConfig {

// Parses a JSON theme document. Keys present in the document override the
// matching fields of `defaults`; absent and unknown keys leave them as is.
// Colours are [r, g, b, a] arrays of floats, clamped to 0..1.
auto LoadFromJson(std::string_view text, WidgetTheme const& defaults) -> Expected<WidgetTheme>;

auto LoadFromFile(std::filesystem::path const& path, WidgetTheme const& defaults) -> Expected<WidgetTheme>;

// Serializes every field of every style, in the format LoadFromJson reads.
auto ToJson(WidgetTheme const& theme) -> std::string;

} // namespace ThemeConfig

} // namespace WC::UI
