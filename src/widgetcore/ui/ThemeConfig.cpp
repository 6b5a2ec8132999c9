#include <widgetcore/ui/ThemeConfig.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cmath>
#include <limits>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace WC::UI {

namespace {

using json = nlohmann::json;

auto malformed(std::string const& path, std::string_view expected) -> Error {
    return Error{Error::Code::MalformedInput, path + ": expected " + std::string{expected}};
}

// Narrowing a double outside float range is undefined, so reject it first.
auto to_float(json const& node, float& out) -> bool {
    if (!node.is_number()) {
        return false;
    }
    auto const value = node.get<double>();
    if (!std::isfinite(value) || std::abs(value) > static_cast<double>(std::numeric_limits<float>::max())) {
        return false;
    }
    out = static_cast<float>(value);
    return true;
}

auto read(json const& node, std::string const& path, float& out) -> Expected<void> {
    if (!to_float(node, out)) {
        return std::unexpected(malformed(path, "number in float range"));
    }
    return {};
}

auto read(json const& node, std::string const& path, std::string& out) -> Expected<void> {
    if (!node.is_string()) {
        return std::unexpected(malformed(path, "string"));
    }
    out = node.get<std::string>();
    return {};
}

auto read(json const& node, std::string const& path, Color& out) -> Expected<void> {
    if (!node.is_array() || node.size() != 4) {
        return std::unexpected(malformed(path, "[r, g, b, a]"));
    }
    Color color{};
    for (std::size_t i = 0; i < 4; ++i) {
        if (!node[i].is_number()) {
            return std::unexpected(malformed(path, "[r, g, b, a]"));
        }
        auto const channel = node[i].get<double>();
        if (std::isnan(channel)) {
            return std::unexpected(malformed(path, "[r, g, b, a]"));
        }
        color[i] = static_cast<float>(std::clamp(channel, 0.0, 1.0));
    }
    out = color;
    return {};
}

auto read(json const& node, std::string const& path, Align& out) -> Expected<void> {
    if (node == "start") {
        out = Align::Start;
    } else if (node == "center") {
        out = Align::Center;
    } else if (node == "end") {
        out = Align::End;
    } else {
        return std::unexpected(malformed(path, "\"start\", \"center\" or \"end\""));
    }
    return {};
}

auto read(json const& node, std::string const& path, Padding& out) -> Expected<void> {
    std::array<float, 4> sides{};
    if (!node.is_array() || node.size() != 4 || !to_float(node[0], sides[0]) || !to_float(node[1], sides[1])
        || !to_float(node[2], sides[2]) || !to_float(node[3], sides[3])) {
        return std::unexpected(malformed(path, "[top, right, bottom, left]"));
    }
    out = Padding{sides[0], sides[1], sides[2], sides[3]};
    return {};
}

auto read(json const& node, std::string const& path, Size& out) -> Expected<void> {
    Size size{};
    if (!node.is_array() || node.size() != 2 || !to_float(node[0], size.width) || !to_float(node[1], size.height)) {
        return std::unexpected(malformed(path, "[width, height]"));
    }
    out = size;
    return {};
}

auto read(json const& node, std::string const& path, BorderStyle& out) -> Expected<void>;
auto read(json const& node, std::string const& path, QuadStyle& out) -> Expected<void>;
auto read(json const& node, std::string const& path, TextProperties& out) -> Expected<void>;
auto read(json const& node, std::string const& path, ButtonStylePart& out) -> Expected<void>;

template <typename T>
auto read_field(json const& object, std::string const& path, char const* key, T& out) -> Expected<void> {
    auto it = object.find(key);
    if (it == object.end()) {
        return {};
    }
    return read(*it, path + "." + key, out);
}

auto expect_object(json const& node, std::string const& path) -> Expected<void> {
    if (!node.is_object()) {
        return std::unexpected(malformed(path, "object"));
    }
    return {};
}

auto read(json const& node, std::string const& path, BorderStyle& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "color", out.color); !r) return r;
    if (auto r = read_field(node, path, "width", out.width); !r) return r;
    return read_field(node, path, "radius", out.radius);
}

auto read(json const& node, std::string const& path, QuadStyle& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "bg", out.bg); !r) return r;
    return read_field(node, path, "border", out.border);
}

auto read(json const& node, std::string const& path, TextProperties& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "font_size", out.font_size); !r) return r;
    if (auto r = read_field(node, path, "line_height", out.line_height); !r) return r;
    if (auto r = read_field(node, path, "letter_spacing", out.letter_spacing); !r) return r;
    if (auto r = read_field(node, path, "font_family", out.font_family); !r) return r;
    return read_field(node, path, "align", out.align);
}

auto read(json const& node, std::string const& path, ButtonStylePart& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "font_color", out.font_color); !r) return r;
    return read_field(node, path, "back_quad", out.back_quad);
}

// Fields shared by both button styles.
template <typename Style>
auto read_button_common(json const& node, std::string const& path, Style& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "properties", out.properties); !r) return r;
    if (auto r = read_field(node, path, "vertical_align", out.vertical_align); !r) return r;
    if (auto r = read_field(node, path, "min_clipped_size", out.min_clipped_size); !r) return r;
    return read_field(node, path, "padding", out.padding);
}

auto read(json const& node, std::string const& path, ButtonStyle& out) -> Expected<void> {
    if (auto r = read_button_common(node, path, out); !r) return r;
    if (auto r = read_field(node, path, "idle", out.idle); !r) return r;
    if (auto r = read_field(node, path, "hovered", out.hovered); !r) return r;
    if (auto r = read_field(node, path, "down", out.down); !r) return r;
    return read_field(node, path, "disabled", out.disabled);
}

auto read(json const& node, std::string const& path, ToggleButtonStyle& out) -> Expected<void> {
    if (auto r = read_button_common(node, path, out); !r) return r;
    if (auto r = read_field(node, path, "idle_on", out.idle_on); !r) return r;
    if (auto r = read_field(node, path, "hovered_on", out.hovered_on); !r) return r;
    if (auto r = read_field(node, path, "disabled_on", out.disabled_on); !r) return r;
    if (auto r = read_field(node, path, "idle_off", out.idle_off); !r) return r;
    if (auto r = read_field(node, path, "hovered_off", out.hovered_off); !r) return r;
    return read_field(node, path, "disabled_off", out.disabled_off);
}

auto read(json const& node, std::string const& path, DropDownMenuStyle& out) -> Expected<void> {
    if (auto r = expect_object(node, path); !r) return r;
    if (auto r = read_field(node, path, "left_text_properties", out.left_text_properties); !r) return r;
    if (auto r = read_field(node, path, "right_text_properties", out.right_text_properties); !r) return r;
    if (auto r = read_field(node, path, "left_text_color_idle", out.left_text_color_idle); !r) return r;
    if (auto r = read_field(node, path, "right_text_color_idle", out.right_text_color_idle); !r) return r;
    if (auto r = read_field(node, path, "left_text_color_hover", out.left_text_color_hover); !r) return r;
    if (auto r = read_field(node, path, "right_text_color_hover", out.right_text_color_hover); !r) return r;
    if (auto r = read_field(node, path, "back_quad", out.back_quad); !r) return r;
    if (auto r = read_field(node, path, "text_bg_quad_hover", out.text_bg_quad_hover); !r) return r;
    if (auto r = read_field(node, path, "outer_padding", out.outer_padding); !r) return r;
    if (auto r = read_field(node, path, "left_text_padding", out.left_text_padding); !r) return r;
    if (auto r = read_field(node, path, "right_text_padding", out.right_text_padding); !r) return r;
    if (auto r = read_field(node, path, "divider_color", out.divider_color); !r) return r;
    if (auto r = read_field(node, path, "divider_width", out.divider_width); !r) return r;
    return read_field(node, path, "divider_padding", out.divider_padding);
}

// A style missing from the theme falls back to the library default.
template <typename Style>
auto load_style(json const& root,
                char const* key,
                std::shared_ptr<Style const> const& fallback,
                Style (*make_default)()) -> Expected<std::shared_ptr<Style const>> {
    auto it = root.find(key);
    if (it == root.end()) {
        return fallback ? fallback : std::make_shared<Style const>(make_default());
    }
    Style style = fallback ? *fallback : make_default();
    if (auto r = read(*it, std::string{"theme."} + key, style); !r) {
        return std::unexpected(r.error());
    }
    return std::make_shared<Style const>(std::move(style));
}

auto align_to_json(Align align) -> json {
    switch (align) {
    case Align::Start:
        return "start";
    case Align::Center:
        return "center";
    case Align::End:
        return "end";
    }
    return "start";
}

auto to_json_value(Color const& color) -> json {
    return json::array({color[0], color[1], color[2], color[3]});
}

auto to_json_value(Padding const& padding) -> json {
    return json::array({padding.top, padding.right, padding.bottom, padding.left});
}

auto to_json_value(QuadStyle const& quad) -> json {
    return json{{"bg", to_json_value(quad.bg)},
                {"border",
                 json{{"color", to_json_value(quad.border.color)},
                      {"width", quad.border.width},
                      {"radius", quad.border.radius}}}};
}

auto to_json_value(TextProperties const& properties) -> json {
    return json{{"font_size", properties.font_size},
                {"line_height", properties.line_height},
                {"letter_spacing", properties.letter_spacing},
                {"font_family", properties.font_family},
                {"align", align_to_json(properties.align)}};
}

auto to_json_value(ButtonStylePart const& part) -> json {
    return json{{"font_color", to_json_value(part.font_color)}, {"back_quad", to_json_value(part.back_quad)}};
}

template <typename Style>
auto button_common_to_json(Style const& style) -> json {
    return json{{"properties", to_json_value(style.properties)},
                {"vertical_align", align_to_json(style.vertical_align)},
                {"min_clipped_size", json::array({style.min_clipped_size.width, style.min_clipped_size.height})},
                {"padding", to_json_value(style.padding)}};
}

auto to_json_value(ButtonStyle const& style) -> json {
    auto out = button_common_to_json(style);
    out["idle"] = to_json_value(style.idle);
    out["hovered"] = to_json_value(style.hovered);
    out["down"] = to_json_value(style.down);
    out["disabled"] = to_json_value(style.disabled);
    return out;
}

auto to_json_value(ToggleButtonStyle const& style) -> json {
    auto out = button_common_to_json(style);
    out["idle_on"] = to_json_value(style.idle_on);
    out["hovered_on"] = to_json_value(style.hovered_on);
    out["disabled_on"] = to_json_value(style.disabled_on);
    out["idle_off"] = to_json_value(style.idle_off);
    out["hovered_off"] = to_json_value(style.hovered_off);
    out["disabled_off"] = to_json_value(style.disabled_off);
    return out;
}

auto to_json_value(DropDownMenuStyle const& style) -> json {
    return json{{"left_text_properties", to_json_value(style.left_text_properties)},
                {"right_text_properties", to_json_value(style.right_text_properties)},
                {"left_text_color_idle", to_json_value(style.left_text_color_idle)},
                {"right_text_color_idle", to_json_value(style.right_text_color_idle)},
                {"left_text_color_hover", to_json_value(style.left_text_color_hover)},
                {"right_text_color_hover", to_json_value(style.right_text_color_hover)},
                {"back_quad", to_json_value(style.back_quad)},
                {"text_bg_quad_hover", to_json_value(style.text_bg_quad_hover)},
                {"outer_padding", style.outer_padding},
                {"left_text_padding", to_json_value(style.left_text_padding)},
                {"right_text_padding", to_json_value(style.right_text_padding)},
                {"divider_color", to_json_value(style.divider_color)},
                {"divider_width", style.divider_width},
                {"divider_padding", style.divider_padding}};
}

} // namespace

auto MakeDefaultWidgetTheme() -> WidgetTheme {
    WidgetTheme theme{};
    theme.button = std::make_shared<ButtonStyle const>(MakeDefaultButtonStyle());
    theme.toggle_button = std::make_shared<ToggleButtonStyle const>(MakeDefaultToggleButtonStyle());
    theme.drop_down_menu = std::make_shared<DropDownMenuStyle const>(MakeDefaultDropDownMenuStyle());
    return theme;
}

namespace ThemeConfig {

auto LoadFromJson(std::string_view text, WidgetTheme const& defaults) -> Expected<WidgetTheme> {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        wc_log("ThemeConfig: theme document is not valid JSON", "Theme", "Error");
        return std::unexpected(Error{Error::Code::MalformedInput, "theme document is not valid JSON"});
    }
    if (!root.is_object()) {
        return std::unexpected(malformed("theme", "object"));
    }

    WidgetTheme theme{};
    auto button = load_style(root, "button", defaults.button, &MakeDefaultButtonStyle);
    if (!button) {
        return std::unexpected(button.error());
    }
    theme.button = std::move(*button);

    auto toggle = load_style(root, "toggle_button", defaults.toggle_button, &MakeDefaultToggleButtonStyle);
    if (!toggle) {
        return std::unexpected(toggle.error());
    }
    theme.toggle_button = std::move(*toggle);

    auto menu = load_style(root, "drop_down_menu", defaults.drop_down_menu, &MakeDefaultDropDownMenuStyle);
    if (!menu) {
        return std::unexpected(menu.error());
    }
    theme.drop_down_menu = std::move(*menu);
    return theme;
}

auto LoadFromFile(std::filesystem::path const& path, WidgetTheme const& defaults) -> Expected<WidgetTheme> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        wc_log("ThemeConfig: theme file not found: " + path.string(), "Theme", "Error");
        return std::unexpected(Error{Error::Code::NotFound, "theme file not found: " + path.string()});
    }
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(Error{Error::Code::UnknownError, "failed to open theme file: " + path.string()});
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return LoadFromJson(contents.str(), defaults);
}

auto ToJson(WidgetTheme const& theme) -> std::string {
    json root = json::object();
    if (theme.button) {
        root["button"] = to_json_value(*theme.button);
    }
    if (theme.toggle_button) {
        root["toggle_button"] = to_json_value(*theme.toggle_button);
    }
    if (theme.drop_down_menu) {
        root["drop_down_menu"] = to_json_value(*theme.drop_down_menu);
    }
    return root.dump(2);
}

} // namespace ThemeConfig

} // namespace WC::UI
