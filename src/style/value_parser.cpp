#include "layercast/style/value_parser.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <unordered_map>

#include "layercast/style/gradient_transform.h"

namespace layercast::style {

namespace {

struct NamedColor {
    uint8_t r, g, b;
};

const std::unordered_map<std::string, NamedColor>& named_colors() {
    static const std::unordered_map<std::string, NamedColor> colors = {
        {"black",       {0, 0, 0}},
        {"white",       {255, 255, 255}},
        {"red",         {255, 0, 0}},
        {"green",       {0, 128, 0}},
        {"blue",        {0, 0, 255}},
        {"yellow",      {255, 255, 0}},
        {"orange",      {255, 165, 0}},
        {"purple",      {128, 0, 128}},
        {"gray",        {128, 128, 128}},
        {"grey",        {128, 128, 128}},
        {"cyan",        {0, 255, 255}},
        {"aqua",        {0, 255, 255}},
        {"magenta",     {255, 0, 255}},
        {"fuchsia",     {255, 0, 255}},
        {"lime",        {0, 255, 0}},
        {"maroon",      {128, 0, 0}},
        {"navy",        {0, 0, 128}},
        {"olive",       {128, 128, 0}},
        {"teal",        {0, 128, 128}},
        {"silver",      {192, 192, 192}},
        {"pink",        {255, 192, 203}},
        {"brown",       {165, 42, 42}},
        {"gold",        {255, 215, 0}},
        {"indigo",      {75, 0, 130}},
        {"violet",      {238, 130, 238}},
        {"coral",       {255, 127, 80}},
        {"salmon",      {250, 128, 114}},
        {"tomato",      {255, 99, 71}},
        {"crimson",     {220, 20, 60}},
        {"khaki",       {240, 230, 140}},
        {"beige",       {245, 245, 220}},
        {"ivory",       {255, 255, 240}},
        {"lavender",    {230, 230, 250}},
        {"turquoise",   {64, 224, 208}},
        {"skyblue",     {135, 206, 235}},
        {"steelblue",   {70, 130, 180}},
        {"royalblue",   {65, 105, 225}},
        {"slategray",   {112, 128, 144}},
        {"darkgray",    {169, 169, 169}},
        {"lightgray",   {211, 211, 211}},
        {"whitesmoke",  {245, 245, 245}},
        {"gainsboro",   {220, 220, 220}},
        {"darkblue",    {0, 0, 139}},
        {"darkgreen",   {0, 100, 0}},
        {"darkred",     {139, 0, 0}},
        {"rebeccapurple", {102, 51, 153}},
    };
    return colors;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

float clamp01(float v) {
    if (std::isnan(v)) return 0.0f;
    return std::clamp(v, 0.0f, 1.0f);
}

// Whole-token number parse; `suffix` must follow the digits exactly.
std::optional<float> parse_number(const std::string& token, const std::string& suffix = "") {
    if (token.empty()) return std::nullopt;
    char* end = nullptr;
    float number = std::strtof(token.c_str(), &end);
    if (end == token.c_str() || !std::isfinite(number)) return std::nullopt;
    if (std::string(end) != suffix) return std::nullopt;
    return number;
}

std::optional<Rgba> parse_hex(const std::string& hex) {
    for (char c : hex) {
        if (hex_digit(c) < 0) return std::nullopt;
    }
    auto pair = [&](size_t i) { return hex_digit(hex[i]) * 16 + hex_digit(hex[i + 1]); };
    auto single = [&](size_t i) { return hex_digit(hex[i]) * 17; };

    int r = 0, g = 0, b = 0, a = 255;
    if (hex.size() == 3 || hex.size() == 4) {
        r = single(0);
        g = single(1);
        b = single(2);
        if (hex.size() == 4) a = single(3);
    } else if (hex.size() == 6 || hex.size() == 8) {
        r = pair(0);
        g = pair(2);
        b = pair(4);
        if (hex.size() == 8) a = pair(6);
    } else {
        return std::nullopt;
    }
    return Rgba{r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
}

// Channel arguments of rgb()/hsl(): legacy comma syntax or the modern
// space-separated syntax with an optional "/ alpha".
std::vector<std::string> color_function_args(const std::string& inner) {
    std::vector<std::string> args;
    if (inner.find(',') != std::string::npos) {
        args = split_top_level(inner, ',');
        return args;
    }
    std::string spaced;
    for (char c : inner) {
        if (c == '/') {
            spaced += " / ";
        } else {
            spaced += c;
        }
    }
    bool saw_slash = false;
    for (const auto& token : split_tokens(spaced)) {
        if (token == "/") {
            saw_slash = true;
            continue;
        }
        args.push_back(token);
    }
    if (saw_slash && args.size() != 4) args.clear();
    return args;
}

std::optional<float> parse_alpha(const std::string& token) {
    if (auto pct = parse_number(token, "%")) return clamp01(*pct / 100.0f);
    if (auto n = parse_number(token)) return clamp01(*n);
    if (token == "none") return 0.0f;
    return std::nullopt;
}

// 0..255 channel, percentages scale to the same range.
std::optional<float> parse_rgb_channel(const std::string& token) {
    if (auto pct = parse_number(token, "%")) return *pct * 255.0f / 100.0f;
    if (auto n = parse_number(token)) return *n;
    if (token == "none") return 0.0f;
    return std::nullopt;
}

std::optional<float> parse_hue(const std::string& token) {
    if (auto n = parse_number(token)) return *n;
    return parse_angle(token);
}

std::optional<float> parse_percentage(const std::string& token) {
    if (auto pct = parse_number(token, "%")) return *pct / 100.0f;
    if (auto n = parse_number(token)) return *n / 100.0f;
    return std::nullopt;
}

float hue_to_rgb(float p, float q, float t) {
    if (t < 0) t += 1;
    if (t > 1) t -= 1;
    if (t < 1.0f / 6) return p + (q - p) * 6 * t;
    if (t < 1.0f / 2) return q;
    if (t < 2.0f / 3) return p + (q - p) * (2.0f / 3 - t) * 6;
    return p;
}

std::optional<std::string> function_inner(const std::string& value, size_t open) {
    int depth = 0;
    for (size_t i = open; i < value.size(); ++i) {
        if (value[i] == '(') {
            depth++;
        } else if (value[i] == ')') {
            depth--;
            if (depth == 0) return value.substr(open + 1, i - open - 1);
        }
    }
    return std::nullopt;
}

std::optional<Rgba> parse_color_function(const std::string& value) {
    const size_t open = value.find('(');
    if (open == std::string::npos || value.back() != ')') return std::nullopt;
    const std::string name = value.substr(0, open);
    auto inner = function_inner(value, open);
    if (!inner) return std::nullopt;

    auto args = color_function_args(*inner);
    if (args.size() < 3 || args.size() > 4) return std::nullopt;

    float alpha = 1.0f;
    if (args.size() == 4) {
        auto a = parse_alpha(args[3]);
        if (!a) return std::nullopt;
        alpha = *a;
    }

    if (name == "rgb" || name == "rgba") {
        auto r = parse_rgb_channel(args[0]);
        auto g = parse_rgb_channel(args[1]);
        auto b = parse_rgb_channel(args[2]);
        if (!r || !g || !b) return std::nullopt;
        return Rgba{clamp01(*r / 255.0f), clamp01(*g / 255.0f),
                    clamp01(*b / 255.0f), alpha};
    }

    if (name == "hsl" || name == "hsla") {
        auto h = parse_hue(args[0]);
        auto s = parse_percentage(args[1]);
        auto l = parse_percentage(args[2]);
        if (!h || !s || !l) return std::nullopt;
        float hue = std::fmod(*h, 360.0f);
        if (hue < 0) hue += 360.0f;
        hue /= 360.0f;
        const float sat = clamp01(*s);
        const float light = clamp01(*l);
        if (sat == 0) return Rgba{light, light, light, alpha};
        const float q = light < 0.5f ? light * (1 + sat) : light + sat - light * sat;
        const float p = 2 * light - q;
        return Rgba{clamp01(hue_to_rgb(p, q, hue + 1.0f / 3)),
                    clamp01(hue_to_rgb(p, q, hue)),
                    clamp01(hue_to_rgb(p, q, hue - 1.0f / 3)), alpha};
    }

    return std::nullopt;
}

std::optional<Rgba> parse_color_value(const std::string& value) {
    auto& colors = named_colors();
    auto it = colors.find(value);
    if (it != colors.end()) {
        return Rgba{it->second.r / 255.0f, it->second.g / 255.0f, it->second.b / 255.0f, 1.0f};
    }
    if (value[0] == '#') return parse_hex(value.substr(1));
    return parse_color_function(value);
}

struct ParsedStop {
    std::optional<Rgba> color;
    float position = 0;
};

// "rgba(255,0,0,0.5) 50%" or "red". Positions default to an even spread.
ParsedStop parse_color_stop(const std::string& stop, size_t index, size_t total) {
    ParsedStop parsed;
    parsed.position = total > 1 ? static_cast<float>(index) / static_cast<float>(total - 1) : 0.0f;

    auto tokens = split_tokens(stop);
    if (tokens.empty()) return parsed;
    parsed.color = parse_color(tokens[0]);
    for (size_t i = 1; i < tokens.size(); ++i) {
        if (auto pct = parse_number(tokens[i], "%")) {
            parsed.position = *pct / 100.0f;
            break;
        }
    }
    parsed.position = clamp01(parsed.position);
    return parsed;
}

std::vector<GradientStop> parse_color_stops(const std::vector<std::string>& parts, size_t first) {
    std::vector<GradientStop> stops;
    const size_t total = parts.size() - first;
    for (size_t i = 0; i < total; ++i) {
        ParsedStop parsed = parse_color_stop(parts[first + i], i, total);
        if (!parsed.color) continue;
        stops.push_back({*parsed.color, parsed.position});
    }
    return stops;
}

std::optional<Paint> parse_linear_gradient(const std::string& inner) {
    auto parts = split_top_level(inner, ',');
    if (parts.size() < 2) return std::nullopt;

    float angle = kDefaultGradientAngle;
    size_t first_stop = 0;
    if (auto explicit_angle = parse_angle(parts[0])) {
        angle = *explicit_angle;
        first_stop = 1;
    } else if (starts_with(parts[0], "to ")) {
        angle = direction_to_angle(parts[0]);
        first_stop = 1;
    }

    auto stops = parse_color_stops(parts, first_stop);
    if (stops.size() < 2) return std::nullopt;

    Paint paint;
    paint.type = PaintType::GradientLinear;
    paint.stops = std::move(stops);
    const HandlePositions handles = linear_handle_positions(angle);
    paint.handles.assign(handles.begin(), handles.end());
    return paint;
}

bool looks_like_color_stop(const std::string& part) {
    if (starts_with(part, "rgb") || starts_with(part, "hsl") || starts_with(part, "#")) return true;
    auto tokens = split_tokens(part);
    if (tokens.empty()) return false;
    return tokens[0] == "transparent" || parse_color(tokens[0]).has_value();
}

std::optional<Paint> parse_radial_gradient(const std::string& inner) {
    auto parts = split_top_level(inner, ',');
    if (parts.size() < 2) return std::nullopt;

    // Shape, size and position are not modeled.
    const size_t first_stop = looks_like_color_stop(parts[0]) ? 0 : 1;

    auto stops = parse_color_stops(parts, first_stop);
    if (stops.size() < 2) return std::nullopt;

    Paint paint;
    paint.type = PaintType::GradientRadial;
    paint.stops = std::move(stops);
    const HandlePositions handles = radial_handle_positions();
    paint.handles.assign(handles.begin(), handles.end());
    return paint;
}

// Leading numeric value as JavaScript's parseFloat reads it.
std::optional<float> leading_number(const std::string& value) {
    std::string s = trim(value);
    if (s.empty()) return std::nullopt;
    char* end = nullptr;
    float number = std::strtof(s.c_str(), &end);
    if (end == s.c_str() || !std::isfinite(number)) return std::nullopt;
    return number;
}

std::optional<float> parse_shadow_length(const std::string& token) {
    if (auto px = parse_number(token, "px")) return px;
    return parse_number(token);
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

}  // namespace

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\n\r\f");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r\f");
    return s.substr(start, end - start + 1);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> split_top_level(const std::string& input, char delimiter) {
    std::vector<std::string> parts;
    int depth = 0;
    std::string current;
    for (char c : input) {
        if (c == '(') depth++;
        else if (c == ')' && depth > 0) depth--;
        if (c == delimiter && depth == 0) {
            std::string piece = trim(current);
            if (!piece.empty()) parts.push_back(piece);
            current.clear();
        } else {
            current += c;
        }
    }
    std::string piece = trim(current);
    if (!piece.empty()) parts.push_back(piece);
    return parts;
}

std::vector<std::string> split_tokens(const std::string& input) {
    std::vector<std::string> tokens;
    int depth = 0;
    std::string current;
    for (char c : input) {
        if (c == '(') depth++;
        else if (c == ')' && depth > 0) depth--;
        if (depth == 0 && std::isspace(static_cast<unsigned char>(c))) {
            if (!current.empty()) tokens.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) tokens.push_back(current);
    return tokens;
}

std::optional<Rgba> parse_color(const std::string& input) {
    std::string value = to_lower(trim(input));
    if (value.empty() || value == "transparent") return std::nullopt;

    auto color = parse_color_value(value);
    if (!color) return std::nullopt;
    if (color->r == 0 && color->g == 0 && color->b == 0 && color->a == 0) return std::nullopt;
    return color;
}

std::optional<Paint> parse_gradient(const std::string& background_image) {
    std::string value = to_lower(trim(background_image));
    if (value.empty() || value == "none") return std::nullopt;

    static const std::string kLinear = "linear-gradient(";
    static const std::string kRadial = "radial-gradient(";

    size_t pos = value.find(kLinear);
    if (pos != std::string::npos) {
        auto inner = function_inner(value, pos + kLinear.size() - 1);
        if (!inner) return std::nullopt;
        return parse_linear_gradient(*inner);
    }

    pos = value.find(kRadial);
    if (pos != std::string::npos) {
        auto inner = function_inner(value, pos + kRadial.size() - 1);
        if (!inner) return std::nullopt;
        return parse_radial_gradient(*inner);
    }

    return std::nullopt;
}

std::vector<Effect> parse_box_shadow(const std::string& box_shadow) {
    std::vector<Effect> effects;
    std::string value = to_lower(trim(box_shadow));
    if (value.empty() || value == "none") return effects;

    for (const auto& clause : split_top_level(value, ',')) {
        bool inset = false;
        bool saw_color = false;
        std::optional<Rgba> color;
        std::vector<float> lengths;

        for (const auto& token : split_tokens(clause)) {
            if (token == "inset") {
                inset = true;
            } else if (auto length = parse_shadow_length(token)) {
                lengths.push_back(*length);
            } else if (!saw_color) {
                saw_color = true;
                color = parse_color(token);
            }
        }

        if (lengths.size() < 2) continue;

        Effect effect;
        effect.type = inset ? EffectType::InnerShadow : EffectType::DropShadow;
        effect.color = color.value_or(Rgba{0, 0, 0, 0.25f});
        effect.offset = {lengths[0], lengths[1]};
        effect.radius = lengths.size() > 2 ? std::max(lengths[2], 0.0f) : 0.0f;
        effect.spread = lengths.size() > 3 ? lengths[3] : 0.0f;
        effect.visible = true;
        effects.push_back(effect);
    }
    return effects;
}

int parse_font_weight(const std::string& weight) {
    std::string value = to_lower(trim(weight));
    if (value == "bold" || value == "bolder") return 700;
    if (value == "lighter") return 300;
    if (value == "normal") return 400;
    int numeric = std::atoi(value.c_str());
    return numeric > 0 ? numeric : 400;
}

std::string font_style_name(int weight, bool italic) {
    std::string style;
    if (weight <= 100) style = "Thin";
    else if (weight <= 200) style = "ExtraLight";
    else if (weight <= 300) style = "Light";
    else if (weight <= 400) style = "Regular";
    else if (weight <= 500) style = "Medium";
    else if (weight <= 600) style = "SemiBold";
    else if (weight <= 700) style = "Bold";
    else if (weight <= 800) style = "ExtraBold";
    else style = "Black";

    if (italic) style += " Italic";
    return style;
}

std::string font_style_from_css(const std::string& weight, const std::string& font_style) {
    std::string style = to_lower(trim(font_style));
    const bool italic = starts_with(style, "italic") || starts_with(style, "oblique");
    return font_style_name(parse_font_weight(weight), italic);
}

std::string primary_font_family(const std::string& font_family) {
    std::string first = font_family.substr(0, font_family.find(','));
    first.erase(std::remove_if(first.begin(), first.end(),
                               [](char c) { return c == '"' || c == '\''; }),
                first.end());
    return trim(first);
}

TextAlign map_text_align(const std::string& text_align) {
    std::string value = to_lower(trim(text_align));
    if (value == "right" || value == "end") return TextAlign::Right;
    if (value == "center") return TextAlign::Center;
    if (value == "justify") return TextAlign::Justified;
    return TextAlign::Left;
}

TextDecoration map_text_decoration(const std::string& decoration_line) {
    std::string value = to_lower(decoration_line);
    if (value.find("underline") != std::string::npos) return TextDecoration::Underline;
    if (value.find("line-through") != std::string::npos) return TextDecoration::Strikethrough;
    return TextDecoration::None;
}

LineHeight parse_line_height(const std::string& line_height) {
    std::string value = to_lower(trim(line_height));
    if (value == "normal") return LineHeight::auto_height();
    auto px = leading_number(value);
    if (!px) return LineHeight::auto_height();
    return LineHeight::pixels(*px);
}

std::optional<float> parse_px(const std::string& value) {
    return leading_number(value);
}

std::optional<std::string> extract_url(const std::string& value) {
    size_t pos = to_lower(value).find("url(");
    if (pos == std::string::npos) return std::nullopt;
    size_t start = pos + 4;
    size_t close = value.find(')', start);
    if (close == std::string::npos) return std::nullopt;

    std::string target = trim(value.substr(start, close - start));
    if (target.size() >= 2 && (target.front() == '"' || target.front() == '\'') &&
        target.back() == target.front()) {
        target = target.substr(1, target.size() - 2);
    }
    if (target.empty()) return std::nullopt;
    return target;
}

std::string unquote_css_string(const std::string& value) {
    std::string s = trim(value);
    if (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(0, 1);
    if (!s.empty() && (s.back() == '"' || s.back() == '\'') &&
        !(s.size() >= 2 && s[s.size() - 2] == '\\')) {
        s.pop_back();
    }

    std::string out;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\' || i + 1 >= s.size()) {
            out += s[i];
            continue;
        }
        size_t j = i + 1;
        uint32_t cp = 0;
        size_t digits = 0;
        while (j < s.size() && digits < 6 && hex_digit(s[j]) >= 0) {
            cp = cp * 16 + static_cast<uint32_t>(hex_digit(s[j]));
            ++j;
            ++digits;
        }
        if (digits > 0) {
            append_utf8(out, cp);
            if (j < s.size() && s[j] == ' ') ++j;
            i = j - 1;
        } else if (s[j] == '\n') {
            i = j;
        } else {
            out += s[j];
            i = j;
        }
    }
    return out;
}

}  // namespace layercast::style
