#include "layercast/style/gradient_transform.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <sstream>
#include <unordered_map>

namespace layercast::style {

namespace {

constexpr float kPi = 3.14159265358979f;

std::string normalize_direction(const std::string& input) {
    std::istringstream iss(input);
    std::string word;
    std::string out;
    while (iss >> word) {
        std::transform(word.begin(), word.end(), word.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

const std::unordered_map<std::string, float>& direction_table() {
    static const std::unordered_map<std::string, float> table = {
        {"to top", 0.0f},
        {"to right", 90.0f},
        {"to bottom", 180.0f},
        {"to left", 270.0f},
        {"to top right", 45.0f},    {"to right top", 45.0f},
        {"to bottom right", 135.0f}, {"to right bottom", 135.0f},
        {"to bottom left", 225.0f},  {"to left bottom", 225.0f},
        {"to top left", 315.0f},     {"to left top", 315.0f},
    };
    return table;
}

}  // namespace

Transform2x3 identity_transform() {
    return {{{1, 0, 0}, {0, 1, 0}}};
}

float direction_to_angle(const std::string& direction) {
    const auto& table = direction_table();
    auto it = table.find(normalize_direction(direction));
    if (it == table.end()) return kDefaultGradientAngle;
    return it->second;
}

std::optional<float> parse_angle(const std::string& token) {
    std::string value = normalize_direction(token);
    if (value.empty()) return std::nullopt;

    char* end = nullptr;
    const float number = std::strtof(value.c_str(), &end);
    if (end == value.c_str()) return std::nullopt;
    const std::string unit(end);

    if (unit == "deg") return number;
    if (unit == "grad") return number * 0.9f;
    if (unit == "rad") return number * 180.0f / kPi;
    if (unit == "turn") return number * 360.0f;
    return std::nullopt;
}

HandlePositions linear_handle_positions(float angle_deg) {
    const float angle_rad = (angle_deg - 90.0f) * (kPi / 180.0f);
    const float c = std::cos(angle_rad);
    const float s = std::sin(angle_rad);

    return {{
        {0.5f - c * 0.5f, 0.5f - s * 0.5f},
        {0.5f + c * 0.5f, 0.5f + s * 0.5f},
        {0.5f - s * 0.5f, 0.5f + c * 0.5f},
    }};
}

HandlePositions radial_handle_positions() {
    return {{{0.5f, 0.5f}, {1.0f, 0.5f}, {0.5f, 1.0f}}};
}

Transform2x3 handles_to_transform(const HandlePositions& handles) {
    const Vec2& start = handles[0];
    const Vec2& end = handles[1];
    const Vec2& width = handles[2];

    const float dx = end.x - start.x;
    const float dy = end.y - start.y;
    const float wx = width.x - start.x;
    const float wy = width.y - start.y;

    return {{{dx, wx, start.x}, {dy, wy, start.y}}};
}

Transform2x3 handles_to_transform(const std::vector<Vec2>& handles) {
    if (handles.size() < 3) return identity_transform();
    return handles_to_transform(HandlePositions{{handles[0], handles[1], handles[2]}});
}

}  // namespace layercast::style
