#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace layercast::style {

// Color channels are on the 0..1 scale.
struct Rgb {
    float r = 0, g = 0, b = 0;

    bool operator==(const Rgb& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const Rgb& other) const { return !(*this == other); }
};

struct Rgba {
    float r = 0, g = 0, b = 0, a = 1;

    Rgb rgb() const { return {r, g, b}; }

    bool operator==(const Rgba& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Rgba& other) const { return !(*this == other); }
};

struct Vec2 {
    float x = 0, y = 0;

    bool operator==(const Vec2& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Vec2& other) const { return !(*this == other); }
};

// Gradient placement: start, end, width-axis handle in unit-square space.
using HandlePositions = std::array<Vec2, 3>;

struct GradientStop {
    Rgba color;
    float position = 0;

    bool operator==(const GradientStop& other) const {
        return color == other.color && position == other.position;
    }
};

enum class PaintType { Solid, GradientLinear, GradientRadial };

const char* paint_type_name(PaintType type);

// SOLID uses color/opacity; the gradient kinds use stops/handles. Parsed
// gradients always carry three handles, decoded documents may carry fewer.
struct Paint {
    PaintType type = PaintType::Solid;
    Rgb color;
    float opacity = 1;
    std::vector<GradientStop> stops;
    std::vector<Vec2> handles;

    bool is_gradient() const { return type != PaintType::Solid; }

    static Paint solid(const Rgba& rgba) {
        Paint p;
        p.type = PaintType::Solid;
        p.color = rgba.rgb();
        p.opacity = rgba.a;
        return p;
    }

    bool operator==(const Paint& other) const;
    bool operator!=(const Paint& other) const { return !(*this == other); }
};

enum class EffectType { DropShadow, InnerShadow };

const char* effect_type_name(EffectType type);

struct Effect {
    EffectType type = EffectType::DropShadow;
    Rgba color;
    Vec2 offset;
    float radius = 0;
    float spread = 0;
    bool visible = true;

    bool operator==(const Effect& other) const {
        return type == other.type && color == other.color && offset == other.offset &&
               radius == other.radius && spread == other.spread && visible == other.visible;
    }
};

enum class StrokeAlign { Inside, Outside, Center };
enum class TextAlign { Left, Right, Center, Justified };
enum class TextDecoration { None, Underline, Strikethrough };

const char* stroke_align_name(StrokeAlign align);
const char* text_align_name(TextAlign align);
const char* text_decoration_name(TextDecoration decoration);

std::optional<PaintType> paint_type_from_name(const std::string& name);
std::optional<EffectType> effect_type_from_name(const std::string& name);
std::optional<StrokeAlign> stroke_align_from_name(const std::string& name);
std::optional<TextAlign> text_align_from_name(const std::string& name);
std::optional<TextDecoration> text_decoration_from_name(const std::string& name);

struct LineHeight {
    enum class Unit { Auto, Pixels };
    Unit unit = Unit::Auto;
    float value = 0;

    static LineHeight auto_height() { return {}; }
    static LineHeight pixels(float v) { return {Unit::Pixels, v}; }

    bool is_auto() const { return unit == Unit::Auto; }
    bool operator==(const LineHeight& other) const {
        return unit == other.unit && (unit == Unit::Auto || value == other.value);
    }
};

}  // namespace layercast::style
