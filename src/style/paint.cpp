#include "layercast/style/paint.h"

namespace layercast::style {

const char* paint_type_name(PaintType type) {
    switch (type) {
        case PaintType::Solid:          return "SOLID";
        case PaintType::GradientLinear: return "GRADIENT_LINEAR";
        case PaintType::GradientRadial: return "GRADIENT_RADIAL";
    }
    return "SOLID";
}

const char* effect_type_name(EffectType type) {
    switch (type) {
        case EffectType::DropShadow:  return "DROP_SHADOW";
        case EffectType::InnerShadow: return "INNER_SHADOW";
    }
    return "DROP_SHADOW";
}

const char* stroke_align_name(StrokeAlign align) {
    switch (align) {
        case StrokeAlign::Inside:  return "INSIDE";
        case StrokeAlign::Outside: return "OUTSIDE";
        case StrokeAlign::Center:  return "CENTER";
    }
    return "INSIDE";
}

const char* text_align_name(TextAlign align) {
    switch (align) {
        case TextAlign::Left:      return "LEFT";
        case TextAlign::Right:     return "RIGHT";
        case TextAlign::Center:    return "CENTER";
        case TextAlign::Justified: return "JUSTIFIED";
    }
    return "LEFT";
}

const char* text_decoration_name(TextDecoration decoration) {
    switch (decoration) {
        case TextDecoration::None:          return "NONE";
        case TextDecoration::Underline:     return "UNDERLINE";
        case TextDecoration::Strikethrough: return "STRIKETHROUGH";
    }
    return "NONE";
}

std::optional<PaintType> paint_type_from_name(const std::string& name) {
    if (name == "SOLID") return PaintType::Solid;
    if (name == "GRADIENT_LINEAR") return PaintType::GradientLinear;
    if (name == "GRADIENT_RADIAL") return PaintType::GradientRadial;
    return std::nullopt;
}

std::optional<EffectType> effect_type_from_name(const std::string& name) {
    if (name == "DROP_SHADOW") return EffectType::DropShadow;
    if (name == "INNER_SHADOW") return EffectType::InnerShadow;
    return std::nullopt;
}

std::optional<StrokeAlign> stroke_align_from_name(const std::string& name) {
    if (name == "INSIDE") return StrokeAlign::Inside;
    if (name == "OUTSIDE") return StrokeAlign::Outside;
    if (name == "CENTER") return StrokeAlign::Center;
    return std::nullopt;
}

std::optional<TextAlign> text_align_from_name(const std::string& name) {
    if (name == "LEFT") return TextAlign::Left;
    if (name == "RIGHT") return TextAlign::Right;
    if (name == "CENTER") return TextAlign::Center;
    if (name == "JUSTIFIED") return TextAlign::Justified;
    return std::nullopt;
}

std::optional<TextDecoration> text_decoration_from_name(const std::string& name) {
    if (name == "NONE") return TextDecoration::None;
    if (name == "UNDERLINE") return TextDecoration::Underline;
    if (name == "STRIKETHROUGH") return TextDecoration::Strikethrough;
    return std::nullopt;
}

bool Paint::operator==(const Paint& other) const {
    if (type != other.type) return false;
    if (type == PaintType::Solid) {
        return color == other.color && opacity == other.opacity;
    }
    return stops == other.stops && handles == other.handles;
}

}  // namespace layercast::style
