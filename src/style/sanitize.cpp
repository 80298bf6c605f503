#include "layercast/style/sanitize.h"

#include <algorithm>
#include <cmath>
#include <unordered_map>

#include "layercast/core/config.h"
#include "layercast/style/value_parser.h"

namespace layercast::style {

namespace {

float finite_or_zero(float value) {
    return std::isfinite(value) ? value : 0.0f;
}

Rgba sanitize_rgba(const Rgba& c) {
    return {clamp_unit(c.r), clamp_unit(c.g), clamp_unit(c.b), clamp_unit(c.a)};
}

const std::unordered_map<std::string, std::string>& system_font_map() {
    static const std::unordered_map<std::string, std::string> fonts = {
        {"system-ui", "Inter"},
        {"-apple-system", "Inter"},
        {"BlinkMacSystemFont", "Inter"},
        {"Segoe UI", "Inter"},
        {"ui-sans-serif", "Inter"},
        {"sans-serif", "Inter"},
        {"ui-serif", "Georgia"},
        {"serif", "Georgia"},
        {"ui-monospace", "Roboto Mono"},
        {"monospace", "Roboto Mono"},
    };
    return fonts;
}

}  // namespace

float clamp_unit(float value) {
    if (std::isnan(value)) return 0.0f;
    return std::clamp(value, 0.0f, 1.0f);
}

Paint sanitize_paint(const Paint& paint) {
    Paint out = paint;
    if (!paint.is_gradient()) {
        out.color = {clamp_unit(paint.color.r), clamp_unit(paint.color.g), clamp_unit(paint.color.b)};
        out.opacity = clamp_unit(paint.opacity);
        out.stops.clear();
        out.handles.clear();
        return out;
    }
    for (auto& stop : out.stops) {
        stop.color = sanitize_rgba(stop.color);
        stop.position = clamp_unit(stop.position);
    }
    for (auto& handle : out.handles) {
        handle = {finite_or_zero(handle.x), finite_or_zero(handle.y)};
    }
    return out;
}

std::vector<Paint> sanitize_paints(const std::vector<Paint>& paints) {
    std::vector<Paint> out;
    out.reserve(paints.size());
    for (const auto& paint : paints) out.push_back(sanitize_paint(paint));
    return out;
}

Effect sanitize_effect(const Effect& effect) {
    Effect out = effect;
    out.color = sanitize_rgba(effect.color);
    out.offset = {finite_or_zero(effect.offset.x), finite_or_zero(effect.offset.y)};
    out.radius = std::max(finite_or_zero(effect.radius), 0.0f);
    out.spread = finite_or_zero(effect.spread);
    out.visible = true;
    return out;
}

std::vector<Effect> sanitize_effects(const std::vector<Effect>& effects) {
    std::vector<Effect> out;
    out.reserve(effects.size());
    for (const auto& effect : effects) out.push_back(sanitize_effect(effect));
    return out;
}

std::string sanitize_font_family(const std::string& family) {
    std::string cleaned = primary_font_family(family);
    if (cleaned.empty()) return core::config::kFallbackFontFamily;

    const auto& fonts = system_font_map();
    auto it = fonts.find(cleaned);
    if (it != fonts.end()) return it->second;
    return cleaned;
}

}  // namespace layercast::style
