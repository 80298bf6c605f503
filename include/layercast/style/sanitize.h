#pragma once

#include <string>
#include <vector>

#include "layercast/style/paint.h"

namespace layercast::style {

// Clamps to [0, 1]; NaN becomes 0.
float clamp_unit(float value);

// Sanitizers are idempotent: a sanitized value passes through unchanged.
Paint sanitize_paint(const Paint& paint);
std::vector<Paint> sanitize_paints(const std::vector<Paint>& paints);

Effect sanitize_effect(const Effect& effect);
std::vector<Effect> sanitize_effects(const std::vector<Effect>& effects);

// Maps CSS generic and system families onto families a design tool ships
// with. Empty input yields the fallback family.
std::string sanitize_font_family(const std::string& family);

}  // namespace layercast::style
