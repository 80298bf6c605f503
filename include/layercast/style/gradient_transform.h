#pragma once

#include <array>
#include <optional>
#include <string>
#include <vector>

#include "layercast/style/paint.h"

namespace layercast::style {

// Row-major 2x3 affine matrix [[a, c, tx], [b, d, ty]].
using Transform2x3 = std::array<std::array<float, 3>, 2>;

Transform2x3 identity_transform();

// CSS default gradient direction (top to bottom).
inline constexpr float kDefaultGradientAngle = 180.0f;

// Maps a `to <side> [<side>]` keyword direction to a CSS angle in degrees.
// Unknown directions map to kDefaultGradientAngle.
float direction_to_angle(const std::string& direction);

// Parses a CSS <angle> token (deg, grad, rad, turn) into degrees.
std::optional<float> parse_angle(const std::string& token);

// Start/end handles sit 0.5 either side of the unit-square centre along the
// gradient axis; the third handle marks the perpendicular width axis.
HandlePositions linear_handle_positions(float angle_deg);

// Canonical radial placement: centre, right-mid, bottom-mid.
HandlePositions radial_handle_positions();

// [[dx, wx, sx], [dy, wy, sy]] with d = end - start and w = width - start.
Transform2x3 handles_to_transform(const HandlePositions& handles);
// Identity when fewer than three handles are supplied.
Transform2x3 handles_to_transform(const std::vector<Vec2>& handles);

}  // namespace layercast::style
