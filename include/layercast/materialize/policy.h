#pragma once

#include <string>
#include <vector>

#include "layercast/scene/host.h"
#include "layercast/style/paint.h"

namespace layercast::materialize {

// Font fallback order: (family, style), (family, Regular),
// (fallback, style), (fallback, Regular). Always four entries.
std::vector<scene::FontName> font_candidates(const std::string& family, const std::string& style,
                                             const std::string& fallback_family);

enum class ImageSource { Base64, Url };

const char* image_source_name(ImageSource source);

// Sources tried for an IMAGE node, first success wins.
const std::vector<ImageSource>& image_source_policy();

// Placeholder fills for nodes whose content could not be built.
struct Placeholder {
    style::Rgb color;
    const char* name_suffix;  // appended to the layer name, may be empty
};

inline constexpr Placeholder kMissingSvgPlaceholder{{0.8f, 0.8f, 0.8f}, " (missing SVG)"};
inline constexpr Placeholder kSvgParseErrorPlaceholder{{0.9f, 0.7f, 0.7f}, " (SVG parse error)"};
inline constexpr Placeholder kImageLoadErrorPlaceholder{{0.85f, 0.85f, 0.9f}, " (image load error)"};
inline constexpr Placeholder kNoImageSourcePlaceholder{{0.9f, 0.9f, 0.9f}, ""};

}  // namespace layercast::materialize
