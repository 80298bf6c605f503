#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "layercast/core/config.h"
#include "layercast/core/diagnostics.h"
#include "layercast/dom/rendered_node.h"
#include "layercast/ir/node.h"
#include "layercast/style/paint.h"

namespace layercast::extract {

struct ExtractOptions {
    // Used when the snapshot does not record its viewport.
    float fallback_viewport_width = static_cast<float>(core::config::kDefaultViewportWidth);
    float fallback_viewport_height = static_cast<float>(core::config::kDefaultViewportHeight);
    bool capture_pseudo_elements = true;
};

struct ExtractStats {
    std::size_t node_count = 0;
    std::size_t pruned_count = 0;
    std::size_t pseudo_count = 0;
    std::size_t resolved_images = 0;
};

struct ExtractResult {
    bool ok = false;
    ir::Document document;
    ExtractStats stats;
    std::string message;
};

// Walks the rendered document depth-first and produces the IR document.
// Fails only when the root element itself is not rendered.
ExtractResult extract_document(const dom::RenderedDocument& document,
                               const ExtractOptions& options = {},
                               core::DiagnosticEmitter* diagnostics = nullptr);

enum class ElementKind { Svg, Image, Text, Frame };

// display:none, visibility:hidden and boxes empty in both axes are not rendered.
bool is_rendered(const dom::Node& element);
ElementKind classify_element(const dom::Node& element);

// tag#id, tag.class1.class2 or tag.
std::string node_name(const dom::Node& element);

struct BorderData {
    std::vector<style::Paint> strokes;
    float weight = 0;
    style::StrokeAlign align = style::StrokeAlign::Inside;
};

// Maximum width across the four sides; the first side with a usable color
// supplies the stroke paint.
std::optional<BorderData> extract_borders(const dom::StyleMap& style);

// Set only when at least one corner is rounded.
std::optional<ir::CornerRadii> extract_corner_radii(const dom::StyleMap& style);

// Solid background color followed by a background-image gradient.
std::vector<style::Paint> extract_background(const dom::StyleMap& style);

}  // namespace layercast::extract
