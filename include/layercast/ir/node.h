#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "layercast/style/paint.h"

namespace layercast::ir {

enum class NodeType { Frame, Text, Svg, Image };

// FRAME, TEXT, SVG, IMAGE
const char* node_type_name(NodeType type);
std::optional<NodeType> node_type_from_name(const std::string& name);

struct FrameData {
    bool clips_content = false;
    std::string background_image_url;
    std::string background_image_base64;
};

struct TextData {
    std::string characters;
    float font_size = 16;
    std::string font_family;
    std::string font_weight;       // raw CSS value
    std::string font_style;        // raw CSS value
    std::string figma_font_style;  // resolved style name, empty means Regular
    style::LineHeight line_height;
    float letter_spacing = 0;
    style::TextAlign text_align = style::TextAlign::Left;
    style::TextDecoration text_decoration = style::TextDecoration::None;
    // Paints behind the text, distinct from the text color in Node::fills.
    std::vector<style::Paint> background_fills;
};

struct SvgData {
    std::string svg_content;
};

// image_base64 takes precedence when both are set.
struct ImageData {
    std::string image_url;
    std::string image_base64;
};

using NodePayload = std::variant<FrameData, TextData, SvgData, ImageData>;

struct CornerRadii {
    float top_left = 0;
    float top_right = 0;
    float bottom_right = 0;
    float bottom_left = 0;

    bool any_nonzero() const {
        return top_left != 0 || top_right != 0 || bottom_right != 0 || bottom_left != 0;
    }
};

struct Node {
    std::string name;
    // Offset from the parent's origin.
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
    float opacity = 1;

    std::vector<style::Paint> fills;
    std::vector<style::Paint> strokes;
    float stroke_weight = 0;
    std::optional<style::StrokeAlign> stroke_align;
    std::optional<CornerRadii> corner_radii;
    std::vector<style::Effect> effects;

    NodePayload payload;
    // Paint order. Only frames carry children.
    std::vector<Node> children;

    NodeType type() const { return static_cast<NodeType>(payload.index()); }
    bool is_frame() const { return std::holds_alternative<FrameData>(payload); }

    template <typename T>
    T* get_if() { return std::get_if<T>(&payload); }
    template <typename T>
    const T* get_if() const { return std::get_if<T>(&payload); }

    static Node make(NodeType type);
};

struct Document {
    std::string page_title;
    float viewport_width = 0;
    float viewport_height = 0;
    float full_height = 0;
    std::optional<Node> root_node;
};

std::size_t count_nodes(const Node& node);
std::size_t count_nodes(const Document& document);

}  // namespace layercast::ir
