#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "layercast/json/json.h"

namespace layercast::dom {

enum class NodeType {
    Element,
    Text,
};

// Viewport-relative bounding box, as getBoundingClientRect reports it.
struct Rect {
    float x = 0;
    float y = 0;
    float width = 0;
    float height = 0;
};

// Computed style keyed by CSS property name ("background-color").
using StyleMap = std::map<std::string, std::string>;

struct Node {
    NodeType type = NodeType::Element;
    std::string tag_name;  // lowercase
    std::map<std::string, std::string> attributes;
    std::string text_content;  // text nodes only

    Rect rect;
    StyleMap style;
    std::map<std::string, StyleMap> pseudo_styles;  // "::before", "::after"
    std::optional<std::string> captured_inner_text;
    std::string captured_outer_html;

    std::vector<std::unique_ptr<Node>> children;
    Node* parent = nullptr;

    Node() = default;
    explicit Node(NodeType node_type) : type(node_type) {}
    Node(NodeType node_type, std::string tag) : type(node_type), tag_name(std::move(tag)) {}

    bool is_element() const { return type == NodeType::Element; }
    bool is_text() const { return type == NodeType::Text; }

    // Empty string when absent.
    const std::string& style_value(const std::string& property) const;
    const std::string& attribute(const std::string& name) const;
    const StyleMap* pseudo_style(const std::string& pseudo) const;

    Node* append_child(std::unique_ptr<Node> child);
};

std::unique_ptr<Node> make_element(const std::string& tag);
std::unique_ptr<Node> make_text(const std::string& text);

struct RenderedDocument {
    std::string title;
    std::string url;  // base for relative resource URLs
    float viewport_width = 0;
    float viewport_height = 0;
    float scroll_height = 0;
    std::unique_ptr<Node> root;
};

// The captured innerText when present, otherwise the text of the subtree with
// whitespace collapsed and <br> read as a line break.
std::string inner_text(const Node& node);

// The captured outerHTML when present, otherwise markup serialized from the
// subtree.
std::string serialize_markup(const Node& node);

struct SnapshotLoadResult {
    bool ok = false;
    RenderedDocument document;
    std::string error;
    std::vector<std::string> warnings;
};

SnapshotLoadResult snapshot_from_json(const json::Value& value);
SnapshotLoadResult load_snapshot(const std::string& text);

}  // namespace layercast::dom
