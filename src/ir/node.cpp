#include "layercast/ir/node.h"

namespace layercast::ir {

const char* node_type_name(NodeType type) {
    switch (type) {
        case NodeType::Frame: return "FRAME";
        case NodeType::Text: return "TEXT";
        case NodeType::Svg: return "SVG";
        case NodeType::Image: return "IMAGE";
    }
    return "FRAME";
}

std::optional<NodeType> node_type_from_name(const std::string& name) {
    if (name == "FRAME") return NodeType::Frame;
    if (name == "TEXT") return NodeType::Text;
    if (name == "SVG") return NodeType::Svg;
    if (name == "IMAGE") return NodeType::Image;
    return std::nullopt;
}

Node Node::make(NodeType type) {
    Node node;
    switch (type) {
        case NodeType::Frame: node.payload = FrameData{}; break;
        case NodeType::Text: node.payload = TextData{}; break;
        case NodeType::Svg: node.payload = SvgData{}; break;
        case NodeType::Image: node.payload = ImageData{}; break;
    }
    return node;
}

std::size_t count_nodes(const Node& node) {
    std::size_t count = 1;
    for (const auto& child : node.children) count += count_nodes(child);
    return count;
}

std::size_t count_nodes(const Document& document) {
    return document.root_node ? count_nodes(*document.root_node) : 0;
}

}  // namespace layercast::ir
