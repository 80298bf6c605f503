#include "layercast/dom/rendered_node.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace layercast::dom {

namespace {

const std::string kEmpty;

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f';
}

void collect_text(const Node& node, std::string& output) {
    if (node.is_text()) {
        for (char c : node.text_content) output += c == '\n' ? ' ' : c;
        return;
    }
    if (node.tag_name == "br") {
        output += '\n';
        return;
    }
    for (const auto& child : node.children) {
        collect_text(*child, output);
    }
}

// Collapses whitespace runs to one space; explicit line breaks survive.
std::string collapse_whitespace(const std::string& text) {
    std::string out;
    bool pending_space = false;
    for (char c : text) {
        if (c == '\n') {
            out += '\n';
            pending_space = false;
        } else if (is_space(c)) {
            pending_space = true;
        } else {
            if (pending_space && !out.empty() && out.back() != '\n') out += ' ';
            pending_space = false;
            out += c;
        }
    }
    return out;
}

std::string escape_markup(const std::string& text, bool attribute) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"':
                if (attribute) {
                    out += "&quot;";
                } else {
                    out += c;
                }
                break;
            default: out += c; break;
        }
    }
    return out;
}

void serialize_subtree(const Node& node, std::string& output) {
    if (node.is_text()) {
        output += escape_markup(node.text_content, false);
        return;
    }
    output += "<" + node.tag_name;
    for (const auto& [key, value] : node.attributes) {
        output += " " + key + "=\"" + escape_markup(value, true) + "\"";
    }
    if (node.children.empty()) {
        output += "/>";
        return;
    }
    output += ">";
    for (const auto& child : node.children) {
        if (child) serialize_subtree(*child, output);
    }
    output += "</" + node.tag_name + ">";
}

float number_field(const json::Value& object, const char* key, float fallback = 0) {
    const json::Value* v = object.find(key);
    if (v == nullptr || !v->is_number()) return fallback;
    const double n = v->as_number();
    return std::isfinite(n) ? static_cast<float>(n) : fallback;
}

// Style and attribute values are normally strings; numbers and booleans are
// accepted and written back as JSON text.
std::string scalar_text(const json::Value& value) {
    if (value.is_string()) return value.as_string();
    if (value.is_number() || value.is_bool()) return json::serialize(value);
    return "";
}

StyleMap read_string_map(const json::Value* value, bool lowercase_keys) {
    StyleMap map;
    if (value == nullptr || !value->is_object()) return map;
    for (const auto& [key, item] : value->members()) {
        if (item.is_null()) continue;
        map[lowercase_keys ? to_lower(key) : key] = scalar_text(item);
    }
    return map;
}

std::unique_ptr<Node> read_element(const json::Value& value, const std::string& where,
                                   std::vector<std::string>& warnings) {
    auto node = make_element(to_lower(value.find("tag")->as_string()));

    node->attributes = read_string_map(value.find("attributes"), false);
    node->style = read_string_map(value.find("style"), true);

    if (const json::Value* rect = value.find("rect"); rect != nullptr && rect->is_object()) {
        node->rect.x = number_field(*rect, "x");
        node->rect.y = number_field(*rect, "y");
        node->rect.width = number_field(*rect, "width");
        node->rect.height = number_field(*rect, "height");
    } else {
        warnings.push_back(where + ": missing rect, assuming an empty box");
    }

    if (const json::Value* pseudo = value.find("pseudo"); pseudo != nullptr && pseudo->is_object()) {
        for (const auto& [name, style] : pseudo->members()) {
            std::string key = to_lower(name);
            key.erase(0, key.find_first_not_of(':'));
            node->pseudo_styles["::" + key] = read_string_map(&style, true);
        }
    }

    if (const json::Value* text = value.find("innerText"); text != nullptr && text->is_string()) {
        node->captured_inner_text = text->as_string();
    }
    if (const json::Value* html = value.find("outerHTML"); html != nullptr && html->is_string()) {
        node->captured_outer_html = html->as_string();
    }

    const json::Value* children = value.find("children");
    if (children == nullptr || !children->is_array()) return node;

    std::size_t index = 0;
    for (const auto& child : children->items()) {
        const std::string child_where = where + ".children[" + std::to_string(index++) + "]";
        if (child.is_string()) {
            node->append_child(make_text(child.as_string()));
            continue;
        }
        if (!child.is_object()) {
            warnings.push_back(child_where + ": not an object, skipped");
            continue;
        }
        if (const json::Value* text = child.find("text"); text != nullptr && text->is_string()) {
            node->append_child(make_text(text->as_string()));
            continue;
        }
        const json::Value* tag = child.find("tag");
        if (tag == nullptr || !tag->is_string() || tag->as_string().empty()) {
            warnings.push_back(child_where + ": neither an element nor a text node, skipped");
            continue;
        }
        node->append_child(read_element(child, child_where, warnings));
    }
    return node;
}

}  // namespace

const std::string& Node::style_value(const std::string& property) const {
    auto it = style.find(property);
    return it == style.end() ? kEmpty : it->second;
}

const std::string& Node::attribute(const std::string& name) const {
    auto it = attributes.find(name);
    return it == attributes.end() ? kEmpty : it->second;
}

const StyleMap* Node::pseudo_style(const std::string& pseudo) const {
    auto it = pseudo_styles.find(pseudo);
    return it == pseudo_styles.end() ? nullptr : &it->second;
}

Node* Node::append_child(std::unique_ptr<Node> child) {
    child->parent = this;
    children.push_back(std::move(child));
    return children.back().get();
}

std::unique_ptr<Node> make_element(const std::string& tag) {
    return std::make_unique<Node>(NodeType::Element, tag);
}

std::unique_ptr<Node> make_text(const std::string& text) {
    auto node = std::make_unique<Node>(NodeType::Text);
    node->text_content = text;
    return node;
}

std::string inner_text(const Node& node) {
    if (node.captured_inner_text) return *node.captured_inner_text;
    std::string text;
    collect_text(node, text);
    return collapse_whitespace(text);
}

std::string serialize_markup(const Node& node) {
    if (!node.captured_outer_html.empty()) return node.captured_outer_html;
    std::string output;
    serialize_subtree(node, output);
    return output;
}

SnapshotLoadResult snapshot_from_json(const json::Value& value) {
    SnapshotLoadResult result;
    if (!value.is_object()) {
        result.error = "snapshot is not a JSON object";
        return result;
    }

    const json::Value* root = value.find("root");
    const json::Value* root_tag = root != nullptr ? root->find("tag") : nullptr;
    if (root_tag == nullptr || !root_tag->is_string() || root_tag->as_string().empty()) {
        result.error = "snapshot has no root element";
        return result;
    }

    RenderedDocument& doc = result.document;
    if (const json::Value* title = value.find("title")) doc.title = title->as_string();
    if (const json::Value* url = value.find("url")) doc.url = url->as_string();
    if (const json::Value* viewport = value.find("viewport");
        viewport != nullptr && viewport->is_object()) {
        doc.viewport_width = number_field(*viewport, "width");
        doc.viewport_height = number_field(*viewport, "height");
    }

    doc.root = read_element(*root, "root", result.warnings);
    doc.scroll_height = number_field(value, "scrollHeight", doc.root->rect.height);
    result.ok = true;
    return result;
}

SnapshotLoadResult load_snapshot(const std::string& text) {
    json::ParseResult parsed = json::parse(text);
    if (!parsed.ok) {
        SnapshotLoadResult result;
        result.error = "JSON parse error at offset " + std::to_string(parsed.error_offset) + ": " +
                       parsed.error;
        return result;
    }
    return snapshot_from_json(parsed.value);
}

}  // namespace layercast::dom
