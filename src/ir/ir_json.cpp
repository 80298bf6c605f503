#include "layercast/ir/ir_json.h"

#include <cmath>
#include <variant>

namespace layercast::ir {

namespace {

using json::Value;
using style::Effect;
using style::Paint;

float number_field(const Value& object, const char* key, float fallback = 0) {
    const Value* v = object.find(key);
    if (v == nullptr || !v->is_number()) return fallback;
    const double n = v->as_number();
    return std::isfinite(n) ? static_cast<float>(n) : fallback;
}

std::string string_field(const Value& object, const char* key) {
    const Value* v = object.find(key);
    return v != nullptr ? v->as_string() : std::string();
}

Value rgb_to_json(const style::Rgb& c) {
    Value out = Value::object();
    out.set("r", static_cast<double>(c.r));
    out.set("g", static_cast<double>(c.g));
    out.set("b", static_cast<double>(c.b));
    return out;
}

Value rgba_to_json(const style::Rgba& c) {
    Value out = rgb_to_json(c.rgb());
    out.set("a", static_cast<double>(c.a));
    return out;
}

Value vec2_to_json(const style::Vec2& v) {
    Value out = Value::object();
    out.set("x", static_cast<double>(v.x));
    out.set("y", static_cast<double>(v.y));
    return out;
}

style::Rgba rgba_from_json(const Value* value) {
    style::Rgba c;
    if (value == nullptr || !value->is_object()) return c;
    c.r = number_field(*value, "r");
    c.g = number_field(*value, "g");
    c.b = number_field(*value, "b");
    c.a = number_field(*value, "a", 1);
    return c;
}

style::Vec2 vec2_from_json(const Value& value) {
    return {number_field(value, "x"), number_field(value, "y")};
}

Value paints_to_json(const std::vector<Paint>& paints) {
    Value out = Value::array();
    for (const auto& paint : paints) out.push_back(paint_to_json(paint));
    return out;
}

std::vector<Paint> paints_from_json(const Value* value, const std::string& where,
                                    std::vector<std::string>& warnings) {
    std::vector<Paint> paints;
    if (value == nullptr || value->is_null()) return paints;
    if (!value->is_array()) {
        warnings.push_back(where + ": expected an array of paints");
        return paints;
    }
    for (const auto& item : value->items()) {
        std::string error;
        auto paint = paint_from_json(item, error);
        if (paint) {
            paints.push_back(std::move(*paint));
        } else {
            warnings.push_back(where + ": " + error);
        }
    }
    return paints;
}

Value line_height_to_json(const style::LineHeight& lh) {
    Value out = Value::object();
    if (lh.is_auto()) {
        out.set("unit", "AUTO");
    } else {
        out.set("unit", "PIXELS");
        out.set("value", static_cast<double>(lh.value));
    }
    return out;
}

style::LineHeight line_height_from_json(const Value* value) {
    if (value == nullptr || !value->is_object()) return style::LineHeight::auto_height();
    if (string_field(*value, "unit") == "PIXELS") {
        return style::LineHeight::pixels(number_field(*value, "value"));
    }
    return style::LineHeight::auto_height();
}

struct PayloadWriter {
    Value& out;

    void operator()(const FrameData& frame) const {
        out.set("clipsContent", frame.clips_content);
        if (!frame.background_image_url.empty()) {
            out.set("backgroundImageUrl", frame.background_image_url);
        }
        if (!frame.background_image_base64.empty()) {
            out.set("backgroundImageBase64", frame.background_image_base64);
        }
    }

    void operator()(const TextData& text) const {
        out.set("characters", text.characters);
        out.set("fontSize", static_cast<double>(text.font_size));
        out.set("fontFamily", text.font_family);
        if (!text.font_weight.empty()) out.set("fontWeight", text.font_weight);
        if (!text.font_style.empty()) out.set("fontStyle", text.font_style);
        if (!text.figma_font_style.empty()) out.set("figmaFontStyle", text.figma_font_style);
        out.set("lineHeight", line_height_to_json(text.line_height));
        out.set("letterSpacing", static_cast<double>(text.letter_spacing));
        out.set("textAlignHorizontal", style::text_align_name(text.text_align));
        out.set("textDecoration", style::text_decoration_name(text.text_decoration));
        if (!text.background_fills.empty()) {
            out.set("backgroundFills", paints_to_json(text.background_fills));
        }
    }

    void operator()(const SvgData& svg) const {
        out.set("svgContent", svg.svg_content);
    }

    void operator()(const ImageData& image) const {
        if (!image.image_url.empty()) out.set("imageUrl", image.image_url);
        if (!image.image_base64.empty()) out.set("imageBase64", image.image_base64);
    }
};

void read_frame(const Value& v, FrameData& frame) {
    const Value* clips = v.find("clipsContent");
    frame.clips_content = clips != nullptr && clips->as_bool();
    frame.background_image_url = string_field(v, "backgroundImageUrl");
    frame.background_image_base64 = string_field(v, "backgroundImageBase64");
}

void read_text(const Value& v, TextData& text, const std::string& where,
               std::vector<std::string>& warnings) {
    text.characters = string_field(v, "characters");
    text.font_size = number_field(v, "fontSize", 16);
    text.font_family = string_field(v, "fontFamily");
    text.font_weight = string_field(v, "fontWeight");
    text.font_style = string_field(v, "fontStyle");
    text.figma_font_style = string_field(v, "figmaFontStyle");
    text.line_height = line_height_from_json(v.find("lineHeight"));
    text.letter_spacing = number_field(v, "letterSpacing");
    text.text_align = style::text_align_from_name(string_field(v, "textAlignHorizontal"))
                          .value_or(style::TextAlign::Left);
    text.text_decoration = style::text_decoration_from_name(string_field(v, "textDecoration"))
                               .value_or(style::TextDecoration::None);
    text.background_fills =
        paints_from_json(v.find("backgroundFills"), where + ".backgroundFills", warnings);
}

Node node_from_json(const Value& v, const std::string& where, std::vector<std::string>& warnings) {
    const std::string type_name = string_field(v, "type");
    auto type = node_type_from_name(type_name);
    if (!type) {
        warnings.push_back(where + ": unknown node type '" + type_name + "', treated as FRAME");
        type = NodeType::Frame;
    }

    Node node = Node::make(*type);
    node.name = string_field(v, "name");
    node.x = number_field(v, "x");
    node.y = number_field(v, "y");
    node.width = number_field(v, "width");
    node.height = number_field(v, "height");
    node.opacity = number_field(v, "opacity", 1);

    node.fills = paints_from_json(v.find("fills"), where + ".fills", warnings);
    node.strokes = paints_from_json(v.find("strokes"), where + ".strokes", warnings);
    node.stroke_weight = number_field(v, "strokeWeight");
    if (v.contains("strokeAlign")) {
        node.stroke_align = style::stroke_align_from_name(string_field(v, "strokeAlign"));
    }

    static const char* const kRadiusKeys[] = {"topLeftRadius", "topRightRadius",
                                              "bottomRightRadius", "bottomLeftRadius"};
    bool has_radius = false;
    for (const char* key : kRadiusKeys) has_radius = has_radius || v.contains(key);
    if (has_radius) {
        CornerRadii radii;
        radii.top_left = number_field(v, kRadiusKeys[0]);
        radii.top_right = number_field(v, kRadiusKeys[1]);
        radii.bottom_right = number_field(v, kRadiusKeys[2]);
        radii.bottom_left = number_field(v, kRadiusKeys[3]);
        node.corner_radii = radii;
    }

    if (const Value* effects = v.find("effects"); effects != nullptr && effects->is_array()) {
        for (const auto& item : effects->items()) {
            std::string error;
            auto effect = effect_from_json(item, error);
            if (effect) {
                node.effects.push_back(*effect);
            } else {
                warnings.push_back(where + ".effects: " + error);
            }
        }
    }

    if (auto* frame = node.get_if<FrameData>()) {
        read_frame(v, *frame);
    } else if (auto* text = node.get_if<TextData>()) {
        read_text(v, *text, where, warnings);
    } else if (auto* svg = node.get_if<SvgData>()) {
        svg->svg_content = string_field(v, "svgContent");
    } else if (auto* image = node.get_if<ImageData>()) {
        image->image_url = string_field(v, "imageUrl");
        image->image_base64 = string_field(v, "imageBase64");
    }

    const Value* children = v.find("children");
    if (children == nullptr || !children->is_array()) return node;
    if (!node.is_frame()) {
        if (children->size() > 0) {
            warnings.push_back(where + ": children on a " + node_type_name(node.type()) +
                               " node are ignored");
        }
        return node;
    }

    std::size_t index = 0;
    for (const auto& child : children->items()) {
        const std::string child_where = where + ".children[" + std::to_string(index++) + "]";
        if (!child.is_object()) {
            warnings.push_back(child_where + ": not an object, skipped");
            continue;
        }
        node.children.push_back(node_from_json(child, child_where, warnings));
    }
    return node;
}

}  // namespace

json::Value paint_to_json(const Paint& paint) {
    Value out = Value::object();
    out.set("type", style::paint_type_name(paint.type));
    if (!paint.is_gradient()) {
        out.set("color", rgb_to_json(paint.color));
        out.set("opacity", static_cast<double>(paint.opacity));
        return out;
    }

    Value stops = Value::array();
    for (const auto& stop : paint.stops) {
        Value s = Value::object();
        s.set("color", rgba_to_json(stop.color));
        s.set("position", static_cast<double>(stop.position));
        stops.push_back(std::move(s));
    }
    out.set("gradientStops", std::move(stops));

    Value handles = Value::array();
    for (const auto& handle : paint.handles) handles.push_back(vec2_to_json(handle));
    out.set("gradientHandlePositions", std::move(handles));
    return out;
}

json::Value effect_to_json(const Effect& effect) {
    Value out = Value::object();
    out.set("type", style::effect_type_name(effect.type));
    out.set("color", rgba_to_json(effect.color));
    out.set("offset", vec2_to_json(effect.offset));
    out.set("radius", static_cast<double>(effect.radius));
    out.set("spread", static_cast<double>(effect.spread));
    out.set("visible", effect.visible);
    return out;
}

json::Value node_to_json(const Node& node) {
    Value out = Value::object();
    out.set("name", node.name);
    out.set("type", node_type_name(node.type()));
    out.set("x", static_cast<double>(node.x));
    out.set("y", static_cast<double>(node.y));
    out.set("width", static_cast<double>(node.width));
    out.set("height", static_cast<double>(node.height));
    if (node.opacity < 1) out.set("opacity", static_cast<double>(node.opacity));

    if (node.is_frame() || !node.fills.empty()) out.set("fills", paints_to_json(node.fills));
    if (!node.strokes.empty()) {
        out.set("strokes", paints_to_json(node.strokes));
        out.set("strokeWeight", static_cast<double>(node.stroke_weight));
    }
    if (node.stroke_align) out.set("strokeAlign", style::stroke_align_name(*node.stroke_align));
    if (node.corner_radii) {
        out.set("topLeftRadius", static_cast<double>(node.corner_radii->top_left));
        out.set("topRightRadius", static_cast<double>(node.corner_radii->top_right));
        out.set("bottomRightRadius", static_cast<double>(node.corner_radii->bottom_right));
        out.set("bottomLeftRadius", static_cast<double>(node.corner_radii->bottom_left));
    }
    if (!node.effects.empty()) {
        Value effects = Value::array();
        for (const auto& effect : node.effects) effects.push_back(effect_to_json(effect));
        out.set("effects", std::move(effects));
    }

    std::visit(PayloadWriter{out}, node.payload);

    if (node.is_frame()) {
        Value children = Value::array();
        for (const auto& child : node.children) children.push_back(node_to_json(child));
        out.set("children", std::move(children));
    }
    return out;
}

json::Value document_to_json(const Document& document) {
    Value out = Value::object();
    out.set("pageTitle", document.page_title);
    out.set("viewportWidth", static_cast<double>(document.viewport_width));
    out.set("viewportHeight", static_cast<double>(document.viewport_height));
    out.set("fullHeight", static_cast<double>(document.full_height));
    out.set("rootNode", document.root_node ? node_to_json(*document.root_node) : Value());
    return out;
}

std::string serialize_document(const Document& document, int indent) {
    return json::serialize(document_to_json(document), indent);
}

std::optional<Paint> paint_from_json(const json::Value& value, std::string& error) {
    if (!value.is_object()) {
        error = "paint is not an object";
        return std::nullopt;
    }
    const std::string type_name = string_field(value, "type");
    auto type = style::paint_type_from_name(type_name);
    if (!type) {
        error = "unsupported paint type '" + type_name + "'";
        return std::nullopt;
    }

    Paint paint;
    paint.type = *type;
    if (!paint.is_gradient()) {
        paint.color = rgba_from_json(value.find("color")).rgb();
        paint.opacity = number_field(value, "opacity", 1);
        return paint;
    }

    if (const Value* stops = value.find("gradientStops"); stops != nullptr && stops->is_array()) {
        for (const auto& item : stops->items()) {
            if (!item.is_object()) continue;
            style::GradientStop stop;
            stop.color = rgba_from_json(item.find("color"));
            stop.position = number_field(item, "position");
            paint.stops.push_back(stop);
        }
    }
    if (const Value* handles = value.find("gradientHandlePositions");
        handles != nullptr && handles->is_array()) {
        for (const auto& item : handles->items()) {
            if (item.is_object()) paint.handles.push_back(vec2_from_json(item));
        }
    }
    return paint;
}

std::optional<Effect> effect_from_json(const json::Value& value, std::string& error) {
    if (!value.is_object()) {
        error = "effect is not an object";
        return std::nullopt;
    }
    const std::string type_name = string_field(value, "type");
    auto type = style::effect_type_from_name(type_name);
    if (!type) {
        error = "unsupported effect type '" + type_name + "'";
        return std::nullopt;
    }

    Effect effect;
    effect.type = *type;
    effect.color = rgba_from_json(value.find("color"));
    if (const Value* offset = value.find("offset"); offset != nullptr && offset->is_object()) {
        effect.offset = vec2_from_json(*offset);
    }
    effect.radius = number_field(value, "radius");
    effect.spread = number_field(value, "spread");
    const Value* visible = value.find("visible");
    effect.visible = visible == nullptr || visible->as_bool(true);
    return effect;
}

DocumentParseResult document_from_json(const json::Value& value) {
    DocumentParseResult result;
    if (!value.is_object()) {
        result.error = "design document is not a JSON object";
        return result;
    }

    const Value* root = value.find("rootNode");
    if (root == nullptr || !root->is_object()) {
        result.error = "Invalid design document: missing rootNode";
        return result;
    }

    result.document.page_title = string_field(value, "pageTitle");
    result.document.viewport_width = number_field(value, "viewportWidth");
    result.document.viewport_height = number_field(value, "viewportHeight");
    result.document.full_height = number_field(value, "fullHeight");
    result.document.root_node = node_from_json(*root, "rootNode", result.warnings);
    result.ok = true;
    return result;
}

DocumentParseResult parse_document(const std::string& text) {
    json::ParseResult parsed = json::parse(text);
    if (!parsed.ok) {
        DocumentParseResult result;
        result.error = "JSON parse error at offset " + std::to_string(parsed.error_offset) + ": " +
                       parsed.error;
        return result;
    }
    return document_from_json(parsed.value);
}

}  // namespace layercast::ir
