#include "layercast/scene/memory_host.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iterator>

#include <nanosvg.h>
#include <stb_image.h>

#include "layercast/core/base64.h"
#include "layercast/url/url.h"

namespace layercast::scene {

namespace {

struct TreeLinks {
    SceneNode* parent = nullptr;
    std::vector<SceneNode*> children;
    std::size_t shape_count = 0;
};

NodeProperties default_properties(NodeKind kind) {
    NodeProperties props;
    switch (kind) {
        case NodeKind::Frame:
            props.name = "Frame";
            props.fills.push_back(ScenePaint::solid({1, 1, 1}));
            break;
        case NodeKind::Text:
            props.name = "Text";
            props.fills.push_back(ScenePaint::solid({0, 0, 0}));
            break;
        case NodeKind::Vector:
            props.name = "Vector";
            break;
        case NodeKind::Rectangle:
            props.name = "Rectangle";
            props.fills.push_back(ScenePaint::solid({0.85f, 0.85f, 0.85f}));
            break;
    }
    return props;
}

template <typename Interface>
class MemoryNodeImpl : public Interface {
public:
    MemoryNodeImpl(NodeKind kind, TreeLinks& links)
        : kind_(kind), props_(default_properties(kind)), links_(links) {}

    NodeKind kind() const override { return kind_; }
    const NodeProperties& properties() const override { return props_; }
    SceneNode* parent() const override { return links_.parent; }
    const std::vector<SceneNode*>& children() const override { return links_.children; }
    bool supports_children() const override { return kind_ == NodeKind::Frame; }

    void set_name(const std::string& name) override { props_.name = name; }
    void set_position(float x, float y) override {
        props_.x = x;
        props_.y = y;
    }
    void resize(float width, float height) override {
        props_.width = std::max(width, 0.01f);
        props_.height = std::max(height, 0.01f);
    }
    void set_opacity(float opacity) override { props_.opacity = opacity; }
    void set_fills(std::vector<ScenePaint> fills) override { props_.fills = std::move(fills); }
    void set_strokes(std::vector<ScenePaint> strokes) override {
        props_.strokes = std::move(strokes);
    }
    void set_stroke_weight(float weight) override { props_.stroke_weight = weight; }
    void set_stroke_align(style::StrokeAlign align) override { props_.stroke_align = align; }
    void set_corner_radii(const CornerRadii& radii) override { props_.corner_radii = radii; }
    void set_effects(std::vector<style::Effect> effects) override {
        props_.effects = std::move(effects);
    }
    void set_clips_content(bool clips) override { props_.clips_content = clips; }

protected:
    NodeKind kind_;
    NodeProperties props_;
    TreeLinks& links_;
};

using MemoryNode = MemoryNodeImpl<SceneNode>;

class MemoryTextNode final : public MemoryNodeImpl<TextNode> {
public:
    MemoryTextNode(TreeLinks& links, const std::set<FontName>& resolved_fonts)
        : MemoryNodeImpl<TextNode>(NodeKind::Text, links), resolved_fonts_(resolved_fonts) {}

    void set_font_name(const FontName& font) override { font_ = font; }
    bool set_characters(const std::string& characters) override {
        if (resolved_fonts_.count(font_) == 0) return false;
        characters_ = characters;
        props_.name = characters.empty() ? "Text" : characters;
        return true;
    }
    void set_font_size(float size) override { font_size_ = size; }
    void set_line_height(const style::LineHeight& line_height) override {
        line_height_ = line_height;
    }
    void set_letter_spacing(float pixels) override { letter_spacing_ = pixels; }
    void set_text_align(style::TextAlign align) override { text_align_ = align; }
    void set_text_decoration(style::TextDecoration decoration) override {
        text_decoration_ = decoration;
    }
    void set_auto_resize(TextAutoResize mode) override { auto_resize_ = mode; }

    const FontName& font_name() const override { return font_; }
    const std::string& characters() const override { return characters_; }
    float font_size() const override { return font_size_; }
    const style::LineHeight& line_height() const override { return line_height_; }
    float letter_spacing() const override { return letter_spacing_; }
    style::TextAlign text_align() const override { return text_align_; }
    style::TextDecoration text_decoration() const override { return text_decoration_; }
    TextAutoResize auto_resize() const override { return auto_resize_; }

private:
    const std::set<FontName>& resolved_fonts_;
    FontName font_{"Inter", "Regular"};
    std::string characters_;
    float font_size_ = 12;
    style::LineHeight line_height_;
    float letter_spacing_ = 0;
    style::TextAlign text_align_ = style::TextAlign::Left;
    style::TextDecoration text_decoration_ = style::TextDecoration::None;
    TextAutoResize auto_resize_ = TextAutoResize::WidthAndHeight;
};

const char* auto_resize_name(TextAutoResize mode) {
    switch (mode) {
        case TextAutoResize::None: return "NONE";
        case TextAutoResize::WidthAndHeight: return "WIDTH_AND_HEIGHT";
        case TextAutoResize::Height: return "HEIGHT";
    }
    return "NONE";
}

// FNV-1a over the encoded bytes, as 16 hex digits.
std::string image_hash(const std::vector<std::uint8_t>& bytes) {
    std::uint64_t hash = 0xcbf29ce484222325ULL;
    for (std::uint8_t b : bytes) {
        hash ^= b;
        hash *= 0x100000001b3ULL;
    }
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(hash));
    return buffer;
}

json::Value rgb_json(const style::Rgb& c) {
    json::Value out = json::Value::object();
    out.set("r", static_cast<double>(c.r));
    out.set("g", static_cast<double>(c.g));
    out.set("b", static_cast<double>(c.b));
    return out;
}

json::Value paint_json(const ScenePaint& paint) {
    json::Value out = json::Value::object();
    out.set("type", scene_paint_type_name(paint.type));
    switch (paint.type) {
        case ScenePaintType::Solid:
            out.set("color", rgb_json(paint.color));
            out.set("opacity", static_cast<double>(paint.opacity));
            break;
        case ScenePaintType::GradientLinear:
        case ScenePaintType::GradientRadial: {
            json::Value stops = json::Value::array();
            for (const auto& stop : paint.stops) {
                json::Value color = rgb_json(stop.color.rgb());
                color.set("a", static_cast<double>(stop.color.a));
                json::Value s = json::Value::object();
                s.set("color", std::move(color));
                s.set("position", static_cast<double>(stop.position));
                stops.push_back(std::move(s));
            }
            out.set("gradientStops", std::move(stops));
            json::Value transform = json::Value::array();
            for (const auto& row : paint.gradient_transform) {
                json::Value r = json::Value::array();
                for (float v : row) r.push_back(static_cast<double>(v));
                transform.push_back(std::move(r));
            }
            out.set("gradientTransform", std::move(transform));
            break;
        }
        case ScenePaintType::Image:
            out.set("imageHash", paint.image_hash);
            out.set("scaleMode", paint.scale_mode);
            break;
    }
    return out;
}

json::Value paints_json(const std::vector<ScenePaint>& paints) {
    json::Value out = json::Value::array();
    for (const auto& paint : paints) out.push_back(paint_json(paint));
    return out;
}

json::Value effect_json(const style::Effect& effect) {
    json::Value out = json::Value::object();
    out.set("type", style::effect_type_name(effect.type));
    json::Value color = rgb_json(effect.color.rgb());
    color.set("a", static_cast<double>(effect.color.a));
    out.set("color", std::move(color));
    json::Value offset = json::Value::object();
    offset.set("x", static_cast<double>(effect.offset.x));
    offset.set("y", static_cast<double>(effect.offset.y));
    out.set("offset", std::move(offset));
    out.set("radius", static_cast<double>(effect.radius));
    out.set("spread", static_cast<double>(effect.spread));
    out.set("visible", effect.visible);
    return out;
}

}  // namespace

struct MemoryHost::NodeRecord : TreeLinks {};

MemoryHost::MemoryHost() : MemoryHost(default_fonts()) {}

MemoryHost::MemoryHost(std::vector<FontName> available_fonts)
    : available_fonts_(available_fonts.begin(), available_fonts.end()) {}

MemoryHost::~MemoryHost() = default;

std::vector<FontName> MemoryHost::default_fonts() {
    static const char* const kStyles[] = {"Thin", "ExtraLight", "Light", "Regular", "Medium",
                                          "SemiBold", "Bold", "ExtraBold", "Black"};
    std::vector<FontName> fonts;
    for (const char* style : kStyles) {
        fonts.push_back({"Inter", style});
        fonts.push_back({"Inter", std::string(style) + " Italic"});
    }
    fonts.push_back({"Inter", "Italic"});
    fonts.push_back({"Georgia", "Regular"});
    fonts.push_back({"Georgia", "Bold"});
    fonts.push_back({"Georgia", "Italic"});
    fonts.push_back({"Roboto Mono", "Regular"});
    fonts.push_back({"Roboto Mono", "Bold"});
    return fonts;
}

template <typename T>
T* MemoryHost::adopt(std::unique_ptr<T> node) {
    T* raw = node.get();
    nodes_.push_back(std::move(node));
    return raw;
}

SceneNode* MemoryHost::create_container() {
    auto record = std::make_unique<NodeRecord>();
    auto node = std::make_unique<MemoryNode>(NodeKind::Frame, *record);
    records_[node.get()] = std::move(record);
    return adopt(std::move(node));
}

TextNode* MemoryHost::create_text() {
    auto record = std::make_unique<NodeRecord>();
    auto node = std::make_unique<MemoryTextNode>(*record, resolved_fonts_);
    records_[node.get()] = std::move(record);
    return adopt(std::move(node));
}

SceneNode* MemoryHost::create_vector_from_markup(const std::string& markup) {
    if (markup.find("<svg") == std::string::npos) return nullptr;

    // nsvgParse writes into its input.
    std::string svg_copy = markup;
    NSVGimage* svg = nsvgParse(svg_copy.data(), "px", 96.0f);
    if (!svg) return nullptr;

    std::size_t shapes = 0;
    for (NSVGshape* shape = svg->shapes; shape != nullptr; shape = shape->next) shapes++;
    const float width = svg->width;
    const float height = svg->height;
    nsvgDelete(svg);
    // Nothing drawable and no declared size.
    if (shapes == 0 && width <= 0 && height <= 0) return nullptr;

    auto record = std::make_unique<NodeRecord>();
    record->shape_count = shapes;
    auto node = std::make_unique<MemoryNode>(NodeKind::Vector, *record);
    node->resize(width > 0 ? width : 100.0f, height > 0 ? height : 100.0f);
    records_[node.get()] = std::move(record);
    return adopt(std::move(node));
}

SceneNode* MemoryHost::create_rectangle() {
    auto record = std::make_unique<NodeRecord>();
    auto node = std::make_unique<MemoryNode>(NodeKind::Rectangle, *record);
    records_[node.get()] = std::move(record);
    return adopt(std::move(node));
}

bool MemoryHost::resolve_font(const FontName& font) {
    if (!is_font_available(font)) return false;
    resolved_fonts_.insert(font);
    return true;
}

std::optional<std::string> MemoryHost::decode_image_bytes(const std::vector<std::uint8_t>& bytes) {
    if (bytes.empty()) return std::nullopt;

    int w = 0, h = 0, channels = 0;
    unsigned char* data = stbi_load_from_memory(
        bytes.data(), static_cast<int>(bytes.size()), &w, &h, &channels, 4);
    if (!data) return std::nullopt;
    stbi_image_free(data);

    std::string hash = image_hash(bytes);
    images_[hash] = ImageInfo{w, h, bytes.size()};
    return hash;
}

std::optional<std::string> MemoryHost::resolve_image_from_url(const std::string& image_url) {
    std::string err;
    std::vector<std::uint8_t> bytes;

    if (url::is_data_url(image_url)) {
        url::DataUrl data;
        if (!url::parse_data_url(image_url, data, err) || !data.is_base64) return std::nullopt;
        if (!core::base64_decode(data.payload, bytes)) return std::nullopt;
        return decode_image_bytes(bytes);
    }

    if (url::is_file_url(image_url)) {
        std::string path;
        if (!url::file_url_to_path(image_url, path, err)) return std::nullopt;
        std::ifstream input(path, std::ios::binary);
        if (!input) return std::nullopt;
        bytes.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
        return decode_image_bytes(bytes);
    }

    return std::nullopt;
}

bool MemoryHost::attach_child(SceneNode& parent, SceneNode& child) {
    if (&parent == &child || !parent.supports_children()) return false;
    auto parent_it = records_.find(&parent);
    auto child_it = records_.find(&child);
    if (parent_it == records_.end() || child_it == records_.end()) return false;
    if (child_it->second->parent != nullptr) return false;

    child_it->second->parent = &parent;
    parent_it->second->children.push_back(&child);
    return true;
}

void MemoryHost::add_font(const FontName& font) {
    available_fonts_.insert(font);
}

bool MemoryHost::is_font_available(const FontName& font) const {
    return available_fonts_.count(font) > 0;
}

bool MemoryHost::is_font_resolved(const FontName& font) const {
    return resolved_fonts_.count(font) > 0;
}

std::vector<const SceneNode*> MemoryHost::roots() const {
    std::vector<const SceneNode*> out;
    for (const auto& node : nodes_) {
        if (node->parent() == nullptr) out.push_back(node.get());
    }
    return out;
}

std::size_t MemoryHost::vector_shape_count(const SceneNode& node) const {
    auto it = records_.find(&node);
    return it == records_.end() ? 0 : it->second->shape_count;
}

json::Value MemoryHost::node_to_json(const SceneNode& node) const {
    const NodeProperties& props = node.properties();
    json::Value out = json::Value::object();
    out.set("name", props.name);
    out.set("type", node_kind_name(node.kind()));
    out.set("x", static_cast<double>(props.x));
    out.set("y", static_cast<double>(props.y));
    out.set("width", static_cast<double>(props.width));
    out.set("height", static_cast<double>(props.height));
    if (props.opacity < 1) out.set("opacity", static_cast<double>(props.opacity));
    out.set("fills", paints_json(props.fills));
    if (!props.strokes.empty()) {
        out.set("strokes", paints_json(props.strokes));
        out.set("strokeWeight", static_cast<double>(props.stroke_weight));
        out.set("strokeAlign", style::stroke_align_name(props.stroke_align));
    }
    if (props.corner_radii) {
        out.set("topLeftRadius", static_cast<double>(props.corner_radii->top_left));
        out.set("topRightRadius", static_cast<double>(props.corner_radii->top_right));
        out.set("bottomRightRadius", static_cast<double>(props.corner_radii->bottom_right));
        out.set("bottomLeftRadius", static_cast<double>(props.corner_radii->bottom_left));
    }
    if (!props.effects.empty()) {
        json::Value effects = json::Value::array();
        for (const auto& effect : props.effects) effects.push_back(effect_json(effect));
        out.set("effects", std::move(effects));
    }

    switch (node.kind()) {
        case NodeKind::Frame:
            out.set("clipsContent", props.clips_content);
            break;
        case NodeKind::Vector:
            out.set("shapeCount", vector_shape_count(node));
            break;
        case NodeKind::Text: {
            const auto& text = static_cast<const TextNode&>(node);
            json::Value font = json::Value::object();
            font.set("family", text.font_name().family);
            font.set("style", text.font_name().style);
            out.set("fontName", std::move(font));
            out.set("characters", text.characters());
            out.set("fontSize", static_cast<double>(text.font_size()));
            json::Value line_height = json::Value::object();
            if (text.line_height().is_auto()) {
                line_height.set("unit", "AUTO");
            } else {
                line_height.set("unit", "PIXELS");
                line_height.set("value", static_cast<double>(text.line_height().value));
            }
            out.set("lineHeight", std::move(line_height));
            out.set("letterSpacing", static_cast<double>(text.letter_spacing()));
            out.set("textAlignHorizontal", style::text_align_name(text.text_align()));
            out.set("textDecoration", style::text_decoration_name(text.text_decoration()));
            out.set("textAutoResize", auto_resize_name(text.auto_resize()));
            break;
        }
        case NodeKind::Rectangle:
            break;
    }

    if (node.supports_children()) {
        json::Value children = json::Value::array();
        for (const SceneNode* child : node.children()) children.push_back(node_to_json(*child));
        out.set("children", std::move(children));
    }
    return out;
}

json::Value MemoryHost::to_json() const {
    json::Value out = json::Value::object();

    json::Value nodes = json::Value::array();
    for (const SceneNode* root : roots()) nodes.push_back(node_to_json(*root));
    out.set("nodes", std::move(nodes));

    json::Value images = json::Value::object();
    for (const auto& [hash, info] : images_) {
        json::Value image = json::Value::object();
        image.set("width", info.width);
        image.set("height", info.height);
        image.set("byteSize", info.byte_size);
        images.set(hash, std::move(image));
    }
    out.set("images", std::move(images));

    json::Value fonts = json::Value::array();
    for (const auto& font : resolved_fonts_) {
        fonts.push_back(font.family + " " + font.style);
    }
    out.set("fonts", std::move(fonts));
    return out;
}

std::string MemoryHost::dump(int indent) const {
    return json::serialize(to_json(), indent);
}

}  // namespace layercast::scene
