#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "layercast/style/gradient_transform.h"
#include "layercast/style/paint.h"

namespace layercast::scene {

enum class NodeKind { Frame, Text, Vector, Rectangle };

const char* node_kind_name(NodeKind kind);

enum class ScenePaintType { Solid, GradientLinear, GradientRadial, Image };

const char* scene_paint_type_name(ScenePaintType type);

// A paint in the target tool's own terms: gradients carry an affine
// transform instead of handle positions, images refer to a host image hash.
struct ScenePaint {
    ScenePaintType type = ScenePaintType::Solid;
    style::Rgb color;
    float opacity = 1;
    std::vector<style::GradientStop> stops;
    style::Transform2x3 gradient_transform = style::identity_transform();
    std::string image_hash;
    std::string scale_mode = "FILL";

    static ScenePaint solid(const style::Rgb& color, float opacity = 1);
    static ScenePaint image(const std::string& hash);
    // Converts handle positions to the transform form.
    static ScenePaint from_paint(const style::Paint& paint);
};

std::vector<ScenePaint> to_scene_paints(const std::vector<style::Paint>& paints);

struct FontName {
    std::string family;
    std::string style;

    bool operator==(const FontName& other) const {
        return family == other.family && style == other.style;
    }
    bool operator!=(const FontName& other) const { return !(*this == other); }
    bool operator<(const FontName& other) const {
        return family != other.family ? family < other.family : style < other.style;
    }
};

struct CornerRadii {
    float top_left = 0;
    float top_right = 0;
    float bottom_right = 0;
    float bottom_left = 0;
};

enum class TextAutoResize { None, WidthAndHeight, Height };

// Common state every scene node exposes for inspection.
struct NodeProperties {
    std::string name;
    float x = 0;
    float y = 0;
    float width = 100;
    float height = 100;
    float opacity = 1;
    std::vector<ScenePaint> fills;
    std::vector<ScenePaint> strokes;
    float stroke_weight = 1;
    style::StrokeAlign stroke_align = style::StrokeAlign::Inside;
    std::optional<CornerRadii> corner_radii;
    std::vector<style::Effect> effects;
    bool clips_content = false;
};

// A node in the target tool. Nodes are owned by the host that created them.
class SceneNode {
public:
    virtual ~SceneNode() = default;

    virtual NodeKind kind() const = 0;
    virtual const NodeProperties& properties() const = 0;
    virtual SceneNode* parent() const = 0;
    virtual const std::vector<SceneNode*>& children() const = 0;
    virtual bool supports_children() const = 0;

    virtual void set_name(const std::string& name) = 0;
    virtual void set_position(float x, float y) = 0;
    virtual void resize(float width, float height) = 0;
    virtual void set_opacity(float opacity) = 0;
    virtual void set_fills(std::vector<ScenePaint> fills) = 0;
    virtual void set_strokes(std::vector<ScenePaint> strokes) = 0;
    virtual void set_stroke_weight(float weight) = 0;
    virtual void set_stroke_align(style::StrokeAlign align) = 0;
    virtual void set_corner_radii(const CornerRadii& radii) = 0;
    virtual void set_effects(std::vector<style::Effect> effects) = 0;
    virtual void set_clips_content(bool clips) = 0;
};

class TextNode : public SceneNode {
public:
    virtual void set_font_name(const FontName& font) = 0;
    // Fails when the current font has not been resolved by the host.
    virtual bool set_characters(const std::string& characters) = 0;
    virtual void set_font_size(float size) = 0;
    virtual void set_line_height(const style::LineHeight& line_height) = 0;
    virtual void set_letter_spacing(float pixels) = 0;
    virtual void set_text_align(style::TextAlign align) = 0;
    virtual void set_text_decoration(style::TextDecoration decoration) = 0;
    virtual void set_auto_resize(TextAutoResize mode) = 0;

    virtual const FontName& font_name() const = 0;
    virtual const std::string& characters() const = 0;
    virtual float font_size() const = 0;
    virtual const style::LineHeight& line_height() const = 0;
    virtual float letter_spacing() const = 0;
    virtual style::TextAlign text_align() const = 0;
    virtual style::TextDecoration text_decoration() const = 0;
    virtual TextAutoResize auto_resize() const = 0;
};

// Node-construction capability surface of a design tool. Failures are
// reported through return values.
class DesignHost {
public:
    virtual ~DesignHost() = default;

    virtual SceneNode* create_container() = 0;
    virtual TextNode* create_text() = 0;
    // nullptr when the markup cannot be parsed.
    virtual SceneNode* create_vector_from_markup(const std::string& markup) = 0;
    virtual SceneNode* create_rectangle() = 0;

    // Makes a font usable for text content.
    virtual bool resolve_font(const FontName& font) = 0;

    // Registers encoded image bytes and returns the image hash.
    virtual std::optional<std::string> decode_image_bytes(const std::vector<std::uint8_t>& bytes) = 0;
    virtual std::optional<std::string> resolve_image_from_url(const std::string& url) = 0;

    // Appends `child` to `parent`. A node is attached at most once.
    virtual bool attach_child(SceneNode& parent, SceneNode& child) = 0;
};

}  // namespace layercast::scene
