#include "layercast/scene/host.h"

namespace layercast::scene {

const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Frame: return "FRAME";
        case NodeKind::Text: return "TEXT";
        case NodeKind::Vector: return "VECTOR";
        case NodeKind::Rectangle: return "RECTANGLE";
    }
    return "FRAME";
}

const char* scene_paint_type_name(ScenePaintType type) {
    switch (type) {
        case ScenePaintType::Solid: return "SOLID";
        case ScenePaintType::GradientLinear: return "GRADIENT_LINEAR";
        case ScenePaintType::GradientRadial: return "GRADIENT_RADIAL";
        case ScenePaintType::Image: return "IMAGE";
    }
    return "SOLID";
}

ScenePaint ScenePaint::solid(const style::Rgb& color, float opacity) {
    ScenePaint paint;
    paint.type = ScenePaintType::Solid;
    paint.color = color;
    paint.opacity = opacity;
    return paint;
}

ScenePaint ScenePaint::image(const std::string& hash) {
    ScenePaint paint;
    paint.type = ScenePaintType::Image;
    paint.image_hash = hash;
    paint.scale_mode = "FILL";
    return paint;
}

ScenePaint ScenePaint::from_paint(const style::Paint& paint) {
    switch (paint.type) {
        case style::PaintType::Solid:
            return solid(paint.color, paint.opacity);
        case style::PaintType::GradientLinear:
        case style::PaintType::GradientRadial: {
            ScenePaint out;
            out.type = paint.type == style::PaintType::GradientLinear
                           ? ScenePaintType::GradientLinear
                           : ScenePaintType::GradientRadial;
            out.stops = paint.stops;
            out.gradient_transform = style::handles_to_transform(paint.handles);
            return out;
        }
    }
    return solid(paint.color, paint.opacity);
}

std::vector<ScenePaint> to_scene_paints(const std::vector<style::Paint>& paints) {
    std::vector<ScenePaint> out;
    out.reserve(paints.size());
    for (const auto& paint : paints) out.push_back(ScenePaint::from_paint(paint));
    return out;
}

}  // namespace layercast::scene
