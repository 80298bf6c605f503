#include "layercast/materialize/materializer.h"

#include <algorithm>
#include <exception>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

#include "layercast/core/base64.h"
#include "layercast/materialize/policy.h"
#include "layercast/style/sanitize.h"

namespace layercast::materialize {

namespace {

const char kModule[] = "materialize";

// A constructed scene node plus the suffix flagging a placeholder.
struct Built {
    scene::SceneNode* node = nullptr;
    std::string name_suffix;
    bool placeholder = false;
};

scene::CornerRadii to_scene_radii(const ir::CornerRadii& radii) {
    return {radii.top_left, radii.top_right, radii.bottom_right, radii.bottom_left};
}

bool needs_text_wrapper(const ir::Node& node, const ir::TextData& text) {
    const bool has_radius = node.corner_radii && node.corner_radii->any_nonzero();
    return !text.background_fills.empty() || !node.strokes.empty() || has_radius ||
           !node.effects.empty();
}

// Per-run traversal state: the visit counter and progress side channel live
// here, not in the Materializer.
class NodeBuilder {
public:
    NodeBuilder(scene::DesignHost& host, const MaterializeOptions& options,
                ProgressReporter* progress, core::DiagnosticEmitter* diagnostics,
                std::size_t total)
        : host_(host), options_(options), progress_(progress), diagnostics_(diagnostics),
          total_(total) {}

    void build(const ir::Node& node, scene::SceneNode* parent) {
        visited_++;
        if (options_.progress_interval > 0 && visited_ % options_.progress_interval == 0) {
            report("Processing layers... (" + std::to_string(visited_) + "/" +
                       std::to_string(total_) + ")",
                   total_ > 0 ? static_cast<float>(visited_) / static_cast<float>(total_) : 0.0f);
        }

        Built built = std::visit(
            [&](const auto& data) { return construct(node, data); }, node.payload);
        if (built.node == nullptr) {
            // The children still get built, one level up.
            skipped_++;
            warn("build", "host could not create a layer for '" + display_name(node) + "'");
            for (const auto& child : node.children) build(child, parent);
            return;
        }
        if (built.placeholder) placeholders_++;

        scene::SceneNode& scene_node = *built.node;
        scene_node.set_position(node.x, node.y);
        if (node.opacity < 1) scene_node.set_opacity(std::max(node.opacity, 0.0f));
        if (!built.name_suffix.empty()) {
            scene_node.set_name(display_name(node) + built.name_suffix);
        } else if (!node.name.empty()) {
            scene_node.set_name(node.name);
        }

        if (parent != nullptr && parent->supports_children()) {
            if (!host_.attach_child(*parent, scene_node)) {
                warn("attach", "host refused to attach '" + node.name + "'");
            }
        }

        if (!node.children.empty() && scene_node.supports_children()) {
            for (const auto& child : node.children) build(child, &scene_node);
        }
    }

    std::size_t visited() const { return visited_; }
    std::size_t placeholders() const { return placeholders_; }
    std::size_t skipped() const { return skipped_; }

    void report(const std::string& message, float fraction, bool is_error = false) {
        if (progress_ == nullptr) return;
        ProgressEvent event;
        event.message = message;
        event.fraction = std::clamp(fraction, 0.0f, 1.0f);
        event.processed = visited_;
        event.total = total_;
        event.is_error = is_error;
        progress_->report(event);
    }

private:
    static std::string display_name(const ir::Node& node) {
        return node.name.empty() ? ir::node_type_name(node.type()) : node.name;
    }

    void warn(const std::string& stage, const std::string& message) {
        if (diagnostics_ != nullptr) diagnostics_->warning(kModule, stage, message);
    }

    void info(const std::string& stage, const std::string& message) {
        if (diagnostics_ != nullptr) diagnostics_->info(kModule, stage, message);
    }

    // Size, fills, strokes, radii and shadows of a frame-capable node.
    void apply_container_style(scene::SceneNode& target, const ir::Node& node,
                               const std::vector<style::Paint>& fills, bool clips) {
        target.resize(clamp_dimension(node.width), clamp_dimension(node.height));
        target.set_clips_content(clips);
        target.set_fills(scene::to_scene_paints(style::sanitize_paints(fills)));
        apply_strokes(target, node);
        if (node.corner_radii) target.set_corner_radii(to_scene_radii(*node.corner_radii));
        if (!node.effects.empty()) target.set_effects(style::sanitize_effects(node.effects));
    }

    static void apply_strokes(scene::SceneNode& target, const ir::Node& node) {
        if (node.strokes.empty()) return;
        target.set_strokes(scene::to_scene_paints(style::sanitize_paints(node.strokes)));
        if (node.stroke_weight != 0) target.set_stroke_weight(node.stroke_weight);
        target.set_stroke_align(node.stroke_align.value_or(style::StrokeAlign::Inside));
    }

    Built placeholder(const ir::Node& node, const Placeholder& kind) {
        scene::SceneNode* rect = host_.create_rectangle();
        if (rect == nullptr) return {};
        rect->resize(clamp_dimension(node.width), clamp_dimension(node.height));
        rect->set_fills({scene::ScenePaint::solid(kind.color)});
        return {rect, kind.name_suffix, true};
    }

    Built construct(const ir::Node& node, const ir::FrameData& frame) {
        scene::SceneNode* container = host_.create_container();
        if (container == nullptr) return {};
        apply_container_style(*container, node, node.fills, frame.clips_content);

        if (!frame.background_image_base64.empty()) {
            if (auto hash = decode_base64_image(frame.background_image_base64)) {
                std::vector<scene::ScenePaint> fills = container->properties().fills;
                fills.push_back(scene::ScenePaint::image(*hash));
                container->set_fills(std::move(fills));
            } else {
                warn("image", "background image of '" + node.name + "' could not be decoded");
            }
        }
        return {container, "", false};
    }

    Built construct(const ir::Node& node, const ir::TextData& text) {
        scene::SceneNode* wrapper = nullptr;
        if (needs_text_wrapper(node, text)) {
            wrapper = host_.create_container();
            if (wrapper != nullptr) {
                wrapper->set_name(node.name.empty() ? "text-container" : node.name);
                apply_container_style(*wrapper, node, text.background_fills, false);
            } else {
                warn("build", "host could not create the container of '" + display_name(node) +
                                  "', text is placed without it");
            }
        }

        scene::TextNode* text_node = host_.create_text();
        if (text_node == nullptr) {
            if (wrapper != nullptr) {
                warn("build", "host could not create the text of '" + display_name(node) + "'");
            }
            return {wrapper, "", false};
        }

        text_node->set_font_name(resolve_font(text.font_family, text.figma_font_style));
        if (!text_node->set_characters(text.characters)) {
            warn("font", "text content of '" + node.name + "' could not be set");
        }
        if (text.font_size > 0) text_node->set_font_size(text.font_size);
        text_node->set_line_height(text.line_height);
        if (text.letter_spacing != 0) text_node->set_letter_spacing(text.letter_spacing);
        text_node->set_text_align(text.text_align);
        if (text.text_decoration != style::TextDecoration::None) {
            text_node->set_text_decoration(text.text_decoration);
        }
        if (!node.fills.empty()) {
            text_node->set_fills(scene::to_scene_paints(style::sanitize_paints(node.fills)));
        }
        text_node->resize(clamp_dimension(node.width), clamp_dimension(node.height));
        text_node->set_auto_resize(scene::TextAutoResize::None);

        if (wrapper == nullptr) return {text_node, "", false};

        text_node->set_position(0, 0);
        if (!host_.attach_child(*wrapper, *text_node)) {
            warn("attach", "host refused to attach text of '" + node.name + "' to its container");
        }
        return {wrapper, "", false};
    }

    Built construct(const ir::Node& node, const ir::SvgData& svg) {
        if (svg.svg_content.empty()) {
            warn("svg", "'" + node.name + "' has no markup");
            return placeholder(node, kMissingSvgPlaceholder);
        }
        scene::SceneNode* vector = host_.create_vector_from_markup(svg.svg_content);
        if (vector == nullptr) {
            warn("svg", "markup of '" + node.name + "' could not be parsed");
            return placeholder(node, kSvgParseErrorPlaceholder);
        }
        vector->resize(clamp_dimension(node.width), clamp_dimension(node.height));
        return {vector, "", false};
    }

    Built construct(const ir::Node& node, const ir::ImageData& image) {
        if (image.image_base64.empty() && image.image_url.empty()) {
            return placeholder(node, kNoImageSourcePlaceholder);
        }

        for (ImageSource source : image_source_policy()) {
            std::optional<std::string> hash;
            if (source == ImageSource::Base64) {
                if (image.image_base64.empty()) continue;
                hash = decode_base64_image(image.image_base64);
            } else {
                if (image.image_url.empty()) continue;
                hash = host_.resolve_image_from_url(image.image_url);
            }
            if (!hash) {
                warn("image", std::string(image_source_name(source)) + " of '" + node.name +
                                  "' could not be loaded");
                continue;
            }

            scene::SceneNode* rect = host_.create_rectangle();
            if (rect == nullptr) return {};
            rect->resize(clamp_dimension(node.width), clamp_dimension(node.height));
            rect->set_fills({scene::ScenePaint::image(*hash)});
            return {rect, "", false};
        }
        return placeholder(node, kImageLoadErrorPlaceholder);
    }

    std::optional<std::string> decode_base64_image(const std::string& encoded) {
        std::vector<std::uint8_t> bytes;
        if (!core::base64_decode(encoded, bytes) || bytes.empty()) return std::nullopt;
        return host_.decode_image_bytes(bytes);
    }

    scene::FontName resolve_font(const std::string& family, const std::string& font_style) {
        const std::string requested_family = style::sanitize_font_family(family);
        const std::string requested_style =
            font_style.empty() ? std::string(core::config::kDefaultFontStyle) : font_style;

        const auto candidates =
            font_candidates(requested_family, requested_style, options_.fallback_font_family);
        for (std::size_t i = 0; i < candidates.size(); ++i) {
            if (!host_.resolve_font(candidates[i])) continue;
            if (i > 0) {
                info("font", requested_family + " " + requested_style + " unavailable, using " +
                                 candidates[i].family + " " + candidates[i].style);
            }
            return candidates[i];
        }

        scene::FontName last_resort{options_.fallback_font_family,
                                    core::config::kDefaultFontStyle};
        if (!host_.resolve_font(last_resort)) {
            warn("font", "fallback font " + last_resort.family + " " + last_resort.style +
                             " could not be resolved");
        }
        return last_resort;
    }

    scene::DesignHost& host_;
    const MaterializeOptions& options_;
    ProgressReporter* progress_;
    core::DiagnosticEmitter* diagnostics_;
    std::size_t total_;
    std::size_t visited_ = 0;
    std::size_t placeholders_ = 0;
    std::size_t skipped_ = 0;
};

}  // namespace

float clamp_dimension(float value) {
    return value >= 1 ? value : 1.0f;
}

Materializer::Materializer(scene::DesignHost& host, MaterializeOptions options,
                           ProgressReporter* progress, core::DiagnosticEmitter* diagnostics)
    : host_(host), options_(std::move(options)), progress_(progress), diagnostics_(diagnostics) {}

MaterializeResult Materializer::run(const ir::Document& document) {
    MaterializeResult result;
    const std::size_t total = ir::count_nodes(document);
    NodeBuilder builder(host_, options_, progress_, diagnostics_, total);

    if (!document.root_node) {
        result.message = "Invalid design document: missing rootNode";
        if (diagnostics_ != nullptr) diagnostics_->error(kModule, "validate", result.message);
        builder.report(result.message, 0.0f, true);
        return result;
    }

    builder.report("Starting import...", 0.0f);
    try {
        scene::SceneNode* root = host_.create_container();
        if (root == nullptr) {
            result.message = "Import failed: host could not create the root container";
            if (diagnostics_ != nullptr) diagnostics_->error(kModule, "run", result.message);
            builder.report(result.message, 0.0f, true);
            return result;
        }
        root->set_name(document.page_title.empty() ? options_.default_root_name
                                                   : document.page_title);
        const float width = document.viewport_width > 0 ? document.viewport_width
                                                        : options_.default_width;
        const float height = std::max(document.full_height, document.viewport_height);
        root->resize(width, height > 0 ? height : options_.default_height);

        builder.build(*document.root_node, root);
        result.root = root;
    } catch (const std::exception& e) {
        result.message = std::string("Import failed: ") + e.what();
        result.layer_count = builder.visited();
        if (diagnostics_ != nullptr) diagnostics_->error(kModule, "run", result.message);
        builder.report("Error: " + std::string(e.what()), 0.0f, true);
        return result;
    }

    result.ok = true;
    result.layer_count = builder.visited();
    result.placeholder_count = builder.placeholders();
    result.skipped_count = builder.skipped();
    result.message = "Import complete! " + std::to_string(result.layer_count) + " layers created.";
    if (diagnostics_ != nullptr) diagnostics_->info(kModule, "run", result.message);
    builder.report("Import complete!", 1.0f);
    return result;
}

MaterializeResult materialize_document(const ir::Document& document, scene::DesignHost& host,
                                       const MaterializeOptions& options,
                                       ProgressReporter* progress,
                                       core::DiagnosticEmitter* diagnostics) {
    Materializer materializer(host, options, progress, diagnostics);
    return materializer.run(document);
}

}  // namespace layercast::materialize
