#include "layercast/extract/extractor.h"

#include <algorithm>
#include <unordered_set>

#include "layercast/style/value_parser.h"
#include "layercast/url/url.h"

namespace layercast::extract {

namespace {

const std::string kEmpty;

const std::string& lookup(const dom::StyleMap& style, const std::string& property) {
    auto it = style.find(property);
    return it == style.end() ? kEmpty : it->second;
}

bool is_inline_text_tag(const std::string& tag) {
    static const std::unordered_set<std::string> tags = {
        "span", "strong", "em", "b", "i", "a", "code",
        "small", "sub", "sup", "mark", "u", "s", "br",
    };
    return tags.count(tag) > 0;
}

float px_or(const std::string& value, float fallback) {
    auto px = style::parse_px(value);
    return px && *px != 0 ? *px : fallback;
}

std::optional<float> sub_one_opacity(const dom::StyleMap& style) {
    auto opacity = style::parse_px(lookup(style, "opacity"));
    if (!opacity || *opacity >= 1) return std::nullopt;
    return std::max(*opacity, 0.0f);
}

bool has_pseudo_content(const std::string& content) {
    const std::string value = style::trim(content);
    return !value.empty() && value != "none" && value != "normal" && value != "\"\"" &&
           value != "''";
}

class Walker {
public:
    Walker(const dom::RenderedDocument& document, const ExtractOptions& options,
           core::DiagnosticEmitter* diagnostics, ExtractStats& stats)
        : document_(document), options_(options), diagnostics_(diagnostics), stats_(stats) {}

    std::optional<ir::Node> walk(const dom::Node& element, const dom::Rect* parent_rect) {
        if (!is_rendered(element)) {
            stats_.pruned_count++;
            return std::nullopt;
        }

        const dom::StyleMap& style = element.style;
        const dom::Rect& rect = element.rect;
        const ElementKind kind = classify_element(element);

        ir::Node node = ir::Node::make(node_type_for(kind));
        node.name = node_name(element);
        node.x = parent_rect != nullptr ? rect.x - parent_rect->x : rect.x;
        node.y = parent_rect != nullptr ? rect.y - parent_rect->y : rect.y;
        node.width = std::max(rect.width, 1.0f);
        node.height = std::max(rect.height, 1.0f);
        stats_.node_count++;

        switch (kind) {
            case ElementKind::Svg:
                node.get_if<ir::SvgData>()->svg_content = dom::serialize_markup(element);
                return node;

            case ElementKind::Image: {
                auto* image = node.get_if<ir::ImageData>();
                if (element.tag_name == "img") {
                    image->image_url = absolute_url(element.attribute("src"));
                    const std::string& alt = element.attribute("alt");
                    node.name = alt.empty() ? "img" : "img: " + alt;
                } else {
                    image->image_url = absolute_url(element.attribute("poster"));
                }
                return node;
            }

            case ElementKind::Text:
                capture_text(element, node);
                return node;

            case ElementKind::Frame:
                break;
        }

        auto* frame = node.get_if<ir::FrameData>();
        frame->clips_content = lookup(style, "overflow") == "hidden" ||
                               lookup(style, "overflow") == "clip" ||
                               lookup(style, "overflow-x") == "hidden" ||
                               lookup(style, "overflow-y") == "hidden";

        node.fills = extract_background(style);
        const std::string& background_image = lookup(style, "background-image");
        if (!style::parse_gradient(background_image)) {
            if (auto url = style::extract_url(background_image)) {
                frame->background_image_url = absolute_url(*url);
            }
        }

        apply_box_style(style, node);

        for (const auto& child : element.children) {
            if (!child->is_element()) continue;
            if (auto child_node = walk(*child, &rect)) {
                node.children.push_back(std::move(*child_node));
            }
        }

        if (options_.capture_pseudo_elements) {
            for (const char* pseudo : {"::before", "::after"}) {
                const dom::StyleMap* pseudo_style = element.pseudo_style(pseudo);
                if (pseudo_style == nullptr) continue;
                if (auto pseudo_node = pseudo_element(element, *pseudo_style, pseudo)) {
                    node.children.push_back(std::move(*pseudo_node));
                }
            }
        }
        return node;
    }

private:
    static ir::NodeType node_type_for(ElementKind kind) {
        switch (kind) {
            case ElementKind::Svg: return ir::NodeType::Svg;
            case ElementKind::Image: return ir::NodeType::Image;
            case ElementKind::Text: return ir::NodeType::Text;
            case ElementKind::Frame: return ir::NodeType::Frame;
        }
        return ir::NodeType::Frame;
    }

    std::string absolute_url(const std::string& ref) {
        if (ref.empty() || document_.url.empty() || url::is_absolute_url(ref)) return ref;
        std::string err;
        std::string resolved = url::resolve_url(document_.url, ref, err);
        if (!err.empty()) {
            warn("walk", "cannot resolve '" + ref + "' against '" + document_.url + "': " + err);
            return ref;
        }
        return resolved;
    }

    void warn(const std::string& stage, const std::string& message) {
        if (diagnostics_ != nullptr) diagnostics_->warning("extract", stage, message);
    }

    // Borders, radii, shadows and opacity shared by frames and text.
    static void apply_box_style(const dom::StyleMap& style, ir::Node& node) {
        if (auto border = extract_borders(style)) {
            node.strokes = std::move(border->strokes);
            node.stroke_weight = border->weight;
            node.stroke_align = border->align;
        }
        node.corner_radii = extract_corner_radii(style);
        node.effects = style::parse_box_shadow(lookup(style, "box-shadow"));
        if (auto opacity = sub_one_opacity(style)) node.opacity = *opacity;
    }

    static void capture_font(const dom::StyleMap& style, ir::TextData& text) {
        text.font_size = px_or(lookup(style, "font-size"), core::config::kDefaultFontSize);
        text.font_family = style::primary_font_family(lookup(style, "font-family"));
        text.figma_font_style =
            style::font_style_from_css(lookup(style, "font-weight"), lookup(style, "font-style"));
    }

    static void capture_text(const dom::Node& element, ir::Node& node) {
        const dom::StyleMap& style = element.style;
        auto* text = node.get_if<ir::TextData>();
        text->characters = style::trim(dom::inner_text(element));

        if (auto color = style::parse_color(lookup(style, "color"))) {
            node.fills.push_back(style::Paint::solid(*color));
        }

        capture_font(style, *text);
        text->font_weight = lookup(style, "font-weight");
        text->font_style = lookup(style, "font-style");
        text->line_height = style::parse_line_height(lookup(style, "line-height"));
        text->letter_spacing = style::parse_px(lookup(style, "letter-spacing")).value_or(0.0f);
        text->text_align = style::map_text_align(lookup(style, "text-align"));
        const std::string& decoration_line = lookup(style, "text-decoration-line");
        text->text_decoration = style::map_text_decoration(
            decoration_line.empty() ? lookup(style, "text-decoration") : decoration_line);

        text->background_fills = extract_background(style);
        apply_box_style(style, node);
    }

    // Pseudo-elements have no box of their own; they sit at the parent's
    // origin with a size taken from their style or the parent.
    std::optional<ir::Node> pseudo_element(const dom::Node& element, const dom::StyleMap& style,
                                           const std::string& pseudo) {
        const std::string& content = lookup(style, "content");
        if (!has_pseudo_content(content)) return std::nullopt;
        const std::string characters = style::unquote_css_string(content);
        if (characters.empty()) return std::nullopt;

        ir::Node node = ir::Node::make(ir::NodeType::Text);
        node.name = node_name(element) + pseudo;
        node.x = 0;
        node.y = 0;
        node.width = std::max(px_or(lookup(style, "width"), element.rect.width), 1.0f);
        node.height = std::max(
            px_or(lookup(style, "height"),
                  px_or(lookup(style, "font-size"), core::config::kDefaultFontSize)),
            1.0f);

        auto* text = node.get_if<ir::TextData>();
        text->characters = characters;
        if (auto color = style::parse_color(lookup(style, "color"))) {
            node.fills.push_back(style::Paint::solid(*color));
        }
        capture_font(style, *text);
        text->background_fills = extract_background(style);

        stats_.node_count++;
        stats_.pseudo_count++;
        return node;
    }

    const dom::RenderedDocument& document_;
    const ExtractOptions& options_;
    core::DiagnosticEmitter* diagnostics_;
    ExtractStats& stats_;
};

}  // namespace

bool is_rendered(const dom::Node& element) {
    if (element.style_value("display") == "none") return false;
    if (element.style_value("visibility") == "hidden") return false;
    return !(element.rect.width <= 0 && element.rect.height <= 0);
}

ElementKind classify_element(const dom::Node& element) {
    const std::string& tag = element.tag_name;
    if (tag == "svg") return ElementKind::Svg;
    if (tag == "img") return ElementKind::Image;
    if (tag == "video" && !element.attribute("poster").empty()) return ElementKind::Image;

    const bool only_text_children =
        std::all_of(element.children.begin(), element.children.end(), [](const auto& child) {
            return child->is_text() || is_inline_text_tag(child->tag_name);
        });
    if (only_text_children && !style::trim(dom::inner_text(element)).empty()) {
        return ElementKind::Text;
    }
    return ElementKind::Frame;
}

std::string node_name(const dom::Node& element) {
    const std::string& tag = element.tag_name;
    const std::string& id = element.attribute("id");
    if (!id.empty()) return tag + "#" + id;

    std::string name = tag;
    auto classes = style::split_tokens(element.attribute("class"));
    for (std::size_t i = 0; i < classes.size() && i < 2; ++i) {
        name += "." + classes[i];
    }
    return name;
}

std::optional<BorderData> extract_borders(const dom::StyleMap& style) {
    static const char* const kSides[] = {"top", "right", "bottom", "left"};

    BorderData border;
    bool bordered = false;
    for (const char* side : kSides) {
        const std::string prefix = std::string("border-") + side;
        const float width = style::parse_px(lookup(style, prefix + "-width")).value_or(0.0f);
        const std::string& line_style = lookup(style, prefix + "-style");
        auto color = style::parse_color(lookup(style, prefix + "-color"));
        if (width <= 0 || line_style == "none" || !color) continue;

        bordered = true;
        border.weight = std::max(border.weight, width);
        if (border.strokes.empty()) border.strokes.push_back(style::Paint::solid(*color));
    }
    if (!bordered) return std::nullopt;
    return border;
}

std::optional<ir::CornerRadii> extract_corner_radii(const dom::StyleMap& style) {
    ir::CornerRadii radii;
    radii.top_left = style::parse_px(lookup(style, "border-top-left-radius")).value_or(0.0f);
    radii.top_right = style::parse_px(lookup(style, "border-top-right-radius")).value_or(0.0f);
    radii.bottom_right =
        style::parse_px(lookup(style, "border-bottom-right-radius")).value_or(0.0f);
    radii.bottom_left = style::parse_px(lookup(style, "border-bottom-left-radius")).value_or(0.0f);
    if (radii.top_left > 0 || radii.top_right > 0 || radii.bottom_right > 0 ||
        radii.bottom_left > 0) {
        return radii;
    }
    return std::nullopt;
}

std::vector<style::Paint> extract_background(const dom::StyleMap& style) {
    std::vector<style::Paint> fills;
    if (auto color = style::parse_color(lookup(style, "background-color"))) {
        fills.push_back(style::Paint::solid(*color));
    }
    if (auto gradient = style::parse_gradient(lookup(style, "background-image"))) {
        fills.push_back(std::move(*gradient));
    }
    return fills;
}

ExtractResult extract_document(const dom::RenderedDocument& document,
                               const ExtractOptions& options,
                               core::DiagnosticEmitter* diagnostics) {
    ExtractResult result;
    if (!document.root) {
        result.message = "snapshot has no root element";
        if (diagnostics != nullptr) diagnostics->error("extract", "walk", result.message);
        return result;
    }

    Walker walker(document, options, diagnostics, result.stats);
    auto root = walker.walk(*document.root, nullptr);
    if (!root) {
        result.message = "root element <" + document.root->tag_name + "> is not rendered";
        if (diagnostics != nullptr) diagnostics->error("extract", "walk", result.message);
        return result;
    }

    ir::Document& out = result.document;
    out.page_title = document.title;
    out.viewport_width =
        document.viewport_width > 0 ? document.viewport_width : options.fallback_viewport_width;
    out.viewport_height =
        document.viewport_height > 0 ? document.viewport_height : options.fallback_viewport_height;
    out.full_height = document.scroll_height > 0 ? document.scroll_height : root->height;
    out.root_node = std::move(*root);

    result.ok = true;
    result.message = std::to_string(result.stats.node_count) + " nodes extracted";
    if (diagnostics != nullptr) {
        diagnostics->info("extract", "walk",
                          result.message + ", " + std::to_string(result.stats.pruned_count) +
                              " elements pruned");
    }
    return result;
}

}  // namespace layercast::extract
