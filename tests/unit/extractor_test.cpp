#include <layercast/core/diagnostics.h>
#include <layercast/dom/rendered_node.h>
#include <layercast/extract/extractor.h>
#include <layercast/ir/node.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>

using namespace layercast;
using namespace layercast::extract;

namespace {

dom::Node* add_element(dom::Node& parent, const std::string& tag, dom::Rect rect) {
    dom::Node* child = parent.append_child(dom::make_element(tag));
    child->rect = rect;
    return child;
}

dom::RenderedDocument make_document() {
    dom::RenderedDocument doc;
    doc.title = "Example";
    doc.url = "https://example.com/page/";
    doc.viewport_width = 1280;
    doc.viewport_height = 720;
    doc.scroll_height = 2000;
    doc.root = dom::make_element("body");
    doc.root->rect = {0, 0, 1280, 1500};
    doc.root->style["background-color"] = "rgb(250, 250, 250)";
    return doc;
}

}  // namespace

// ---------------------------------------------------------------------------
// Element helpers
// ---------------------------------------------------------------------------

TEST(ExtractHelpersTest, RenderedChecks) {
    auto div = dom::make_element("div");
    div->rect = {0, 0, 10, 10};
    EXPECT_TRUE(is_rendered(*div));

    div->style["display"] = "none";
    EXPECT_FALSE(is_rendered(*div));
    div->style.erase("display");

    div->style["visibility"] = "hidden";
    EXPECT_FALSE(is_rendered(*div));
    div->style.erase("visibility");

    div->rect = {0, 0, 0, 0};
    EXPECT_FALSE(is_rendered(*div));
    div->rect = {0, 0, 0, 20};
    EXPECT_TRUE(is_rendered(*div));
}

TEST(ExtractHelpersTest, Classification) {
    EXPECT_EQ(classify_element(*dom::make_element("svg")), ElementKind::Svg);
    EXPECT_EQ(classify_element(*dom::make_element("img")), ElementKind::Image);

    auto video = dom::make_element("video");
    EXPECT_EQ(classify_element(*video), ElementKind::Frame);
    video->attributes["poster"] = "poster.jpg";
    EXPECT_EQ(classify_element(*video), ElementKind::Image);

    auto p = dom::make_element("p");
    p->append_child(dom::make_text("Hello "));
    p->append_child(dom::make_element("strong"))->append_child(dom::make_text("there"));
    EXPECT_EQ(classify_element(*p), ElementKind::Text);

    auto wrapper = dom::make_element("div");
    wrapper->append_child(dom::make_element("div"))->append_child(dom::make_text("x"));
    EXPECT_EQ(classify_element(*wrapper), ElementKind::Frame);

    auto blank = dom::make_element("div");
    blank->append_child(dom::make_text("   "));
    EXPECT_EQ(classify_element(*blank), ElementKind::Frame);
}

TEST(ExtractHelpersTest, NodeNames) {
    auto div = dom::make_element("div");
    EXPECT_EQ(node_name(*div), "div");
    div->attributes["class"] = "card  shadow large";
    EXPECT_EQ(node_name(*div), "div.card.shadow");
    div->attributes["id"] = "main";
    EXPECT_EQ(node_name(*div), "div#main");
}

TEST(ExtractHelpersTest, BordersUseWidestSideAndFirstColor) {
    dom::StyleMap style;
    style["border-top-width"] = "1px";
    style["border-top-style"] = "solid";
    style["border-top-color"] = "rgb(255, 0, 0)";
    style["border-left-width"] = "3px";
    style["border-left-style"] = "dashed";
    style["border-left-color"] = "rgb(0, 0, 255)";
    style["border-right-width"] = "8px";
    style["border-right-style"] = "none";
    style["border-right-color"] = "rgb(0, 255, 0)";

    auto border = extract_borders(style);
    ASSERT_TRUE(border.has_value());
    EXPECT_FLOAT_EQ(border->weight, 3.0f);
    ASSERT_EQ(border->strokes.size(), 1u);
    EXPECT_FLOAT_EQ(border->strokes[0].color.r, 1.0f);
    EXPECT_EQ(border->align, style::StrokeAlign::Inside);
}

TEST(ExtractHelpersTest, NoBorderWithoutVisibleSide) {
    dom::StyleMap style;
    style["border-top-width"] = "2px";
    style["border-top-style"] = "solid";
    style["border-top-color"] = "rgba(0, 0, 0, 0)";
    EXPECT_FALSE(extract_borders(style).has_value());
    EXPECT_FALSE(extract_borders({}).has_value());
}

TEST(ExtractHelpersTest, CornerRadiiOnlyWhenRounded) {
    dom::StyleMap style;
    style["border-top-left-radius"] = "0px";
    EXPECT_FALSE(extract_corner_radii(style).has_value());

    style["border-bottom-right-radius"] = "12px";
    auto radii = extract_corner_radii(style);
    ASSERT_TRUE(radii.has_value());
    EXPECT_FLOAT_EQ(radii->bottom_right, 12.0f);
    EXPECT_FLOAT_EQ(radii->top_left, 0.0f);
}

TEST(ExtractHelpersTest, BackgroundColorThenGradient) {
    dom::StyleMap style;
    style["background-color"] = "rgb(0, 0, 0)";
    style["background-image"] = "linear-gradient(red, blue)";
    const auto fills = extract_background(style);
    ASSERT_EQ(fills.size(), 2u);
    EXPECT_EQ(fills[0].type, style::PaintType::Solid);
    EXPECT_EQ(fills[1].type, style::PaintType::GradientLinear);

    EXPECT_TRUE(extract_background({{"background-color", "transparent"}}).empty());
}

// ---------------------------------------------------------------------------
// Document walk
// ---------------------------------------------------------------------------

TEST(ExtractDocumentTest, BuildsDocumentAndRelativeGeometry) {
    dom::RenderedDocument doc = make_document();
    dom::Node* section = add_element(*doc.root, "section", {100, 200, 600, 300});
    section->style["overflow"] = "hidden";
    dom::Node* title = add_element(*section, "h2", {120, 230, 200, 0.5f});
    title->append_child(dom::make_text("  Pricing  "));
    title->style["color"] = "rgb(17, 17, 17)";
    title->style["font-size"] = "24px";
    title->style["font-family"] = "\"Helvetica Neue\", Arial";
    title->style["font-weight"] = "700";
    title->style["line-height"] = "32px";
    title->style["text-align"] = "center";
    title->style["text-decoration-line"] = "underline";

    core::DiagnosticEmitter diagnostics;
    const ExtractResult result = extract_document(doc, {}, &diagnostics);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.message, "3 nodes extracted");
    EXPECT_EQ(result.stats.node_count, 3u);

    const ir::Document& out = result.document;
    EXPECT_EQ(out.page_title, "Example");
    EXPECT_FLOAT_EQ(out.viewport_width, 1280.0f);
    EXPECT_FLOAT_EQ(out.full_height, 2000.0f);
    ASSERT_TRUE(out.root_node.has_value());
    EXPECT_EQ(ir::count_nodes(out), result.stats.node_count);

    const ir::Node& root = *out.root_node;
    EXPECT_EQ(root.type(), ir::NodeType::Frame);
    ASSERT_EQ(root.fills.size(), 1u);

    const ir::Node& section_node = root.children.at(0);
    EXPECT_FLOAT_EQ(section_node.x, 100.0f);
    EXPECT_FLOAT_EQ(section_node.y, 200.0f);
    EXPECT_TRUE(section_node.get_if<ir::FrameData>()->clips_content);

    const ir::Node& title_node = section_node.children.at(0);
    EXPECT_EQ(title_node.type(), ir::NodeType::Text);
    EXPECT_FLOAT_EQ(title_node.x, 20.0f);
    EXPECT_FLOAT_EQ(title_node.y, 30.0f);
    EXPECT_FLOAT_EQ(title_node.height, 1.0f);

    const ir::TextData* text = title_node.get_if<ir::TextData>();
    EXPECT_EQ(text->characters, "Pricing");
    EXPECT_FLOAT_EQ(text->font_size, 24.0f);
    EXPECT_EQ(text->font_family, "Helvetica Neue");
    EXPECT_EQ(text->figma_font_style, "Bold");
    EXPECT_EQ(text->font_weight, "700");
    EXPECT_EQ(text->line_height, style::LineHeight::pixels(32));
    EXPECT_EQ(text->text_align, style::TextAlign::Center);
    EXPECT_EQ(text->text_decoration, style::TextDecoration::Underline);
    ASSERT_EQ(title_node.fills.size(), 1u);
    EXPECT_NEAR(title_node.fills[0].color.r, 17.0f / 255.0f, 1e-4f);

    EXPECT_FALSE(diagnostics.events_by_module("extract").empty());
}

TEST(ExtractDocumentTest, PrunesHiddenSubtrees) {
    dom::RenderedDocument doc = make_document();
    dom::Node* hidden = add_element(*doc.root, "div", {0, 0, 100, 100});
    hidden->style["display"] = "none";
    add_element(*hidden, "div", {0, 0, 50, 50});
    add_element(*doc.root, "div", {0, 0, 0, 0});

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    EXPECT_TRUE(result.document.root_node->children.empty());
    EXPECT_EQ(result.stats.pruned_count, 2u);
    EXPECT_EQ(result.stats.node_count, 1u);
}

TEST(ExtractDocumentTest, HiddenRootFails) {
    dom::RenderedDocument doc = make_document();
    doc.root->style["display"] = "none";

    core::DiagnosticEmitter diagnostics;
    const ExtractResult result = extract_document(doc, {}, &diagnostics);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.message, "root element <body> is not rendered");
    EXPECT_EQ(diagnostics.events_by_severity(core::Severity::Error).size(), 1u);
}

TEST(ExtractDocumentTest, FallbackViewportAndHeight) {
    dom::RenderedDocument doc = make_document();
    doc.viewport_width = 0;
    doc.viewport_height = 0;
    doc.scroll_height = 0;

    ExtractOptions options;
    options.fallback_viewport_width = 800;
    options.fallback_viewport_height = 600;
    const ExtractResult result = extract_document(doc, options);
    ASSERT_TRUE(result.ok);
    EXPECT_FLOAT_EQ(result.document.viewport_width, 800.0f);
    EXPECT_FLOAT_EQ(result.document.viewport_height, 600.0f);
    EXPECT_FLOAT_EQ(result.document.full_height, 1500.0f);
}

TEST(ExtractDocumentTest, SvgAndImageLeaves) {
    dom::RenderedDocument doc = make_document();
    dom::Node* svg = add_element(*doc.root, "svg", {10, 10, 24, 24});
    svg->attributes["viewBox"] = "0 0 24 24";
    svg->append_child(dom::make_element("path"))->attributes["d"] = "M0 0h24v24H0z";

    dom::Node* img = add_element(*doc.root, "img", {0, 40, 320, 200});
    img->attributes["src"] = "../assets/hero.png";
    img->attributes["alt"] = "Hero";

    dom::Node* anonymous = add_element(*doc.root, "img", {0, 260, 10, 10});
    anonymous->attributes["src"] = "data:image/png;base64,AAAA";

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    const auto& children = result.document.root_node->children;
    ASSERT_EQ(children.size(), 3u);

    const ir::SvgData* svg_data = children[0].get_if<ir::SvgData>();
    ASSERT_NE(svg_data, nullptr);
    EXPECT_EQ(svg_data->svg_content,
              "<svg viewBox=\"0 0 24 24\"><path d=\"M0 0h24v24H0z\"/></svg>");
    EXPECT_TRUE(children[0].children.empty());

    EXPECT_EQ(children[1].name, "img: Hero");
    EXPECT_EQ(children[1].get_if<ir::ImageData>()->image_url, "https://example.com/assets/hero.png");
    EXPECT_EQ(children[2].name, "img");
    EXPECT_EQ(children[2].get_if<ir::ImageData>()->image_url, "data:image/png;base64,AAAA");
}

TEST(ExtractDocumentTest, BackgroundImageUrlOnlyWithoutGradient) {
    dom::RenderedDocument doc = make_document();
    dom::Node* hero = add_element(*doc.root, "div", {0, 0, 100, 100});
    hero->style["background-image"] = "url(\"img/bg.jpg\")";
    dom::Node* banner = add_element(*doc.root, "div", {0, 100, 100, 100});
    banner->style["background-image"] = "linear-gradient(red, blue), url(\"img/bg.jpg\")";

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    const auto& children = result.document.root_node->children;
    EXPECT_EQ(children[0].get_if<ir::FrameData>()->background_image_url,
              "https://example.com/page/img/bg.jpg");
    EXPECT_TRUE(children[0].fills.empty());
    EXPECT_TRUE(children[1].get_if<ir::FrameData>()->background_image_url.empty());
    ASSERT_EQ(children[1].fills.size(), 1u);
    EXPECT_TRUE(children[1].fills[0].is_gradient());
}

TEST(ExtractDocumentTest, BoxStyleOnFrames) {
    dom::RenderedDocument doc = make_document();
    dom::Node* card = add_element(*doc.root, "div", {0, 0, 300, 200});
    card->style["border-top-width"] = "2px";
    card->style["border-top-style"] = "solid";
    card->style["border-top-color"] = "rgb(200, 200, 200)";
    card->style["border-top-left-radius"] = "8px";
    card->style["box-shadow"] = "rgba(0, 0, 0, 0.1) 0px 1px 3px 0px";
    card->style["opacity"] = "0.6";

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    const ir::Node& node = result.document.root_node->children.at(0);
    ASSERT_EQ(node.strokes.size(), 1u);
    EXPECT_FLOAT_EQ(node.stroke_weight, 2.0f);
    EXPECT_EQ(node.stroke_align, style::StrokeAlign::Inside);
    ASSERT_TRUE(node.corner_radii.has_value());
    EXPECT_FLOAT_EQ(node.corner_radii->top_left, 8.0f);
    ASSERT_EQ(node.effects.size(), 1u);
    EXPECT_FLOAT_EQ(node.opacity, 0.6f);
}

TEST(ExtractDocumentTest, PseudoElementsBecomeTextChildren) {
    dom::RenderedDocument doc = make_document();
    dom::Node* badge = add_element(*doc.root, "div", {50, 50, 80, 20});
    badge->attributes["class"] = "badge";
    badge->pseudo_styles["::before"] = {{"content", "\"\\2022\""}, {"color", "rgb(255, 0, 0)"},
                                        {"font-size", "12px"}};
    badge->pseudo_styles["::after"] = {{"content", "none"}};

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.stats.pseudo_count, 1u);

    const ir::Node& badge_node = result.document.root_node->children.at(0);
    ASSERT_EQ(badge_node.children.size(), 1u);
    const ir::Node& before = badge_node.children[0];
    EXPECT_EQ(before.name, "div.badge::before");
    EXPECT_EQ(before.type(), ir::NodeType::Text);
    EXPECT_FLOAT_EQ(before.x, 0.0f);
    EXPECT_FLOAT_EQ(before.width, 80.0f);
    EXPECT_FLOAT_EQ(before.height, 12.0f);
    EXPECT_EQ(before.get_if<ir::TextData>()->characters, "\xE2\x80\xA2");
    ASSERT_EQ(before.fills.size(), 1u);

    ExtractOptions options;
    options.capture_pseudo_elements = false;
    const ExtractResult without = extract_document(doc, options);
    EXPECT_TRUE(without.document.root_node->children.at(0).children.empty());
}

TEST(ExtractDocumentTest, PseudoElementOfCollapsedParentKeepsMinimumSize) {
    dom::RenderedDocument doc = make_document();
    dom::Node* rule = add_element(*doc.root, "span", {0, 0, 0, 40});
    rule->pseudo_styles["::before"] = {{"content", "\"*\""}, {"font-size", "0.5px"}};

    const ExtractResult result = extract_document(doc);
    ASSERT_TRUE(result.ok);
    const ir::Node& parent = result.document.root_node->children.at(0);
    ASSERT_EQ(parent.children.size(), 1u);
    const ir::Node& before = parent.children[0];
    EXPECT_EQ(before.name, "span::before");
    EXPECT_FLOAT_EQ(before.width, 1.0f);
    EXPECT_FLOAT_EQ(before.height, 1.0f);
}
