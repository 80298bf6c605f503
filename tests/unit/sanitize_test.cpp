#include <layercast/style/sanitize.h>
#include <layercast/style/value_parser.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using namespace layercast::style;

namespace {

const float kNaN = std::numeric_limits<float>::quiet_NaN();
const float kInf = std::numeric_limits<float>::infinity();

}  // namespace

TEST(SanitizeTest, ClampUnit) {
    EXPECT_FLOAT_EQ(clamp_unit(-1.0f), 0.0f);
    EXPECT_FLOAT_EQ(clamp_unit(0.3f), 0.3f);
    EXPECT_FLOAT_EQ(clamp_unit(7.0f), 1.0f);
    EXPECT_FLOAT_EQ(clamp_unit(kNaN), 0.0f);
}

TEST(SanitizeTest, SolidPaintIsClampedAndStripped) {
    Paint paint;
    paint.color = {1.5f, -0.2f, kNaN};
    paint.opacity = 3.0f;
    paint.stops.push_back({{1, 0, 0, 1}, 0});
    paint.handles.push_back({0, 0});

    const Paint out = sanitize_paint(paint);
    EXPECT_EQ(out.type, PaintType::Solid);
    EXPECT_FLOAT_EQ(out.color.r, 1.0f);
    EXPECT_FLOAT_EQ(out.color.g, 0.0f);
    EXPECT_FLOAT_EQ(out.color.b, 0.0f);
    EXPECT_FLOAT_EQ(out.opacity, 1.0f);
    EXPECT_TRUE(out.stops.empty());
    EXPECT_TRUE(out.handles.empty());
}

TEST(SanitizeTest, GradientStopsAndHandles) {
    Paint paint;
    paint.type = PaintType::GradientLinear;
    paint.stops = {{{2, 0, 0, 1}, -0.5f}, {{0, 0, 1, 5}, 1.5f}};
    paint.handles = {{kInf, 0.5f}, {1, kNaN}, {0.5f, 1}};

    const Paint out = sanitize_paint(paint);
    ASSERT_EQ(out.stops.size(), 2u);
    EXPECT_FLOAT_EQ(out.stops[0].color.r, 1.0f);
    EXPECT_FLOAT_EQ(out.stops[0].position, 0.0f);
    EXPECT_FLOAT_EQ(out.stops[1].color.a, 1.0f);
    EXPECT_FLOAT_EQ(out.stops[1].position, 1.0f);
    ASSERT_EQ(out.handles.size(), 3u);
    EXPECT_FLOAT_EQ(out.handles[0].x, 0.0f);
    EXPECT_FLOAT_EQ(out.handles[1].y, 0.0f);
    EXPECT_FLOAT_EQ(out.handles[2].y, 1.0f);
}

TEST(SanitizeTest, PaintSanitizingIsIdempotent) {
    auto gradient = parse_gradient("linear-gradient(45deg, rgba(255, 0, 0, 0.5), blue 120%)");
    ASSERT_TRUE(gradient.has_value());
    Paint solid = Paint::solid({0.2f, 1.4f, -1.0f, 0.5f});

    for (const Paint& paint : {*gradient, solid}) {
        const Paint once = sanitize_paint(paint);
        EXPECT_EQ(sanitize_paint(once), once);
    }
}

TEST(SanitizeTest, EffectSanitizing) {
    Effect effect;
    effect.color = {0, 0, 0, 1.5f};
    effect.offset = {kNaN, 4};
    effect.radius = -3;
    effect.spread = kInf;
    effect.visible = false;

    const Effect out = sanitize_effect(effect);
    EXPECT_FLOAT_EQ(out.color.a, 1.0f);
    EXPECT_FLOAT_EQ(out.offset.x, 0.0f);
    EXPECT_FLOAT_EQ(out.offset.y, 4.0f);
    EXPECT_FLOAT_EQ(out.radius, 0.0f);
    EXPECT_FLOAT_EQ(out.spread, 0.0f);
    EXPECT_TRUE(out.visible);
    EXPECT_EQ(sanitize_effect(out), out);
}

TEST(SanitizeTest, ListsKeepOrder) {
    const auto effects = sanitize_effects(parse_box_shadow("red 1px 1px, blue 2px 2px"));
    ASSERT_EQ(effects.size(), 2u);
    EXPECT_FLOAT_EQ(effects[0].color.r, 1.0f);
    EXPECT_FLOAT_EQ(effects[1].color.b, 1.0f);

    const auto paints = sanitize_paints({Paint::solid({1, 0, 0, 1}), Paint::solid({0, 1, 0, 1})});
    ASSERT_EQ(paints.size(), 2u);
    EXPECT_FLOAT_EQ(paints[1].color.g, 1.0f);
}

TEST(SanitizeTest, FontFamilyMapping) {
    EXPECT_EQ(sanitize_font_family("system-ui, sans-serif"), "Inter");
    EXPECT_EQ(sanitize_font_family("-apple-system"), "Inter");
    EXPECT_EQ(sanitize_font_family("\"Segoe UI\", Roboto"), "Inter");
    EXPECT_EQ(sanitize_font_family("serif"), "Georgia");
    EXPECT_EQ(sanitize_font_family("monospace"), "Roboto Mono");
    EXPECT_EQ(sanitize_font_family("'Playfair Display', serif"), "Playfair Display");
    EXPECT_EQ(sanitize_font_family(""), "Inter");
}
