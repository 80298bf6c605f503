#include <layercast/style/gradient_transform.h>
#include <gtest/gtest.h>

#include <cmath>
#include <vector>

using namespace layercast::style;

namespace {

constexpr float kEps = 1e-4f;

}  // namespace

TEST(GradientTransformTest, DirectionKeywords) {
    EXPECT_FLOAT_EQ(direction_to_angle("to top"), 0.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("to right"), 90.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("to bottom"), 180.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("to left"), 270.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("to top right"), 45.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("to right top"), 45.0f);
    EXPECT_FLOAT_EQ(direction_to_angle("  TO   Bottom  Left "), 225.0f);
}

TEST(GradientTransformTest, UnknownDirectionFallsBackToDefault) {
    EXPECT_FLOAT_EQ(direction_to_angle("to nowhere"), kDefaultGradientAngle);
    EXPECT_FLOAT_EQ(direction_to_angle(""), 180.0f);
}

TEST(GradientTransformTest, AngleUnits) {
    EXPECT_FLOAT_EQ(*parse_angle("45deg"), 45.0f);
    EXPECT_FLOAT_EQ(*parse_angle("0.5turn"), 180.0f);
    EXPECT_FLOAT_EQ(*parse_angle("100grad"), 90.0f);
    EXPECT_NEAR(*parse_angle("3.14159265rad"), 180.0f, 1e-3f);
    EXPECT_FALSE(parse_angle("45").has_value());
    EXPECT_FALSE(parse_angle("45px").has_value());
    EXPECT_FALSE(parse_angle("to right").has_value());
}

TEST(GradientTransformTest, LinearHandlesForRightwardGradient) {
    const HandlePositions handles = linear_handle_positions(90.0f);
    EXPECT_NEAR(handles[0].x, 0.0f, kEps);
    EXPECT_NEAR(handles[0].y, 0.5f, kEps);
    EXPECT_NEAR(handles[1].x, 1.0f, kEps);
    EXPECT_NEAR(handles[1].y, 0.5f, kEps);
    EXPECT_NEAR(handles[2].x, 0.5f, kEps);
    EXPECT_NEAR(handles[2].y, 1.0f, kEps);
}

TEST(GradientTransformTest, LinearHandlesSpanUnitLength) {
    for (float angle : {0.0f, 30.0f, 135.0f, 270.0f, 333.0f}) {
        const HandlePositions handles = linear_handle_positions(angle);
        const float dx = handles[1].x - handles[0].x;
        const float dy = handles[1].y - handles[0].y;
        EXPECT_NEAR(std::sqrt(dx * dx + dy * dy), 1.0f, kEps) << angle;
        EXPECT_NEAR((handles[0].x + handles[1].x) / 2, 0.5f, kEps) << angle;
        EXPECT_NEAR((handles[0].y + handles[1].y) / 2, 0.5f, kEps) << angle;
    }
}

TEST(GradientTransformTest, RadialHandles) {
    const HandlePositions handles = radial_handle_positions();
    EXPECT_EQ(handles[0], (Vec2{0.5f, 0.5f}));
    EXPECT_EQ(handles[1], (Vec2{1.0f, 0.5f}));
    EXPECT_EQ(handles[2], (Vec2{0.5f, 1.0f}));
}

TEST(GradientTransformTest, HandlesToTransform) {
    const HandlePositions handles = {{{0.0f, 0.5f}, {1.0f, 0.5f}, {0.5f, 1.0f}}};
    const Transform2x3 m = handles_to_transform(handles);
    EXPECT_FLOAT_EQ(m[0][0], 1.0f);
    EXPECT_FLOAT_EQ(m[0][1], 0.5f);
    EXPECT_FLOAT_EQ(m[0][2], 0.0f);
    EXPECT_FLOAT_EQ(m[1][0], 0.0f);
    EXPECT_FLOAT_EQ(m[1][1], 0.5f);
    EXPECT_FLOAT_EQ(m[1][2], 0.5f);
}

TEST(GradientTransformTest, ShortHandleListGivesIdentity) {
    const std::vector<Vec2> handles = {{0.0f, 0.0f}, {1.0f, 1.0f}};
    EXPECT_EQ(handles_to_transform(handles), identity_transform());
    EXPECT_EQ(handles_to_transform(std::vector<Vec2>{}), identity_transform());
}
