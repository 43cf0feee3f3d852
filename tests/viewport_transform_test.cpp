#include "gtest/gtest.h"

#include <paygraph/render/render_snapshot.h>
#include <paygraph/render/viewport_transform.h>

#include <cmath>
#include <limits>

using paygraph::render::ViewportTransform;
using paygraph::render::ZoomLimits;

TEST(ViewportTransformTest, WorldScreenRoundTrip) {
    ViewportTransform transform;
    ImVec2 world_point(100, 200);

    ImVec2 screen_point = transform.WorldToScreen(world_point);
    EXPECT_NEAR(screen_point.x, 100.0f, 1e-4);
    EXPECT_NEAR(screen_point.y, 200.0f, 1e-4);

    transform.Set(ImVec2(30, -40), 2.0f);
    screen_point = transform.WorldToScreen(world_point);
    EXPECT_NEAR(screen_point.x, 230.0f, 1e-4);
    EXPECT_NEAR(screen_point.y, 360.0f, 1e-4);

    ImVec2 world_point_rt = transform.ScreenToWorld(screen_point);
    EXPECT_NEAR(world_point.x, world_point_rt.x, 1e-3);
    EXPECT_NEAR(world_point.y, world_point_rt.y, 1e-3);
}

TEST(ViewportTransformTest, ZoomKeepsPointUnderCursorFixed) {
    ViewportTransform transform;
    transform.Set(ImVec2(15, -25), 1.0f);
    ImVec2 cursor(320, 180);
    ImVec2 world_under_cursor = transform.ScreenToWorld(cursor);

    ASSERT_TRUE(transform.ZoomAt(cursor, 1.1f));
    EXPECT_NEAR(transform.Scale(), 1.1f, 1e-5);
    ImVec2 screen_after = transform.WorldToScreen(world_under_cursor);
    EXPECT_NEAR(screen_after.x, cursor.x, 1e-3);
    EXPECT_NEAR(screen_after.y, cursor.y, 1e-3);

    ASSERT_TRUE(transform.ZoomAt(cursor, 0.9f));
    screen_after = transform.WorldToScreen(world_under_cursor);
    EXPECT_NEAR(screen_after.x, cursor.x, 1e-3);
    EXPECT_NEAR(screen_after.y, cursor.y, 1e-3);
}

TEST(ViewportTransformTest, ScaleIsClampedToLimits) {
    ViewportTransform transform;
    for (int i = 0; i < 50; ++i) transform.ZoomAt(ImVec2(0, 0), 1.1f);
    EXPECT_FLOAT_EQ(transform.Scale(), 3.0f);
    EXPECT_FALSE(transform.ZoomAt(ImVec2(10, 10), 1.1f));

    for (int i = 0; i < 100; ++i) transform.ZoomAt(ImVec2(0, 0), 0.9f);
    EXPECT_FLOAT_EQ(transform.Scale(), 0.2f);
    EXPECT_FALSE(transform.ZoomAt(ImVec2(10, 10), 0.9f));

    transform.Set(ImVec2(0, 0), 100.0f);
    EXPECT_FLOAT_EQ(transform.Scale(), 3.0f);
}

TEST(ViewportTransformTest, ClampedZoomStillKeepsCursorFixed) {
    ViewportTransform transform(ZoomLimits{0.5f, 2.0f});
    transform.Set(ImVec2(0, 0), 1.9f);
    ImVec2 cursor(100, 50);
    ImVec2 world = transform.ScreenToWorld(cursor);

    ASSERT_TRUE(transform.ZoomAt(cursor, 1.3f));
    EXPECT_FLOAT_EQ(transform.Scale(), 2.0f);
    ImVec2 screen = transform.WorldToScreen(world);
    EXPECT_NEAR(screen.x, cursor.x, 1e-3);
    EXPECT_NEAR(screen.y, cursor.y, 1e-3);
}

TEST(ViewportTransformTest, RejectsInvalidFactors) {
    ViewportTransform transform;
    EXPECT_FALSE(transform.ZoomAt(ImVec2(0, 0), 0.0f));
    EXPECT_FALSE(transform.ZoomAt(ImVec2(0, 0), -2.0f));
    EXPECT_FALSE(transform.ZoomAt(ImVec2(0, 0), std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(transform.ZoomAt(ImVec2(0, 0), std::numeric_limits<float>::infinity()));
    EXPECT_FLOAT_EQ(transform.Scale(), 1.0f);
}

TEST(ViewportTransformTest, ZoomAroundCenterUsesViewportMiddle) {
    ViewportTransform transform;
    ImVec2 size(960, 500);
    ImVec2 center_world = transform.ScreenToWorld(ImVec2(480, 250));

    ASSERT_TRUE(transform.ZoomAroundCenter(1.3f, size));
    ImVec2 screen = transform.WorldToScreen(center_world);
    EXPECT_NEAR(screen.x, 480.0f, 1e-3);
    EXPECT_NEAR(screen.y, 250.0f, 1e-3);
}

TEST(ViewportTransformTest, PanAndReset) {
    ViewportTransform transform;
    transform.PanBy(ImVec2(12, -8));
    transform.PanBy(ImVec2(3, 3));
    EXPECT_FLOAT_EQ(transform.Pan().x, 15.0f);
    EXPECT_FLOAT_EQ(transform.Pan().y, -5.0f);
    transform.ZoomAt(ImVec2(50, 50), 1.1f);

    transform.Reset();
    EXPECT_FLOAT_EQ(transform.Pan().x, 0.0f);
    EXPECT_FLOAT_EQ(transform.Pan().y, 0.0f);
    EXPECT_FLOAT_EQ(transform.Scale(), 1.0f);
}

TEST(ViewportTransformTest, SnapshotTransformMatchesViewport) {
    ViewportTransform transform;
    transform.Set(ImVec2(0, 30), 1.0f);
    paygraph::render::TransformState state{transform.Pan(), transform.Scale()};

    // A node above the canvas top in world space is still on screen after the pan
    ImVec2 label_anchor = state.Apply(ImVec2(300, -20));
    EXPECT_NEAR(label_anchor.x, 300.0f, 1e-4);
    EXPECT_NEAR(label_anchor.y, 10.0f, 1e-4);

    transform.ZoomAt(ImVec2(120, 80), 1.7f);
    state = {transform.Pan(), transform.Scale()};
    ImVec2 expected = transform.WorldToScreen(ImVec2(-45, 210));
    ImVec2 actual = state.Apply(ImVec2(-45, 210));
    EXPECT_NEAR(actual.x, expected.x, 1e-3);
    EXPECT_NEAR(actual.y, expected.y, 1e-3);
}
