#include <gtest/gtest.h>
#include <panelkit/layout/layout_root.h>
#include <panelkit/layout/layout_rounding.h>
#include <panelkit/layout/stack_panel.h>

#include "test_elements.h"

#include <limits>

using namespace panelkit::geometry;
using namespace panelkit::layout;
using panelkit::testing::FixedBox;

// 1. Midpoints round away from zero
TEST(LayoutRoundingTest, MidpointsRoundAwayFromZero) {
    EXPECT_FLOAT_EQ(round_to_pixel(1.5f, 1.0f), 2.0f);
    EXPECT_FLOAT_EQ(round_to_pixel(-1.5f, 1.0f), -2.0f);
    EXPECT_FLOAT_EQ(round_to_pixel(2.4f, 1.0f), 2.0f);
}

// 2. Scale maps DIPs onto the device grid
TEST(LayoutRoundingTest, HighDpiScale) {
    EXPECT_FLOAT_EQ(round_to_pixel(1.26f, 2.0f), 1.5f);
    EXPECT_EQ(round_to_pixel_int(1.26f, 2.0f), 3);
    EXPECT_EQ(ceil_to_pixel_int(1.1f, 2.0f), 3);
}

// 3. Unusable scales leave the value alone
TEST(LayoutRoundingTest, InvalidScaleIsIdentity) {
    EXPECT_FLOAT_EQ(round_to_pixel(1.3f, 0.0f), 1.3f);
    EXPECT_FLOAT_EQ(round_to_pixel(1.3f, -2.0f), 1.3f);
    EXPECT_FLOAT_EQ(round_to_pixel(1.3f, std::numeric_limits<float>::infinity()), 1.3f);
}

// 4. Size rounding keeps infinity
TEST(LayoutRoundingTest, SizeRounding) {
    EXPECT_EQ(round_size_to_pixels(Size(10.4f, 10.6f), 1.0f), Size(10, 11));
    Size unbounded = round_size_to_pixels(Size(std::numeric_limits<float>::infinity(), 3.7f), 1.0f);
    EXPECT_TRUE(unbounded.has_infinite_width());
    EXPECT_FLOAT_EQ(unbounded.height(), 4.0f);
}

// 5. Rect rounding rounds position and size independently
TEST(LayoutRoundingTest, RectRounding) {
    EXPECT_EQ(round_rect_to_pixels(Rect(0.4f, 0.6f, 10.5f, 3.2f), 1.0f), Rect(0, 1, 11, 3));
}

// 6. Edge snapping rounds each edge
TEST(LayoutRoundingTest, EdgeSnapping) {
    EXPECT_EQ(snap_rect_edges_to_pixels(Rect(0.4f, 0, 10.4f, 1), 1.0f), Rect(0, 0, 11, 1));
    EXPECT_EQ(snap_rect_edges_to_pixels_outward(Rect(0.5f, 0.5f, 1, 1), 1.0f), Rect(0, 0, 2, 2));
}

// 7. Layout rounding snaps desired sizes and bounds during a pass
TEST(LayoutRoundingTest, LayoutPassRoundsWhenEnabled) {
    LayoutRoot root(LayoutOptions::for_dpi(96));
    auto& panel = root.emplace_root<StackPanel>();
    auto& box = panel.emplace_child<FixedBox>(10.4f, 10.6f);

    root.update_layout(Size(100.3f, 100));

    EXPECT_EQ(box.desired_size(), Size(10, 11));
    EXPECT_FLOAT_EQ(box.bounds().width(), 100.0f);
    EXPECT_FLOAT_EQ(box.bounds().height(), 11.0f);
}

// 8. Rounding is off by default
TEST(LayoutRoundingTest, DisabledByDefault) {
    LayoutRoot root;
    auto& box = root.emplace_root<FixedBox>(10.4f, 10.6f);
    root.update_layout(Size::infinity());
    EXPECT_FLOAT_EQ(box.desired_size().width(), 10.4f);
}

// 9. Integer rounding saturates instead of overflowing
TEST(LayoutRoundingTest, IntRoundingSaturates) {
    EXPECT_EQ(round_to_pixel_int(1e12f, 1.0f), std::numeric_limits<int>::max());
    EXPECT_EQ(round_to_pixel_int(-1e12f, 1.0f), std::numeric_limits<int>::min());
    EXPECT_EQ(ceil_to_pixel_int(1e12f, 2.0f), std::numeric_limits<int>::max());
    EXPECT_EQ(round_to_pixel_int(std::numeric_limits<float>::quiet_NaN(), 1.0f), 0);
}

// 10. Rects wider than the int range keep their extent
TEST(LayoutRoundingTest, HugeRectsKeepExtent) {
    Rect huge(0, 0, 1e10f, 10.4f);
    EXPECT_FLOAT_EQ(round_rect_to_pixels(huge, 1.0f).width(), 1e10f);
    EXPECT_FLOAT_EQ(snap_rect_edges_to_pixels(huge, 1.0f).width(), 1e10f);
    EXPECT_FLOAT_EQ(snap_rect_edges_to_pixels_outward(huge, 1.0f).width(), 1e10f);
    EXPECT_FLOAT_EQ(snap_rect_edges_to_pixels_outward(huge, 1.0f).height(), 11.0f);
}

// 11. A rounded layout pass keeps a huge desired width
TEST(LayoutRoundingTest, LayoutPassKeepsHugeWidth) {
    LayoutRoot root(LayoutOptions::for_dpi(96));
    auto& box = root.emplace_root<FixedBox>(1e10f, 10.0f);

    root.update_layout(Size::infinity());

    EXPECT_FLOAT_EQ(box.desired_size().width(), 1e10f);
    EXPECT_FLOAT_EQ(box.bounds().width(), 1e10f);
    EXPECT_FLOAT_EQ(box.bounds().height(), 10.0f);
}
