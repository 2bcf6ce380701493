#include <gtest/gtest.h>
#include <panelkit/layout/layout_root.h>
#include <panelkit/layout/stack_panel.h>

#include "test_elements.h"

#include <cmath>
#include <limits>
#include <memory>

using namespace panelkit::geometry;
using namespace panelkit::layout;
using panelkit::core::Severity;
using panelkit::testing::FixedBox;

// 1. Vertical desired height sums children plus spacing
TEST(StackPanelTest, VerticalDesiredSizeIncludesSpacing) {
    StackPanel panel;
    panel.set_spacing(8);
    panel.emplace_child<FixedBox>(10, 20);
    panel.emplace_child<FixedBox>(30, 30);
    panel.emplace_child<FixedBox>(20, 40);

    panel.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(panel.desired_size().height(), 106.0f);
    EXPECT_FLOAT_EQ(panel.desired_size().width(), 30.0f);
}

// 2. Empty panel measures to zero
TEST(StackPanelTest, EmptyPanelIsZero) {
    StackPanel panel;
    panel.set_spacing(8);
    panel.measure(Size(200, 200));
    EXPECT_EQ(panel.desired_size(), Size::empty());
}

// 3. Invisible children take no space and add no spacing
TEST(StackPanelTest, InvisibleChildrenSkipped) {
    StackPanel panel;
    panel.set_spacing(8);
    panel.emplace_child<FixedBox>(10, 20);
    panel.emplace_child<FixedBox>(10, 30).set_visible(false);
    panel.emplace_child<FixedBox>(10, 40);

    panel.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(panel.desired_size().height(), 68.0f);
}

// 4. Only invisible children measures to zero
TEST(StackPanelTest, AllInvisibleIsZero) {
    StackPanel panel;
    panel.set_spacing(8);
    panel.emplace_child<FixedBox>(10, 20).set_visible(false);
    panel.measure(Size(200, 200));
    EXPECT_EQ(panel.desired_size(), Size::empty());
}

// 5. Vertical arrange stacks children and stretches the cross axis
TEST(StackPanelTest, VerticalArrangePositions) {
    StackPanel panel;
    panel.set_spacing(8);
    auto& a = panel.emplace_child<FixedBox>(10, 20);
    auto& b = panel.emplace_child<FixedBox>(10, 30);
    auto& c = panel.emplace_child<FixedBox>(10, 40);

    panel.measure(Size(100, 200));
    panel.arrange(Rect(0, 0, 100, 200));

    EXPECT_EQ(a.bounds(), Rect(0, 0, 100, 20));
    EXPECT_EQ(b.bounds(), Rect(0, 28, 100, 30));
    EXPECT_EQ(c.bounds(), Rect(0, 66, 100, 40));
}

// 6. Horizontal orientation
TEST(StackPanelTest, HorizontalLayout) {
    StackPanel panel(Orientation::Horizontal);
    panel.set_spacing(5);
    auto& a = panel.emplace_child<FixedBox>(10, 15);
    auto& b = panel.emplace_child<FixedBox>(20, 25);

    panel.measure(Size(200, 50));
    EXPECT_EQ(panel.desired_size(), Size(35, 25));

    panel.arrange(Rect(0, 0, 200, 50));
    EXPECT_EQ(a.bounds(), Rect(0, 0, 10, 50));
    EXPECT_EQ(b.bounds(), Rect(15, 0, 20, 50));
}

// 7. Children get an unbounded main axis and the panel's cross axis
TEST(StackPanelTest, ChildConstraintIsUnboundedOnMainAxis) {
    StackPanel panel;
    auto& a = panel.emplace_child<FixedBox>(10, 10);
    panel.measure(Size(120, 50));

    EXPECT_FLOAT_EQ(a.last_available.width(), 120.0f);
    EXPECT_TRUE(a.last_available.has_infinite_height());
}

// 8. Negative spacing lays out as 0 and warns
TEST(StackPanelTest, NegativeSpacingWarns) {
    LayoutRoot root;
    auto& panel = root.emplace_root<StackPanel>();
    panel.set_spacing(-5);
    panel.emplace_child<FixedBox>(10, 20);
    panel.emplace_child<FixedBox>(10, 30);

    root.update_layout(Size(100, 100));

    EXPECT_FLOAT_EQ(panel.spacing(), -5.0f);
    EXPECT_FLOAT_EQ(panel.desired_size().height(), 50.0f);
    auto warnings = root.diagnostics().events_by_module("stack");
    ASSERT_FALSE(warnings.empty());
    EXPECT_EQ(warnings[0].severity, Severity::Warning);
}

// 9. Changing orientation invalidates measure
TEST(StackPanelTest, OrientationChangeInvalidates) {
    StackPanel panel;
    panel.emplace_child<FixedBox>(10, 20);
    panel.emplace_child<FixedBox>(10, 20);
    panel.measure(Size(100, 100));
    EXPECT_EQ(panel.desired_size(), Size(10, 40));

    panel.set_orientation(Orientation::Horizontal);
    EXPECT_TRUE(panel.needs_measure());
    panel.measure(Size(100, 100));
    EXPECT_EQ(panel.desired_size(), Size(20, 20));
}

// 10. Zero, negative and NaN sizes never produce negative or NaN bounds
TEST(StackPanelTest, DegenerateSizesStayNonNegative) {
    for (Orientation orientation : {Orientation::Vertical, Orientation::Horizontal}) {
        StackPanel panel(orientation);
        panel.set_spacing(5);
        panel.emplace_child<FixedBox>(0, 0);
        panel.emplace_child<FixedBox>(-5, std::numeric_limits<float>::quiet_NaN());
        panel.emplace_child<FixedBox>(10, 20);

        panel.measure(Size(-10, std::numeric_limits<float>::quiet_NaN()));
        panel.arrange(Rect(0, 0, -5, std::numeric_limits<float>::quiet_NaN()));

        EXPECT_FALSE(std::isnan(panel.desired_size().width()));
        EXPECT_FALSE(std::isnan(panel.desired_size().height()));
        panel.for_each_child([](const Element& child) {
            const Rect& b = child.bounds();
            EXPECT_FALSE(std::isnan(b.x()) || std::isnan(b.y()));
            EXPECT_FALSE(std::isnan(b.width()) || std::isnan(b.height()));
            EXPECT_GE(b.width(), 0.0f);
            EXPECT_GE(b.height(), 0.0f);
        });
    }
}
