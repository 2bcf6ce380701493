#include <gtest/gtest.h>
#include <panelkit/layout/element.h>
#include <panelkit/layout/layout_root.h>
#include <panelkit/layout/stack_panel.h>

#include "test_elements.h"

#include <cmath>
#include <limits>
#include <memory>
#include <stdexcept>

using namespace panelkit::geometry;
using namespace panelkit::layout;
using panelkit::testing::FixedBox;

// 1. Content size is the desired size without margin or explicit size
TEST(ElementTest, DesiredSizeIsContentSize) {
    FixedBox box(50, 20);
    box.measure(Size(200, 200));
    EXPECT_EQ(box.desired_size(), Size(50, 20));
    EXPECT_EQ(box.layout_state(), LayoutState::Measured);
}

// 2. Margin and padding add to the desired size
TEST(ElementTest, MarginAndPaddingAddToDesiredSize) {
    FixedBox box(50, 20);
    box.set_margin(Thickness(5));
    box.set_padding(Thickness(2, 4));
    box.measure(Size(200, 200));
    EXPECT_EQ(box.desired_size(), Size(50 + 10 + 4, 20 + 10 + 8));
}

// 3. Padding shrinks the constraint seen by the content
TEST(ElementTest, PaddingShrinksContentConstraint) {
    FixedBox box(10, 10);
    box.set_padding(Thickness(10));
    box.measure(Size(100, 50));
    EXPECT_EQ(box.last_available, Size(80, 30));
}

// 4. Explicit size overrides content
TEST(ElementTest, ExplicitSizeOverridesContent) {
    FixedBox box(50, 20);
    box.set_width(100);
    box.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(box.desired_size().width(), 100.0f);
    EXPECT_FLOAT_EQ(box.desired_size().height(), 20.0f);
    EXPECT_TRUE(box.has_width());

    box.clear_width();
    EXPECT_FALSE(box.has_width());
    box.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(box.desired_size().width(), 50.0f);
}

// 5. Min and max clamp the content size
TEST(ElementTest, MinMaxClampContent) {
    FixedBox narrow(50, 20);
    narrow.set_max_width(30);
    narrow.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(narrow.desired_size().width(), 30.0f);

    FixedBox wide(50, 20);
    wide.set_min_width(80);
    wide.measure(Size(200, 200));
    EXPECT_FLOAT_EQ(wide.desired_size().width(), 80.0f);
}

// 6. Invalid explicit sizes are rejected
TEST(ElementTest, InvalidSizesThrow) {
    FixedBox box(1, 1);
    EXPECT_THROW(box.set_width(-1), std::invalid_argument);
    EXPECT_THROW(box.set_height(std::numeric_limits<float>::infinity()), std::invalid_argument);
    EXPECT_THROW(box.set_min_width(-5), std::invalid_argument);
    EXPECT_THROW(box.set_max_height(-5), std::invalid_argument);
    EXPECT_NO_THROW(box.set_max_height(std::numeric_limits<float>::infinity()));
    EXPECT_NO_THROW(box.set_width(std::numeric_limits<float>::quiet_NaN()));
    EXPECT_FALSE(box.has_width());
}

// 7. Measuring twice with the same constraint reuses the cached result
TEST(ElementTest, MeasureIsIdempotent) {
    FixedBox box(50, 20);
    box.measure(Size(100, 100));
    Size first = box.desired_size();
    box.measure(Size(100, 100));

    EXPECT_EQ(box.measure_calls, 1);
    EXPECT_EQ(box.desired_size(), first);
    EXPECT_FALSE(box.needs_measure());
}

// 8. A new constraint re-runs measure
TEST(ElementTest, NewConstraintRemeasures) {
    FixedBox box(50, 20);
    box.measure(Size(100, 100));
    box.measure(Size(80, 100));
    EXPECT_EQ(box.measure_calls, 2);
}

// 9. Invalidation forces a re-measure with the same constraint
TEST(ElementTest, InvalidateMeasureForcesRemeasure) {
    FixedBox box(50, 20);
    box.measure(Size(100, 100));
    box.set_content_size(Size(60, 20));
    EXPECT_TRUE(box.needs_measure());
    box.measure(Size(100, 100));
    EXPECT_EQ(box.measure_calls, 2);
    EXPECT_FLOAT_EQ(box.desired_size().width(), 60.0f);
}

// 10. Arranging before measuring is a logic error
TEST(ElementTest, ArrangeBeforeMeasureThrows) {
    FixedBox box(10, 10);
    EXPECT_THROW(box.arrange(Rect(0, 0, 10, 10)), std::logic_error);
}

// 11. Arrange with the same rect is skipped while clean
TEST(ElementTest, ArrangeIsIdempotent) {
    FixedBox box(10, 10);
    box.measure(Size(100, 100));
    box.arrange(Rect(0, 0, 100, 100));
    box.arrange(Rect(0, 0, 100, 100));
    EXPECT_EQ(box.arrange_calls, 1);
    EXPECT_FALSE(box.needs_arrange());
    EXPECT_EQ(box.layout_state(), LayoutState::Arranged);

    box.arrange(Rect(10, 0, 100, 100));
    EXPECT_EQ(box.arrange_calls, 2);
}

// 12. Stretch fills the slot; other alignments use the desired size
TEST(ElementTest, AlignmentInSlot) {
    FixedBox box(50, 20);
    box.set_horizontal_alignment(HorizontalAlignment::Center);
    box.measure(Size(200, 100));
    box.arrange(Rect(0, 0, 200, 100));
    EXPECT_EQ(box.bounds(), Rect(75, 0, 50, 100));

    box.set_horizontal_alignment(HorizontalAlignment::Right);
    box.set_vertical_alignment(VerticalAlignment::Bottom);
    box.arrange(Rect(0, 0, 200, 100));
    EXPECT_EQ(box.bounds(), Rect(150, 80, 50, 20));
}

// 13. Stretch does not override an explicit size
TEST(ElementTest, StretchRespectsExplicitSize) {
    FixedBox box(10, 10);
    box.set_width(40);
    box.measure(Size(200, 100));
    box.arrange(Rect(0, 0, 200, 100));
    EXPECT_FLOAT_EQ(box.bounds().width(), 40.0f);
    EXPECT_FLOAT_EQ(box.bounds().x(), 80.0f);
}

// 14. Alignment changes invalidate arrange only
TEST(ElementTest, AlignmentInvalidatesArrangeOnly) {
    FixedBox box(10, 10);
    box.measure(Size(100, 100));
    box.arrange(Rect(0, 0, 100, 100));

    box.set_vertical_alignment(VerticalAlignment::Top);
    EXPECT_FALSE(box.needs_measure());
    EXPECT_TRUE(box.needs_arrange());
}

// 15. Margin offsets the arranged bounds
TEST(ElementTest, MarginOffsetsBounds) {
    FixedBox box(10, 10);
    box.set_margin(Thickness(5, 10));
    box.measure(Size(100, 100));
    box.arrange(Rect(0, 0, 100, 100));
    EXPECT_EQ(box.bounds(), Rect(5, 10, 90, 80));
    EXPECT_EQ(box.last_content_bounds, Rect(5, 10, 90, 80));
}

// 16. Degenerate constraints never produce negative sizes
TEST(ElementTest, DegenerateConstraintsStayNonNegative) {
    FixedBox box(50, 20);
    box.set_margin(Thickness(-100));
    box.measure(Size(-10, std::numeric_limits<float>::quiet_NaN()));
    EXPECT_GE(box.desired_size().width(), 0.0f);
    EXPECT_GE(box.desired_size().height(), 0.0f);
    EXPECT_FALSE(std::isnan(box.desired_size().height()));

    box.arrange(Rect(0, 0, -5, -5));
    EXPECT_GE(box.bounds().width(), 0.0f);
    EXPECT_GE(box.bounds().height(), 0.0f);
}

// 17. Invisible elements measure to zero
TEST(ElementTest, InvisibleMeasuresToZero) {
    FixedBox box(50, 20);
    box.set_visible(false);
    box.measure(Size(100, 100));
    EXPECT_EQ(box.desired_size(), Size::empty());
    EXPECT_EQ(box.measure_calls, 0);
}

// 18. Invalidation bubbles to every clean ancestor
TEST(ElementTest, InvalidationBubblesToAncestors) {
    StackPanel outer;
    auto& inner = outer.emplace_child<StackPanel>();
    auto& leaf = inner.emplace_child<FixedBox>(10, 10);

    outer.measure(Size(100, 100));
    outer.arrange(Rect(0, 0, 100, 100));
    ASSERT_FALSE(outer.needs_measure());
    ASSERT_FALSE(inner.needs_measure());

    leaf.set_content_size(Size(20, 20));
    EXPECT_TRUE(leaf.needs_measure());
    EXPECT_TRUE(inner.needs_measure());
    EXPECT_TRUE(outer.needs_measure());
    EXPECT_TRUE(outer.needs_arrange());
}

// 19. A clean sibling is not re-measured when another child changes
TEST(ElementTest, CleanSiblingKeepsCache) {
    StackPanel panel;
    auto& a = panel.emplace_child<FixedBox>(10, 10);
    auto& b = panel.emplace_child<FixedBox>(10, 10);

    panel.measure(Size(100, 100));
    a.set_content_size(Size(10, 30));
    panel.measure(Size(100, 100));

    EXPECT_EQ(a.measure_calls, 2);
    EXPECT_EQ(b.measure_calls, 1);
    EXPECT_FLOAT_EQ(panel.desired_size().height(), 40.0f);
}

// 20. Tree queries
TEST(ElementTest, TreeQueries) {
    StackPanel outer;
    auto& inner = outer.emplace_child<StackPanel>();
    auto& leaf = inner.emplace_child<FixedBox>(10, 10);

    EXPECT_EQ(leaf.parent(), &inner);
    EXPECT_EQ(&leaf.visual_root(), &outer);
    EXPECT_TRUE(outer.is_ancestor_of(leaf));
    EXPECT_TRUE(leaf.is_descendant_of(outer));
    EXPECT_FALSE(leaf.is_ancestor_of(outer));
    EXPECT_FALSE(outer.is_descendant_of(outer));
    EXPECT_EQ(outer.visual_child_count(), 1u);
    EXPECT_EQ(outer.visual_child(0), &inner);
}

// 21. translate_point maps between arranged elements
TEST(ElementTest, TranslatePoint) {
    StackPanel panel;
    auto& first = panel.emplace_child<FixedBox>(10, 20);
    auto& second = panel.emplace_child<FixedBox>(10, 30);
    panel.measure(Size(100, 100));
    panel.arrange(Rect(0, 0, 100, 100));

    Point p = second.translate_point(Point(1, 2), first);
    EXPECT_FLOAT_EQ(p.x, 1.0f);
    EXPECT_FLOAT_EQ(p.y, 22.0f);

    Point back = first.translate_point(p, second);
    EXPECT_EQ(back, Point(1, 2));
}

// 22. translate_point across trees is rejected
TEST(ElementTest, TranslatePointAcrossTreesThrows) {
    FixedBox a(1, 1);
    FixedBox b(1, 1);
    EXPECT_THROW(a.translate_point(Point(0, 0), b), std::invalid_argument);
}

// 23. Layout state names
TEST(ElementTest, LayoutStateNames) {
    EXPECT_STREQ(layout_state_name(LayoutState::Unmeasured), "unmeasured");
    EXPECT_STREQ(layout_state_name(LayoutState::Arranged), "arranged");
}

// 24. Arranging after an invalidation without re-measuring is a logic error
TEST(ElementTest, ArrangeAfterInvalidationThrows) {
    StackPanel panel;
    auto& child = panel.emplace_child<FixedBox>(10, 20);
    panel.measure(Size(100, 101));
    panel.arrange(Rect(0, 0, 100, 101));

    child.set_content_size(Size(10, 50));
    EXPECT_THROW(panel.arrange(Rect(0, 0, 100, 101)), std::logic_error);
    EXPECT_THROW(child.arrange(Rect(0, 0, 100, 50)), std::logic_error);

    panel.measure(Size(100, 101));
    EXPECT_NO_THROW(panel.arrange(Rect(0, 0, 100, 101)));
    EXPECT_FLOAT_EQ(child.bounds().height(), 50.0f);
}

// 25. Hidden elements may be arranged while dirty
TEST(ElementTest, HiddenElementArrangeSkipsStaleCheck) {
    FixedBox box(10, 10);
    box.measure(Size(100, 100));
    box.set_visible(false);
    ASSERT_TRUE(box.needs_measure());
    EXPECT_NO_THROW(box.arrange(Rect(5, 5, 100, 100)));
    EXPECT_EQ(box.bounds(), Rect(5, 5, 0, 0));
}
