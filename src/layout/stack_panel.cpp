#include <panelkit/layout/stack_panel.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace panelkit::layout {

void StackPanel::set_orientation(Orientation orientation) {
    if (orientation_ == orientation) return;
    orientation_ = orientation;
    invalidate_measure();
}

void StackPanel::set_spacing(float spacing) {
    if (spacing_ == spacing) return;
    spacing_ = spacing;
    invalidate_measure();
}

float StackPanel::effective_spacing() const {
    if (std::isnan(spacing_) || spacing_ <= 0) return 0;
    return spacing_;
}

geometry::Size StackPanel::measure_content(const geometry::Size& available) {
    if (spacing_ < 0) {
        std::ostringstream oss;
        oss << "negative spacing " << spacing_ << " laid out as 0";
        report(core::Severity::Warning, core::config::kModuleStack, "measure", oss.str());
    }

    const bool vertical = orientation_ == Orientation::Vertical;
    const float spacing = effective_spacing();
    float used_main = 0;
    float max_cross = 0;
    bool has_previous = false;

    for (const auto& child : children()) {
        if (!child->is_visible()) continue;

        if (has_previous) {
            used_main += spacing;
        }

        if (vertical) {
            child->measure(geometry::Size(available.width(), geometry::kInfinity));
            used_main += child->desired_size().height();
            max_cross = std::max(max_cross, child->desired_size().width());
        } else {
            child->measure(geometry::Size(geometry::kInfinity, available.height()));
            used_main += child->desired_size().width();
            max_cross = std::max(max_cross, child->desired_size().height());
        }

        has_previous = true;
    }

    return vertical ? geometry::Size(max_cross, used_main) : geometry::Size(used_main, max_cross);
}

void StackPanel::arrange_content(const geometry::Rect& content_bounds) {
    const bool vertical = orientation_ == Orientation::Vertical;
    const float spacing = effective_spacing();
    float offset = 0;
    bool has_previous = false;

    for (const auto& child : children()) {
        if (!child->is_visible()) continue;

        if (has_previous) {
            offset += spacing;
        }

        if (vertical) {
            float child_height = child->desired_size().height();
            child->arrange(geometry::Rect(content_bounds.x(), content_bounds.y() + offset,
                                          content_bounds.width(), child_height));
            offset += child_height;
        } else {
            float child_width = child->desired_size().width();
            child->arrange(geometry::Rect(content_bounds.x() + offset, content_bounds.y(),
                                          child_width, content_bounds.height()));
            offset += child_width;
        }

        has_previous = true;
    }
}

} // namespace panelkit::layout
