#include <panelkit/layout/dock_panel.h>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace panelkit::layout {

const char* dock_name(Dock dock) {
    switch (dock) {
        case Dock::Left:   return "left";
        case Dock::Top:    return "top";
        case Dock::Right:  return "right";
        case Dock::Bottom: return "bottom";
    }
    return "unknown";
}

AttachedTable<DockPanel::DockData>& DockPanel::dock_table() {
    static AttachedTable<DockData> table;
    return table;
}

void DockPanel::set_dock(Element& element, Dock dock) {
    const DockData* existing = dock_table().find(element);
    if (existing && existing->dock == dock) return;
    dock_table().get_or_create(element).dock = dock;
    element.invalidate_measure();
}

Dock DockPanel::get_dock(const Element& element) {
    const DockData* data = dock_table().find(element);
    return data ? data->dock : Dock::Left;
}

bool DockPanel::has_dock(const Element& element) {
    return dock_table().contains(element);
}

void DockPanel::set_last_child_fill(bool fill) {
    if (last_child_fill_ == fill) return;
    last_child_fill_ = fill;
    invalidate_measure();
}

void DockPanel::set_spacing(float spacing) {
    if (spacing_ == spacing) return;
    spacing_ = spacing;
    invalidate_measure();
}

float DockPanel::effective_spacing() const {
    if (std::isnan(spacing_) || spacing_ <= 0) return 0;
    return spacing_;
}

int DockPanel::last_visible_index() const {
    const auto& items = children();
    for (int i = static_cast<int>(items.size()) - 1; i >= 0; --i) {
        if (items[static_cast<std::size_t>(i)]->is_visible()) return i;
    }
    return -1;
}

// ---------------------------------------------------------------------------
// Measure
// ---------------------------------------------------------------------------

geometry::Size DockPanel::measure_content(const geometry::Size& available) {
    int last_visible = last_visible_index();
    if (last_visible < 0) {
        return geometry::Size::empty();
    }

    if (spacing_ < 0) {
        std::ostringstream oss;
        oss << "negative spacing " << spacing_ << " laid out as 0";
        report(core::Severity::Warning, core::config::kModuleDock, "measure", oss.str());
    }

    const float spacing = effective_spacing();
    float used_w = 0;
    float used_h = 0;
    float desired_w = 0;
    float desired_h = 0;

    const auto& items = children();
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        Element& child = *items[static_cast<std::size_t>(i)];
        if (!child.is_visible()) continue;

        const bool is_fill = last_child_fill_ && i == last_visible;
        // Size clamps both axes at 0; infinity minus a finite total stays infinite.
        geometry::Size remaining(available.width() - used_w, available.height() - used_h);

        if (is_fill) {
            child.measure(remaining);
            const geometry::Size& desired = child.desired_size();
            desired_w = std::max(desired_w, used_w + desired.width());
            desired_h = std::max(desired_h, used_h + desired.height());
            continue;
        }

        const Dock dock = get_dock(child);
        const bool horizontal = dock == Dock::Left || dock == Dock::Right;

        // Two passes: learn the natural extent along the docking axis, then
        // re-measure against the clamped extent so content that wraps can
        // respond to the space it will really get.
        if (horizontal) {
            child.measure(geometry::Size(geometry::kInfinity, remaining.height()));
            float w = std::min(child.desired_size().width(), remaining.width());
            child.measure(geometry::Size(w, remaining.height()));
        } else {
            child.measure(geometry::Size(remaining.width(), geometry::kInfinity));
            float h = std::min(child.desired_size().height(), remaining.height());
            child.measure(geometry::Size(remaining.width(), h));
        }

        const geometry::Size& desired = child.desired_size();
        const float gap = i != last_visible ? spacing : 0;

        if (horizontal) {
            used_w += std::min(desired.width(), remaining.width()) + gap;
            desired_w = std::max(desired_w, used_w);
            desired_h = std::max(desired_h, used_h + desired.height());
        } else {
            used_h += std::min(desired.height(), remaining.height()) + gap;
            desired_w = std::max(desired_w, used_w + desired.width());
            desired_h = std::max(desired_h, used_h);
        }
    }

    return {desired_w, desired_h};
}

// ---------------------------------------------------------------------------
// Arrange
// ---------------------------------------------------------------------------

void DockPanel::arrange_content(const geometry::Rect& content_bounds) {
    int last_visible = last_visible_index();
    if (last_visible < 0) {
        return;
    }

    const float spacing = effective_spacing();
    float left = content_bounds.left();
    float top = content_bounds.top();
    float right = content_bounds.right();
    float bottom = content_bounds.bottom();

    const auto& items = children();
    for (int i = 0; i < static_cast<int>(items.size()); ++i) {
        Element& child = *items[static_cast<std::size_t>(i)];
        if (!child.is_visible()) continue;

        const float remaining_w = std::max(0.0f, right - left);
        const float remaining_h = std::max(0.0f, bottom - top);

        if (last_child_fill_ && i == last_visible) {
            child.arrange(geometry::Rect(left, top, remaining_w, remaining_h));
            continue;
        }

        const geometry::Size& desired = child.desired_size();
        const float gap = i != last_visible ? spacing : 0;

        switch (get_dock(child)) {
            case Dock::Left: {
                float w = std::min(desired.width(), remaining_w);
                child.arrange(geometry::Rect(left, top, w, remaining_h));
                left += w + gap;
                break;
            }
            case Dock::Right: {
                float w = std::min(desired.width(), remaining_w);
                child.arrange(geometry::Rect(std::max(left, right - w), top, w, remaining_h));
                right -= w + gap;
                break;
            }
            case Dock::Top: {
                float h = std::min(desired.height(), remaining_h);
                child.arrange(geometry::Rect(left, top, remaining_w, h));
                top += h + gap;
                break;
            }
            case Dock::Bottom: {
                float h = std::min(desired.height(), remaining_h);
                child.arrange(geometry::Rect(left, std::max(top, bottom - h), remaining_w, h));
                bottom -= h + gap;
                break;
            }
        }
    }
}

} // namespace panelkit::layout
