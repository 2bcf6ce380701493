#include <panelkit/layout/element.h>

#include <panelkit/core/config.h>
#include <panelkit/layout/attached.h>
#include <panelkit/layout/layout_rounding.h>
#include <panelkit/layout/layout_root.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace panelkit::layout {

namespace {

constexpr float kAuto = std::numeric_limits<float>::quiet_NaN();

// min wins over max when the two are inverted.
float clamp_extent(float value, float min, float max) {
    return std::max(min, std::min(value, max));
}

void require_explicit_size(float value, const char* what) {
    if (std::isnan(value)) return;
    if (!std::isfinite(value) || value < 0) {
        throw std::invalid_argument(std::string(what) + " must be finite and >= 0");
    }
}

void require_min(float value, const char* what) {
    if (!std::isfinite(value) || value < 0) {
        throw std::invalid_argument(std::string(what) + " must be finite and >= 0");
    }
}

void require_max(float value, const char* what) {
    if (std::isnan(value) || value < 0) {
        throw std::invalid_argument(std::string(what) + " must be >= 0");
    }
}

} // namespace

const char* layout_state_name(LayoutState state) {
    switch (state) {
        case LayoutState::Unmeasured: return "unmeasured";
        case LayoutState::Measured:   return "measured";
        case LayoutState::Arranged:   return "arranged";
    }
    return "unknown";
}

Element::Element() : width_(kAuto), height_(kAuto) {}

Element::~Element() {
    AttachedTableBase::release_all(*this);
}

// ---------------------------------------------------------------------------
// Measure
// ---------------------------------------------------------------------------

void Element::measure(const geometry::Size& available) {
    if (!needs_measure_ && has_constraint_ && last_constraint_ == available) {
        return;
    }

    geometry::Size result;
    if (visible_) {
        float margin_w = margin_.horizontal_thickness();
        float margin_h = margin_.vertical_thickness();

        float constraint_w = available.width() - margin_w;
        float constraint_h = available.height() - margin_h;
        constraint_w = clamp_extent(has_width() ? width_ : constraint_w, min_width_, max_width_);
        constraint_h = clamp_extent(has_height() ? height_ : constraint_h, min_height_, max_height_);

        geometry::Size content_available =
            geometry::Size(constraint_w, constraint_h).deflate(padding_);
        geometry::Size measured = measure_content(content_available).inflate(padding_);

        float content_w = measured.width();
        float content_h = measured.height();
        if (!std::isfinite(content_w) || !std::isfinite(content_h)) {
            std::ostringstream oss;
            oss << "measured to a non-finite " << measured.to_string()
                << "; treating the unbounded axis as 0";
            report(core::Severity::Warning, core::config::kModuleLayout, "measure", oss.str());
            if (!std::isfinite(content_w)) content_w = 0;
            if (!std::isfinite(content_h)) content_h = 0;
        }

        float final_w = has_width() ? width_ : content_w;
        float final_h = has_height() ? height_ : content_h;
        final_w = clamp_extent(final_w, min_width_, max_width_);
        final_h = clamp_extent(final_h, min_height_, max_height_);

        // Size clamps a negative margin sum back to 0.
        result = geometry::Size(final_w + margin_w, final_h + margin_h);
        result = round_if_enabled(result);
    }

    desired_size_ = result;
    last_constraint_ = available;
    has_constraint_ = true;
    needs_measure_ = false;
    needs_arrange_ = true;
    state_ = LayoutState::Measured;
}

geometry::Size Element::measure_content(const geometry::Size&) {
    return geometry::Size::empty();
}

// ---------------------------------------------------------------------------
// Arrange
// ---------------------------------------------------------------------------

void Element::arrange(const geometry::Rect& final_rect) {
    if (!has_constraint_) {
        throw std::logic_error("arrange() called on '" + name_ + "' before measure()");
    }
    if (needs_measure_ && visible_) {
        throw std::logic_error("arrange() called on '" + name_ + "' with a stale measure; "
                               "it was invalidated since the last measure()");
    }

    if (!visible_) {
        bounds_ = geometry::Rect(final_rect.position(), geometry::Size::empty());
        needs_arrange_ = false;
        state_ = LayoutState::Arranged;
        return;
    }

    geometry::Rect arranged = round_if_enabled(arranged_bounds(final_rect));
    if (!needs_arrange_ && bounds_ == arranged) {
        return;
    }

    bounds_ = arranged;
    arrange_content(bounds_.deflate(padding_));
    needs_arrange_ = false;
    state_ = LayoutState::Arranged;
}

void Element::arrange_content(const geometry::Rect&) {}

geometry::Rect Element::arranged_bounds(const geometry::Rect& final_rect) const {
    geometry::Rect slot = final_rect.deflate(margin_);
    float available_w = slot.width();
    float available_h = slot.height();

    float arrange_w = has_width() ? width_ : desired_size_.width() - margin_.horizontal_thickness();
    float arrange_h = has_height() ? height_ : desired_size_.height() - margin_.vertical_thickness();
    arrange_w = clamp_extent(arrange_w, min_width_, max_width_);
    arrange_h = clamp_extent(arrange_h, min_height_, max_height_);

    // Stretch fills the slot only while the size is auto; max still applies.
    float w = (h_align_ == HorizontalAlignment::Stretch && !has_width())
                  ? std::min(available_w, max_width_)
                  : std::min(arrange_w, available_w);
    float h = (v_align_ == VerticalAlignment::Stretch && !has_height())
                  ? std::min(available_h, max_height_)
                  : std::min(arrange_h, available_h);

    float x = slot.x();
    switch (h_align_) {
        case HorizontalAlignment::Left:
            break;
        case HorizontalAlignment::Right:
            x = slot.right() - w;
            break;
        case HorizontalAlignment::Center:
        case HorizontalAlignment::Stretch:
            x = slot.x() + (available_w - w) / 2;
            break;
    }

    float y = slot.y();
    switch (v_align_) {
        case VerticalAlignment::Top:
            break;
        case VerticalAlignment::Bottom:
            y = slot.bottom() - h;
            break;
        case VerticalAlignment::Center:
        case VerticalAlignment::Stretch:
            y = slot.y() + (available_h - h) / 2;
            break;
    }

    return {x, y, w, h};
}

geometry::Size Element::round_if_enabled(const geometry::Size& size) const {
    const LayoutRoot* root = layout_root();
    if (!root || !root->options().use_layout_rounding) return size;
    return round_size_to_pixels(size, root->options().dpi_scale);
}

geometry::Rect Element::round_if_enabled(const geometry::Rect& rect) const {
    const LayoutRoot* root = layout_root();
    if (!root || !root->options().use_layout_rounding) return rect;
    return round_rect_to_pixels(rect, root->options().dpi_scale);
}

// ---------------------------------------------------------------------------
// Invalidation
// ---------------------------------------------------------------------------

void Element::invalidate_measure() {
    needs_measure_ = true;
    needs_arrange_ = true;
    for (Element* p = parent_; p && !p->needs_measure_; p = p->parent_) {
        p->needs_measure_ = true;
        p->needs_arrange_ = true;
    }
}

void Element::invalidate_arrange() {
    needs_arrange_ = true;
    for (Element* p = parent_; p && !p->needs_arrange_; p = p->parent_) {
        p->needs_arrange_ = true;
    }
}

void Element::invalidate_subtree() {
    invalidate_subtree_flags();
    invalidate_measure();
}

void Element::invalidate_subtree_flags() {
    needs_measure_ = true;
    needs_arrange_ = true;
    std::size_t count = visual_child_count();
    for (std::size_t i = 0; i < count; ++i) {
        if (Element* child = visual_child(i)) {
            child->invalidate_subtree_flags();
        }
    }
}

// ---------------------------------------------------------------------------
// Properties
// ---------------------------------------------------------------------------

void Element::set_visible(bool visible) {
    if (visible_ == visible) return;
    visible_ = visible;
    invalidate_measure();
}

void Element::set_margin(const geometry::Thickness& margin) {
    if (margin_ == margin) return;
    margin_ = margin;
    invalidate_measure();
}

void Element::set_padding(const geometry::Thickness& padding) {
    if (padding_ == padding) return;
    padding_ = padding;
    invalidate_measure();
}

bool Element::has_width() const { return !std::isnan(width_); }
bool Element::has_height() const { return !std::isnan(height_); }

void Element::set_width(float width) {
    require_explicit_size(width, "width");
    if (width_ == width || (std::isnan(width_) && std::isnan(width))) return;
    width_ = width;
    invalidate_measure();
}

void Element::set_height(float height) {
    require_explicit_size(height, "height");
    if (height_ == height || (std::isnan(height_) && std::isnan(height))) return;
    height_ = height;
    invalidate_measure();
}

void Element::clear_width() { set_width(kAuto); }
void Element::clear_height() { set_height(kAuto); }

void Element::set_min_width(float value) {
    require_min(value, "min_width");
    if (min_width_ == value) return;
    min_width_ = value;
    invalidate_measure();
}

void Element::set_min_height(float value) {
    require_min(value, "min_height");
    if (min_height_ == value) return;
    min_height_ = value;
    invalidate_measure();
}

void Element::set_max_width(float value) {
    require_max(value, "max_width");
    if (max_width_ == value) return;
    max_width_ = value;
    invalidate_measure();
}

void Element::set_max_height(float value) {
    require_max(value, "max_height");
    if (max_height_ == value) return;
    max_height_ = value;
    invalidate_measure();
}

void Element::set_horizontal_alignment(HorizontalAlignment align) {
    if (h_align_ == align) return;
    h_align_ = align;
    invalidate_arrange();
}

void Element::set_vertical_alignment(VerticalAlignment align) {
    if (v_align_ == align) return;
    v_align_ = align;
    invalidate_arrange();
}

// ---------------------------------------------------------------------------
// Tree queries
// ---------------------------------------------------------------------------

Element* Element::visual_child(std::size_t) const {
    return nullptr;
}

Element& Element::visual_root() {
    Element* current = this;
    while (current->parent_) current = current->parent_;
    return *current;
}

const Element& Element::visual_root() const {
    const Element* current = this;
    while (current->parent_) current = current->parent_;
    return *current;
}

bool Element::is_ancestor_of(const Element& descendant) const {
    return descendant.is_descendant_of(*this);
}

bool Element::is_descendant_of(const Element& ancestor) const {
    for (const Element* p = parent_; p; p = p->parent_) {
        if (p == &ancestor) return true;
    }
    return false;
}

geometry::Point Element::translate_point(const geometry::Point& point, const Element& relative_to) const {
    if (&relative_to == this) return point;
    if (&visual_root() != &relative_to.visual_root()) {
        throw std::invalid_argument("translate_point: elements are not in the same visual tree");
    }
    // Bounds are expressed in root coordinates.
    return point.offset(bounds_.x() - relative_to.bounds_.x(), bounds_.y() - relative_to.bounds_.y());
}

LayoutRoot* Element::layout_root() const {
    return visual_root().host_;
}

void Element::report(core::Severity severity, const std::string& module,
                     const std::string& stage, const std::string& message,
                     const Element* subject) const {
    LayoutRoot* root = layout_root();
    if (!root) return;
    root->diagnostics().emit(severity, module, stage, message, (subject ? subject : this)->name_);
}

} // namespace panelkit::layout
