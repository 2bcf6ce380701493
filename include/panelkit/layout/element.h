#pragma once
#include <panelkit/core/diagnostics.h>
#include <panelkit/geometry/point.h>
#include <panelkit/geometry/rect.h>
#include <panelkit/geometry/size.h>
#include <panelkit/geometry/thickness.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

namespace panelkit::layout {

class LayoutRoot;
class Panel;

enum class HorizontalAlignment { Stretch, Left, Center, Right };
enum class VerticalAlignment { Stretch, Top, Center, Bottom };

enum class LayoutState : uint8_t {
    Unmeasured,
    Measured,
    Arranged
};

const char* layout_state_name(LayoutState state);

// Base of every node in the visual tree. Implements the two-phase layout
// protocol: measure() computes desired_size() from a proposed constraint,
// arrange() assigns bounds(). Subclasses supply measure_content() and
// arrange_content(); margin, padding, explicit size, min/max and alignment
// are handled here so panels only ever see their content box.
class Element {
public:
    Element();
    virtual ~Element();

    // Non-copyable
    Element(const Element&) = delete;
    Element& operator=(const Element&) = delete;

    // --- Layout protocol ---------------------------------------------------

    // `available` may be infinite on either axis. A clean element asked for
    // the same constraint keeps its cached desired size.
    void measure(const geometry::Size& available);

    // Throws std::logic_error unless a visible element has been measured
    // since its last measure invalidation.
    void arrange(const geometry::Rect& final_rect);

    const geometry::Size& desired_size() const { return desired_size_; }
    const geometry::Rect& bounds() const { return bounds_; }
    LayoutState layout_state() const { return state_; }

    bool needs_measure() const { return needs_measure_; }
    bool needs_arrange() const { return needs_arrange_; }

    // Marks this element dirty and bubbles up to the first ancestor that is
    // already dirty.
    void invalidate_measure();
    void invalidate_arrange();
    // Marks every descendant dirty as well, for changes that affect the
    // whole tree (e.g. layout rounding).
    void invalidate_subtree();

    // --- Layout-affecting properties -----------------------------------------

    bool is_visible() const { return visible_; }
    void set_visible(bool visible);

    const geometry::Thickness& margin() const { return margin_; }
    void set_margin(const geometry::Thickness& margin);

    const geometry::Thickness& padding() const { return padding_; }
    void set_padding(const geometry::Thickness& padding);

    // NaN means "size to content". Explicit sizes must be finite and >= 0.
    float width() const { return width_; }
    float height() const { return height_; }
    bool has_width() const;
    bool has_height() const;
    void set_width(float width);
    void set_height(float height);
    void clear_width();
    void clear_height();

    float min_width() const { return min_width_; }
    float min_height() const { return min_height_; }
    float max_width() const { return max_width_; }
    float max_height() const { return max_height_; }
    void set_min_width(float value);
    void set_min_height(float value);
    void set_max_width(float value);
    void set_max_height(float value);

    HorizontalAlignment horizontal_alignment() const { return h_align_; }
    VerticalAlignment vertical_alignment() const { return v_align_; }
    void set_horizontal_alignment(HorizontalAlignment align);
    void set_vertical_alignment(VerticalAlignment align);

    // Free-form label used in diagnostics.
    const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    // --- Tree ----------------------------------------------------------------

    Element* parent() const { return parent_; }
    virtual std::size_t visual_child_count() const { return 0; }
    virtual Element* visual_child(std::size_t index) const;
    Element& visual_root();
    const Element& visual_root() const;
    bool is_ancestor_of(const Element& descendant) const;
    bool is_descendant_of(const Element& ancestor) const;

    // Converts `point` from this element's space into `relative_to`'s space.
    // Throws std::invalid_argument if the elements are in different trees.
    geometry::Point translate_point(const geometry::Point& point, const Element& relative_to) const;

    // LayoutRoot hosting this element's tree, or nullptr.
    LayoutRoot* layout_root() const;

protected:
    virtual geometry::Size measure_content(const geometry::Size& available);
    virtual void arrange_content(const geometry::Rect& content_bounds);

    // Routed to the hosting LayoutRoot's diagnostics; dropped when detached.
    // The event names `subject`, or this element when null.
    void report(core::Severity severity, const std::string& module,
                const std::string& stage, const std::string& message,
                const Element* subject = nullptr) const;

private:
    friend class Panel;
    friend class LayoutRoot;

    void invalidate_subtree_flags();
    geometry::Rect arranged_bounds(const geometry::Rect& final_rect) const;
    geometry::Size round_if_enabled(const geometry::Size& size) const;
    geometry::Rect round_if_enabled(const geometry::Rect& rect) const;

    Element* parent_ = nullptr;
    LayoutRoot* host_ = nullptr;

    geometry::Size desired_size_;
    geometry::Rect bounds_;
    geometry::Size last_constraint_;
    bool has_constraint_ = false;
    bool needs_measure_ = true;
    bool needs_arrange_ = true;
    LayoutState state_ = LayoutState::Unmeasured;

    bool visible_ = true;
    geometry::Thickness margin_;
    geometry::Thickness padding_;
    float width_;
    float height_;
    float min_width_ = 0;
    float min_height_ = 0;
    float max_width_ = geometry::kInfinity;
    float max_height_ = geometry::kInfinity;
    HorizontalAlignment h_align_ = HorizontalAlignment::Stretch;
    VerticalAlignment v_align_ = VerticalAlignment::Stretch;
    std::string name_;
};

} // namespace panelkit::layout
