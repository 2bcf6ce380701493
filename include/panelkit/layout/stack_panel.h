#pragma once
#include <panelkit/core/config.h>
#include <panelkit/layout/panel.h>

namespace panelkit::layout {

enum class Orientation { Horizontal, Vertical };

// Lays visible children out one after another along a single axis. Each
// child gets its desired extent on the main axis and the full cross extent.
class StackPanel : public Panel {
public:
    StackPanel() = default;
    explicit StackPanel(Orientation orientation) : orientation_(orientation) {}

    Orientation orientation() const { return orientation_; }
    void set_orientation(Orientation orientation);

    // Gap inserted between consecutive visible children. Negative values are
    // kept but laid out as 0.
    float spacing() const { return spacing_; }
    void set_spacing(float spacing);

protected:
    geometry::Size measure_content(const geometry::Size& available) override;
    void arrange_content(const geometry::Rect& content_bounds) override;

private:
    float effective_spacing() const;

    Orientation orientation_ = Orientation::Vertical;
    float spacing_ = core::config::kDefaultSpacing;
};

} // namespace panelkit::layout
