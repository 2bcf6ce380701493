#pragma once
#include <panelkit/core/config.h>
#include <panelkit/layout/attached.h>
#include <panelkit/layout/panel.h>

namespace panelkit::layout {

enum class Dock { Left, Top, Right, Bottom };

const char* dock_name(Dock dock);

// Peels docked children off the edges of the content box in declaration
// order; with last_child_fill() the last visible child takes what is left.
class DockPanel : public Panel {
public:
    DockPanel() = default;

    // Attached Dock position; Left when never set.
    static void set_dock(Element& element, Dock dock);
    static Dock get_dock(const Element& element);
    static bool has_dock(const Element& element);

    bool last_child_fill() const { return last_child_fill_; }
    void set_last_child_fill(bool fill);

    // Negative values are kept but laid out as 0.
    float spacing() const { return spacing_; }
    void set_spacing(float spacing);

protected:
    geometry::Size measure_content(const geometry::Size& available) override;
    void arrange_content(const geometry::Rect& content_bounds) override;

private:
    struct DockData {
        Dock dock = Dock::Left;
    };

    static AttachedTable<DockData>& dock_table();

    int last_visible_index() const;
    float effective_spacing() const;

    bool last_child_fill_ = true;
    float spacing_ = core::config::kDefaultSpacing;
};

} // namespace panelkit::layout
