#pragma once
#include <panelkit/core/config.h>
#include <panelkit/layout/attached.h>
#include <panelkit/layout/grid_length.h>
#include <panelkit/layout/grid_placement.h>
#include <panelkit/layout/panel.h>
#include <string_view>
#include <vector>

namespace panelkit::layout {

// Lays children out in cells of a rows x columns table. Tracks are sized as
// Pixel, Auto (largest child share) or Star (weighted share of what is
// left). Children without an explicit row and/or column are auto-placed
// into the first free cell while auto_indexing() is on.
class Grid : public Panel {
public:
    Grid() = default;

    // --- Attached cell metadata ----------------------------------------------
    // Out-of-range values are accepted here and clamped during layout.

    static void set_row(Element& element, int row);
    static void set_column(Element& element, int column);
    static void set_row_span(Element& element, int span);
    static void set_column_span(Element& element, int span);

    // Explicit value if set, otherwise the position resolved by the last
    // layout pass (0 before any pass).
    static int get_row(const Element& element);
    static int get_column(const Element& element);
    static int get_row_span(const Element& element);
    static int get_column_span(const Element& element);

    static bool has_row(const Element& element);
    static bool has_column(const Element& element);
    static void clear_row(Element& element);
    static void clear_column(Element& element);

    // --- Tracks ----------------------------------------------------------------

    const std::vector<RowDefinition>& row_definitions() const { return rows_; }
    const std::vector<ColumnDefinition>& column_definitions() const { return columns_; }

    void add_row(const RowDefinition& row);
    void add_column(const ColumnDefinition& column);
    void add_row(GridLength height) { add_row(RowDefinition(height)); }
    void add_column(GridLength width) { add_column(ColumnDefinition(width)); }

    void set_rows(std::vector<RowDefinition> rows);
    void set_columns(std::vector<ColumnDefinition> columns);
    // Comma separated lengths, e.g. "Auto,*,2*,100". Throws
    // std::invalid_argument on malformed text.
    void set_rows(std::string_view lengths);
    void set_columns(std::string_view lengths);

    void clear_rows();
    void clear_columns();

    // Track sizes from the last pass. An axis without definitions reports
    // its single implicit star track.
    std::vector<float> actual_row_heights() const;
    std::vector<float> actual_column_widths() const;

    bool auto_indexing() const { return auto_indexing_; }
    void set_auto_indexing(bool enabled);

    // Gap between rows and between columns. Negative values are kept but laid
    // out as 0.
    float spacing() const { return spacing_; }
    void set_spacing(float spacing);

protected:
    geometry::Size measure_content(const geometry::Size& available) override;
    void arrange_content(const geometry::Rect& content_bounds) override;

private:
    struct CellData {
        int row = 0;
        int column = 0;
        bool has_row = false;
        bool has_column = false;
        int row_span = 1;
        int column_span = 1;

        int resolved_row = 0;
        int resolved_column = 0;
    };

    static AttachedTable<CellData>& cell_table();
    static CellData& cell_data(Element& element);

    std::vector<TrackDefinition>& row_tracks() { return rows_.empty() ? implicit_row_ : rows_; }
    std::vector<TrackDefinition>& column_tracks() { return columns_.empty() ? implicit_column_ : columns_; }
    const std::vector<TrackDefinition>& row_tracks() const { return rows_.empty() ? implicit_row_ : rows_; }
    const std::vector<TrackDefinition>& column_tracks() const { return columns_.empty() ? implicit_column_ : columns_; }

    // Runs auto-placement and records resolved positions. Clamps and
    // fallbacks are reported only when `report_issues` is set, so a pass
    // warns once rather than once per phase.
    std::vector<CellPlacement> resolve_placements(bool report_issues);
    void resolve_tracks(const geometry::Size& available,
                        const std::vector<CellPlacement>& placements);
    float effective_spacing() const;

    std::vector<RowDefinition> rows_;
    std::vector<ColumnDefinition> columns_;
    std::vector<TrackDefinition> implicit_row_{TrackDefinition()};
    std::vector<TrackDefinition> implicit_column_{TrackDefinition()};
    bool auto_indexing_ = true;
    float spacing_ = core::config::kDefaultSpacing;
};

} // namespace panelkit::layout
