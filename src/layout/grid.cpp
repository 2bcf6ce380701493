#include <panelkit/layout/grid.h>

#include <panelkit/layout/track_sizing.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>
#include <utility>

namespace panelkit::layout {

namespace {

// Min must be finite and >= 0, max must be >= 0; anything else falls back
// to the default bound.
TrackDefinition sanitize_track(TrackDefinition track) {
    if (!std::isfinite(track.min) || track.min < 0) track.min = 0;
    if (std::isnan(track.max) || track.max < 0) track.max = geometry::kInfinity;
    track.actual_size = 0;
    track.offset = 0;
    return track;
}

std::string describe(std::size_t index) {
    return "child #" + std::to_string(index);
}

} // namespace

// ---------------------------------------------------------------------------
// Attached cell metadata
// ---------------------------------------------------------------------------

AttachedTable<Grid::CellData>& Grid::cell_table() {
    static AttachedTable<CellData> table;
    return table;
}

Grid::CellData& Grid::cell_data(Element& element) {
    return cell_table().get_or_create(element);
}

void Grid::set_row(Element& element, int row) {
    const CellData* existing = cell_table().find(element);
    if (existing && existing->has_row && existing->row == row) return;
    CellData& data = cell_data(element);
    data.row = row;
    data.has_row = true;
    element.invalidate_measure();
}

void Grid::set_column(Element& element, int column) {
    const CellData* existing = cell_table().find(element);
    if (existing && existing->has_column && existing->column == column) return;
    CellData& data = cell_data(element);
    data.column = column;
    data.has_column = true;
    element.invalidate_measure();
}

void Grid::set_row_span(Element& element, int span) {
    const CellData* existing = cell_table().find(element);
    if (existing ? existing->row_span == span : span == 1) return;
    cell_data(element).row_span = span;
    element.invalidate_measure();
}

void Grid::set_column_span(Element& element, int span) {
    const CellData* existing = cell_table().find(element);
    if (existing ? existing->column_span == span : span == 1) return;
    cell_data(element).column_span = span;
    element.invalidate_measure();
}

int Grid::get_row(const Element& element) {
    const CellData* data = cell_table().find(element);
    if (!data) return 0;
    return data->has_row ? data->row : data->resolved_row;
}

int Grid::get_column(const Element& element) {
    const CellData* data = cell_table().find(element);
    if (!data) return 0;
    return data->has_column ? data->column : data->resolved_column;
}

int Grid::get_row_span(const Element& element) {
    const CellData* data = cell_table().find(element);
    return data ? data->row_span : 1;
}

int Grid::get_column_span(const Element& element) {
    const CellData* data = cell_table().find(element);
    return data ? data->column_span : 1;
}

bool Grid::has_row(const Element& element) {
    const CellData* data = cell_table().find(element);
    return data && data->has_row;
}

bool Grid::has_column(const Element& element) {
    const CellData* data = cell_table().find(element);
    return data && data->has_column;
}

void Grid::clear_row(Element& element) {
    CellData* data = cell_table().find(element);
    if (!data || !data->has_row) return;
    data->has_row = false;
    data->row = 0;
    element.invalidate_measure();
}

void Grid::clear_column(Element& element) {
    CellData* data = cell_table().find(element);
    if (!data || !data->has_column) return;
    data->has_column = false;
    data->column = 0;
    element.invalidate_measure();
}

// ---------------------------------------------------------------------------
// Tracks
// ---------------------------------------------------------------------------

void Grid::add_row(const RowDefinition& row) {
    rows_.push_back(sanitize_track(row));
    invalidate_measure();
}

void Grid::add_column(const ColumnDefinition& column) {
    columns_.push_back(sanitize_track(column));
    invalidate_measure();
}

void Grid::set_rows(std::vector<RowDefinition> rows) {
    for (auto& row : rows) row = sanitize_track(row);
    rows_ = std::move(rows);
    invalidate_measure();
}

void Grid::set_columns(std::vector<ColumnDefinition> columns) {
    for (auto& column : columns) column = sanitize_track(column);
    columns_ = std::move(columns);
    invalidate_measure();
}

void Grid::set_rows(std::string_view lengths) {
    std::vector<RowDefinition> rows;
    for (const GridLength& length : parse_grid_lengths(lengths)) {
        rows.emplace_back(length);
    }
    set_rows(std::move(rows));
}

void Grid::set_columns(std::string_view lengths) {
    std::vector<ColumnDefinition> columns;
    for (const GridLength& length : parse_grid_lengths(lengths)) {
        columns.emplace_back(length);
    }
    set_columns(std::move(columns));
}

void Grid::clear_rows() {
    if (rows_.empty()) return;
    rows_.clear();
    invalidate_measure();
}

void Grid::clear_columns() {
    if (columns_.empty()) return;
    columns_.clear();
    invalidate_measure();
}

std::vector<float> Grid::actual_row_heights() const {
    std::vector<float> sizes;
    for (const auto& track : row_tracks()) sizes.push_back(track.actual_size);
    return sizes;
}

std::vector<float> Grid::actual_column_widths() const {
    std::vector<float> sizes;
    for (const auto& track : column_tracks()) sizes.push_back(track.actual_size);
    return sizes;
}

void Grid::set_auto_indexing(bool enabled) {
    if (auto_indexing_ == enabled) return;
    auto_indexing_ = enabled;
    invalidate_measure();
}

void Grid::set_spacing(float spacing) {
    if (spacing_ == spacing) return;
    spacing_ = spacing;
    invalidate_measure();
}

float Grid::effective_spacing() const {
    if (std::isnan(spacing_) || spacing_ <= 0) return 0;
    return spacing_;
}

// ---------------------------------------------------------------------------
// Placement
// ---------------------------------------------------------------------------

std::vector<CellPlacement> Grid::resolve_placements(bool report_issues) {
    const int rows = static_cast<int>(row_tracks().size());
    const int columns = static_cast<int>(column_tracks().size());
    const auto& items = children();

    std::vector<CellRequest> requests;
    requests.reserve(items.size());
    for (const auto& child : items) {
        CellRequest req;
        req.visible = child->is_visible();
        if (const CellData* data = cell_table().find(*child)) {
            // Without auto-indexing an unset axis is simply 0.
            if (data->has_row || !auto_indexing_) req.row = data->row;
            if (data->has_column || !auto_indexing_) req.column = data->column;
            req.row_span = data->row_span;
            req.column_span = data->column_span;
        } else if (!auto_indexing_) {
            req.row = 0;
            req.column = 0;
        }
        requests.push_back(req);
    }

    std::vector<CellPlacement> placements = auto_place(requests, rows, columns);

    for (std::size_t i = 0; i < items.size(); ++i) {
        Element& child = *items[i];
        const CellPlacement& p = placements[i];
        if (!requests[i].row || !requests[i].column) {
            CellData& data = cell_data(child);
            data.resolved_row = p.row;
            data.resolved_column = p.column;
        }

        if (!report_issues || !requests[i].visible) continue;
        if (p.fallback) {
            std::ostringstream oss;
            oss << "no free cell for " << describe(i) << " (span " << p.row_span
                << "x" << p.column_span << "); placed at row " << p.row << ", column " << p.column;
            report(core::Severity::Warning, core::config::kModuleGrid, "placement", oss.str(), &child);
        } else if (p.clamped) {
            std::ostringstream oss;
            oss << describe(i) << " clamped to row " << p.row << ", column " << p.column
                << ", span " << p.row_span << "x" << p.column_span << " in a " << rows << "x"
                << columns << " grid";
            report(core::Severity::Warning, core::config::kModuleGrid, "placement", oss.str(), &child);
        }
    }

    return placements;
}

void Grid::resolve_tracks(const geometry::Size& available,
                          const std::vector<CellPlacement>& placements) {
    std::vector<TrackContribution> row_items;
    std::vector<TrackContribution> column_items;
    const auto& items = children();
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (!items[i]->is_visible()) continue;
        const CellPlacement& p = placements[i];
        const geometry::Size& desired = items[i]->desired_size();
        row_items.push_back({p.row, p.row_span, desired.height()});
        column_items.push_back({p.column, p.column_span, desired.width()});
    }

    const float spacing = effective_spacing();
    resolve_track_sizes(column_tracks(), available.width(), spacing, column_items);
    resolve_track_sizes(row_tracks(), available.height(), spacing, row_items);
    resolve_track_offsets(column_tracks(), spacing);
    resolve_track_offsets(row_tracks(), spacing);
}

// ---------------------------------------------------------------------------
// Measure
// ---------------------------------------------------------------------------

geometry::Size Grid::measure_content(const geometry::Size& available) {
    if (spacing_ < 0) {
        std::ostringstream oss;
        oss << "negative spacing " << spacing_ << " laid out as 0";
        report(core::Severity::Warning, core::config::kModuleGrid, "measure", oss.str());
    }

    std::vector<CellPlacement> placements = resolve_placements(true);

    for (const auto& child : children()) {
        if (child->is_visible()) {
            child->measure(geometry::Size::infinity());
        }
    }

    resolve_tracks(available, placements);

    const float spacing = effective_spacing();
    return {tracks_extent(column_tracks(), spacing), tracks_extent(row_tracks(), spacing)};
}

// ---------------------------------------------------------------------------
// Arrange
// ---------------------------------------------------------------------------

void Grid::arrange_content(const geometry::Rect& content_bounds) {
    std::vector<CellPlacement> placements = resolve_placements(false);
    resolve_tracks(content_bounds.size(), placements);

    const float spacing = effective_spacing();
    const auto& rows = row_tracks();
    const auto& columns = column_tracks();
    const int row_count = static_cast<int>(rows.size());
    const int column_count = static_cast<int>(columns.size());

    const auto& items = children();
    for (std::size_t i = 0; i < items.size(); ++i) {
        Element& child = *items[i];
        if (!child.is_visible()) continue;

        const CellPlacement p = clamp_cell(placements[i].row, placements[i].column,
                                           placements[i].row_span, placements[i].column_span,
                                           row_count, column_count);
        const float x = content_bounds.x() + columns[static_cast<std::size_t>(p.column)].offset;
        const float y = content_bounds.y() + rows[static_cast<std::size_t>(p.row)].offset;
        const float w = span_extent(columns, p.column, p.column_span, spacing);
        const float h = span_extent(rows, p.row, p.row_span, spacing);
        child.arrange(geometry::Rect(x, y, w, h));
    }
}

} // namespace panelkit::layout
