#include <panelkit/layout/grid_placement.h>

#include <algorithm>
#include <stdexcept>

namespace panelkit::layout {

OccupancyGrid::OccupancyGrid(int rows, int columns)
    : rows_(std::max(rows, 0)), columns_(std::max(columns, 0)),
      cells_(static_cast<std::size_t>(rows_) * static_cast<std::size_t>(columns_), 0) {}

bool OccupancyGrid::is_occupied(int row, int column) const {
    if (row < 0 || row >= rows_ || column < 0 || column >= columns_) {
        throw std::out_of_range("OccupancyGrid: cell out of range");
    }
    return cells_[static_cast<std::size_t>(row * columns_ + column)] != 0;
}

bool OccupancyGrid::can_place(int row, int column, int row_span, int column_span) const {
    if (row < 0 || column < 0 || row_span < 1 || column_span < 1) return false;
    if (row + row_span > rows_ || column + column_span > columns_) return false;
    for (int r = row; r < row + row_span; ++r) {
        for (int c = column; c < column + column_span; ++c) {
            if (cells_[static_cast<std::size_t>(r * columns_ + c)]) return false;
        }
    }
    return true;
}

void OccupancyGrid::mark(int row, int column, int row_span, int column_span) {
    int row_end = std::min(rows_, row + row_span);
    int column_end = std::min(columns_, column + column_span);
    for (int r = std::max(row, 0); r < row_end; ++r) {
        for (int c = std::max(column, 0); c < column_end; ++c) {
            cells_[static_cast<std::size_t>(r * columns_ + c)] = 1;
        }
    }
}

std::optional<int> OccupancyGrid::find_in_row(int row, int row_span, int column_span) const {
    for (int c = 0; c + column_span <= columns_; ++c) {
        if (can_place(row, c, row_span, column_span)) return c;
    }
    return std::nullopt;
}

std::optional<int> OccupancyGrid::find_in_column(int column, int row_span, int column_span) const {
    for (int r = 0; r + row_span <= rows_; ++r) {
        if (can_place(r, column, row_span, column_span)) return r;
    }
    return std::nullopt;
}

std::optional<std::pair<int, int>> OccupancyGrid::find_first_fit(int row_span, int column_span) const {
    for (int r = 0; r + row_span <= rows_; ++r) {
        for (int c = 0; c + column_span <= columns_; ++c) {
            if (can_place(r, c, row_span, column_span)) return std::make_pair(r, c);
        }
    }
    return std::nullopt;
}

CellPlacement clamp_cell(int row, int column, int row_span, int column_span,
                         int rows, int columns) {
    rows = std::max(rows, 1);
    columns = std::max(columns, 1);

    CellPlacement p;
    p.row = std::clamp(row, 0, rows - 1);
    p.column = std::clamp(column, 0, columns - 1);
    p.row_span = std::clamp(row_span, 1, rows - p.row);
    p.column_span = std::clamp(column_span, 1, columns - p.column);
    p.clamped = p.row != row || p.column != column ||
                p.row_span != row_span || p.column_span != column_span;
    return p;
}

std::vector<CellPlacement> auto_place(const std::vector<CellRequest>& requests,
                                      int rows, int columns) {
    rows = std::max(rows, 1);
    columns = std::max(columns, 1);

    std::vector<CellPlacement> result(requests.size());
    std::vector<bool> resolved(requests.size(), false);
    OccupancyGrid occupancy(rows, columns);

    // Fully explicit children and invisible children first.
    for (std::size_t i = 0; i < requests.size(); ++i) {
        const CellRequest& req = requests[i];
        const bool explicit_cell = req.row && req.column;
        if (!explicit_cell && req.visible) continue;

        result[i] = clamp_cell(req.row.value_or(0), req.column.value_or(0),
                               req.row_span, req.column_span, rows, columns);
        resolved[i] = true;
        if (req.visible) {
            const CellPlacement& p = result[i];
            occupancy.mark(p.row, p.column, p.row_span, p.column_span);
        }
    }

    for (std::size_t i = 0; i < requests.size(); ++i) {
        if (resolved[i]) continue;
        const CellRequest& req = requests[i];

        // Clamp whatever is explicit; the free axis is searched.
        CellPlacement p = clamp_cell(req.row.value_or(0), req.column.value_or(0),
                                     req.row_span, req.column_span, rows, columns);
        if (req.row) {
            p.column_span = std::clamp(req.column_span, 1, columns);
            if (auto column = occupancy.find_in_row(p.row, p.row_span, p.column_span)) {
                p.column = *column;
            } else {
                p.fallback = true;
            }
        } else if (req.column) {
            p.row_span = std::clamp(req.row_span, 1, rows);
            if (auto row = occupancy.find_in_column(p.column, p.row_span, p.column_span)) {
                p.row = *row;
            } else {
                p.fallback = true;
            }
        } else {
            p.row_span = std::clamp(req.row_span, 1, rows);
            p.column_span = std::clamp(req.column_span, 1, columns);
            if (auto cell = occupancy.find_first_fit(p.row_span, p.column_span)) {
                p.row = cell->first;
                p.column = cell->second;
            } else {
                p.fallback = true;
            }
        }

        if (p.fallback) {
            // Explicit axes are kept; searched axes drop to 0.
            if (!req.row) p.row = 0;
            if (!req.column) p.column = 0;
        }

        // The span may still overhang when the chosen index is late in the
        // grid (row-only requests with a tall span, or the fallback cell).
        p.row_span = std::clamp(p.row_span, 1, rows - p.row);
        p.column_span = std::clamp(p.column_span, 1, columns - p.column);
        p.clamped = p.clamped || (req.row && *req.row != p.row) ||
                    (req.column && *req.column != p.column) ||
                    p.row_span != req.row_span || p.column_span != req.column_span;

        occupancy.mark(p.row, p.column, p.row_span, p.column_span);
        result[i] = p;
    }

    return result;
}

} // namespace panelkit::layout
