#pragma once
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace panelkit::layout {

// Cell request for one child of a grid. An empty row/column asks the
// placer to pick one.
struct CellRequest {
    std::optional<int> row;
    std::optional<int> column;
    int row_span = 1;
    int column_span = 1;
    bool visible = true;
};

struct CellPlacement {
    int row = 0;
    int column = 0;
    int row_span = 1;
    int column_span = 1;
    // An explicit index or span was outside the grid.
    bool clamped = false;
    // No free cells were found; placed at the fallback position.
    bool fallback = false;
};

// Row-major bitmap of claimed cells.
class OccupancyGrid {
public:
    OccupancyGrid(int rows, int columns);

    int rows() const { return rows_; }
    int columns() const { return columns_; }

    bool is_occupied(int row, int column) const;
    bool can_place(int row, int column, int row_span, int column_span) const;
    void mark(int row, int column, int row_span, int column_span);

    std::optional<int> find_in_row(int row, int row_span, int column_span) const;
    std::optional<int> find_in_column(int column, int row_span, int column_span) const;
    std::optional<std::pair<int, int>> find_first_fit(int row_span, int column_span) const;

private:
    int rows_;
    int columns_;
    std::vector<std::uint8_t> cells_;
};

// Clamps an index into [0, count) and a span into [1, count - index].
CellPlacement clamp_cell(int row, int column, int row_span, int column_span,
                         int rows, int columns);

// Resolves every request against a rows x columns grid. Fully explicit
// visible requests claim their cells first; the rest are placed in request
// order. Invisible requests are clamped but claim nothing. The result is
// index-aligned with `requests`.
std::vector<CellPlacement> auto_place(const std::vector<CellRequest>& requests,
                                      int rows, int columns);

} // namespace panelkit::layout
