#pragma once

#include <optional>

namespace celldraw {

//=============================================================================
// Geometry value types
//
// Surface space: origin at the top-left of the text area, y grows downward.
// View space: surface space shifted by the inset.
//=============================================================================

struct PixelPoint {
    int x = 0;
    int y = 0;
    bool operator==(const PixelPoint&) const = default;
};

struct PixelSize {
    int width = 0;
    int height = 0;
    bool operator==(const PixelSize&) const = default;
};

struct PixelRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    PixelPoint origin() const { return {x, y}; }
    PixelSize size() const { return {width, height}; }
    bool empty() const { return width <= 0 || height <= 0; }
    bool operator==(const PixelRect&) const = default;
};

struct CellSize {
    int width = 1;
    int height = 1;
    bool operator==(const CellSize&) const = default;
};

// Margin around the text area: width applies left and right, height top and bottom
struct Inset {
    int width = 0;
    int height = 0;
    bool operator==(const Inset&) const = default;
};

struct GridSize {
    int rows = 0;
    int columns = 0;
    bool operator==(const GridSize&) const = default;
};

struct CellPos {
    int row = 0;
    int column = 0;
    bool operator==(const CellPos&) const = default;
};

struct ConstrainedSize {
    GridSize grid;
    PixelSize size;
};

//=============================================================================
// GridGeometry - row/column <-> pixel mapping for one cell size and inset
//=============================================================================
class GridGeometry {
public:
    static constexpr int DEFAULT_MIN_ROWS = 4;
    static constexpr int DEFAULT_MIN_COLUMNS = 30;

    GridGeometry() = default;
    GridGeometry(CellSize cellSize, Inset inset)
        : _cellSize(cellSize), _inset(inset) {}

    void setCellSize(CellSize cellSize) { _cellSize = cellSize; }
    void setInset(Inset inset) { _inset = inset; }
    void setMinGrid(GridSize minGrid) { _minGrid = minGrid; }

    CellSize cellSize() const { return _cellSize; }
    Inset inset() const { return _inset; }
    GridSize minGrid() const { return _minGrid; }

    // Surface-local top-left corner of a cell
    PixelPoint originForCell(int row, int col) const;

    // Inclusive cell range in surface space
    PixelRect rectForCellRange(int row1, int col1, int row2, int col2) const;

    // Inclusive cell range in view space (offset by the inset)
    PixelRect viewRectForCellRange(int row1, int col1, int row2, int col2) const;

    // View-space band covering rows [start, start+length), clamped to the grid
    PixelRect rectForRows(int start, int length, GridSize grid) const;
    PixelRect rectForColumns(int start, int length, GridSize grid) const;

    // Size of the content surface for a grid
    PixelSize textAreaSize(GridSize grid) const;

    // Text area plus inset on both sides of each axis
    PixelSize desiredSize(GridSize grid) const;
    PixelSize minSize() const;

    // Snap an arbitrary view size to the largest grid that fits. Axes whose
    // target already equals the desired size of `grid` keep their count.
    ConstrainedSize constrain(GridSize grid, PixelSize target) const;

    // Map a point in (bottom-up) view coordinates to a cell. Empty while the
    // cell size is not positive.
    std::optional<CellPos> pixelToCell(PixelPoint point, int viewHeight) const;

private:
    CellSize _cellSize;
    Inset _inset;
    GridSize _minGrid{DEFAULT_MIN_ROWS, DEFAULT_MIN_COLUMNS};
};

} // namespace celldraw
