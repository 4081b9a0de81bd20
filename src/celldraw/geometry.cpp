#include <celldraw/geometry.h>

#include <algorithm>
#include <cmath>

namespace celldraw {

PixelPoint GridGeometry::originForCell(int row, int col) const {
    return {col * _cellSize.width, row * _cellSize.height};
}

PixelRect GridGeometry::rectForCellRange(int row1, int col1, int row2, int col2) const {
    PixelPoint origin = originForCell(row1, col1);
    return {origin.x, origin.y,
            (col2 + 1 - col1) * _cellSize.width,
            (row2 + 1 - row1) * _cellSize.height};
}

PixelRect GridGeometry::viewRectForCellRange(int row1, int col1, int row2, int col2) const {
    PixelRect rect = rectForCellRange(row1, col1, row2, col2);
    rect.x += _inset.width;
    rect.y += _inset.height;
    return rect;
}

PixelRect GridGeometry::rectForRows(int start, int length, GridSize grid) const {
    start = std::clamp(start, 0, std::max(grid.rows, 0));
    length = std::clamp(length, 0, std::max(grid.rows - start, 0));

    PixelRect rect;
    rect.y = _cellSize.height * start + _inset.height;
    rect.height = _cellSize.height * length;
    return rect;
}

PixelRect GridGeometry::rectForColumns(int start, int length, GridSize grid) const {
    start = std::clamp(start, 0, std::max(grid.columns, 0));
    length = std::clamp(length, 0, std::max(grid.columns - start, 0));

    PixelRect rect;
    rect.x = _cellSize.width * start + _inset.width;
    rect.width = _cellSize.width * length;
    return rect;
}

PixelSize GridGeometry::textAreaSize(GridSize grid) const {
    return {grid.columns * _cellSize.width, grid.rows * _cellSize.height};
}

PixelSize GridGeometry::desiredSize(GridSize grid) const {
    PixelSize area = textAreaSize(grid);
    return {area.width + 2 * _inset.width, area.height + 2 * _inset.height};
}

PixelSize GridGeometry::minSize() const {
    return desiredSize(_minGrid);
}

ConstrainedSize GridGeometry::constrain(GridSize grid, PixelSize target) const {
    ConstrainedSize out{grid, desiredSize(grid)};

    if (target.height != out.size.height) {
        int fh = std::max(_cellSize.height, 1);
        int ih = 2 * _inset.height;
        int rows = static_cast<int>(std::floor(static_cast<double>(target.height - ih) / fh));
        out.grid.rows = std::max(rows, 0);
        out.size.height = fh * out.grid.rows + ih;
    }

    if (target.width != out.size.width) {
        int fw = std::max(_cellSize.width, 1);
        int iw = 2 * _inset.width;
        int cols = static_cast<int>(std::floor(static_cast<double>(target.width - iw) / fw));
        out.grid.columns = std::max(cols, 0);
        out.size.width = fw * out.grid.columns + iw;
    }

    return out;
}

std::optional<CellPos> GridGeometry::pixelToCell(PixelPoint point, int viewHeight) const {
    if (!(_cellSize.width > 0 && _cellSize.height > 0)) {
        return std::nullopt;
    }

    // The view is bottom-up, the content surface top-down
    double y = static_cast<double>(viewHeight - point.y);

    CellPos pos;
    pos.row = static_cast<int>(std::floor((y - _inset.height - 1) / _cellSize.height));
    pos.column = static_cast<int>(std::floor(
        static_cast<double>(point.x - _inset.width - 1) / _cellSize.width));
    return pos;
}

} // namespace celldraw
