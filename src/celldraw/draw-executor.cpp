#include <celldraw/draw-executor.h>
#include <celldraw/utf8.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace celldraw {

void DrawExecutor::apply(GridSurface& surface, const DrawCommand& command) {
    std::visit([&](const auto& cmd) { apply(surface, cmd); }, command);
}

void DrawExecutor::apply(GridSurface& surface, const ClearAllCmd&) {
    ytrace("ClearAll bg={:#010x}", _defaultBg.argb);
    surface.clearAll(_defaultBg);
}

void DrawExecutor::apply(GridSurface& surface, const ClearBlockCmd& cmd) {
    ytrace("ClearBlock ({},{})-({},{})", cmd.row1, cmd.col1, cmd.row2, cmd.col2);
    surface.fillRect(_geometry.rectForCellRange(cmd.row1, cmd.col1, cmd.row2, cmd.col2),
                     cmd.color);
}

//-----------------------------------------------------------------------------
// Scrolling: the scroll region is rows [row, bottom] x columns [left, right]
//-----------------------------------------------------------------------------

void DrawExecutor::apply(GridSurface& surface, const DeleteLinesCmd& cmd) {
    ytrace("DeleteLines row={} count={} bottom={} cols={}..{}",
           cmd.row, cmd.count, cmd.bottom, cmd.left, cmd.right);
    int count = std::clamp(cmd.count, 0, std::max(0, cmd.bottom - cmd.row + 1));
    if (count == 0) return;

    int cellHeight = _geometry.cellSize().height;
    if (cmd.row + count <= cmd.bottom) {
        PixelRect src = _geometry.rectForCellRange(cmd.row + count, cmd.left,
                                                   cmd.bottom, cmd.right);
        surface.copyRegion(src, -count * cellHeight);
    }
    surface.fillRect(_geometry.rectForCellRange(cmd.bottom - count + 1, cmd.left,
                                                cmd.bottom, cmd.right),
                     cmd.color);
}

void DrawExecutor::apply(GridSurface& surface, const InsertLinesCmd& cmd) {
    ytrace("InsertLines row={} count={} bottom={} cols={}..{}",
           cmd.row, cmd.count, cmd.bottom, cmd.left, cmd.right);
    int count = std::clamp(cmd.count, 0, std::max(0, cmd.bottom - cmd.row + 1));
    if (count == 0) return;

    int cellHeight = _geometry.cellSize().height;
    if (cmd.row <= cmd.bottom - count) {
        PixelRect src = _geometry.rectForCellRange(cmd.row, cmd.left,
                                                   cmd.bottom - count, cmd.right);
        surface.copyRegion(src, count * cellHeight);
    }
    surface.fillRect(_geometry.rectForCellRange(cmd.row, cmd.left,
                                                cmd.row + count - 1, cmd.right),
                     cmd.color);
}

void DrawExecutor::apply(GridSurface& surface, const DrawStringCmd& cmd) {
    std::u32string text = utf8ToUtf32(cmd.text);
    ytrace("DrawString ({},{}) cells={} flags={:#x} len={}",
           cmd.row, cmd.col, cmd.cells, cmd.flags, cmd.text.size());

    auto res = _renderer.drawRun(surface, cmd.row, cmd.col, text, cmd.cells, cmd.flags,
                                 cmd.fg, cmd.bg, cmd.sp);
    if (!res) {
        ywarn("{}", error_msg(res));
    }
}

PixelRect DrawExecutor::cursorRect(int row, int col, CursorShape shape, int percent) const {
    PixelRect rect = _geometry.rectForCellRange(row, col, row, col);
    percent = std::clamp(percent, 0, 100);

    switch (shape) {
        case CursorShape::Horizontal: {
            int height = (rect.height * percent + 99) / 100;
            rect.y += rect.height - height;
            rect.height = height;
            break;
        }
        case CursorShape::Vertical:
            rect.width = (rect.width * percent + 99) / 100;
            break;
        case CursorShape::VerticalRight: {
            int width = (rect.width * percent + 99) / 100;
            rect.x += rect.width - width;
            rect.width = width;
            break;
        }
        default:
            break;
    }
    return rect;
}

void DrawExecutor::apply(GridSurface& surface, const DrawCursorCmd& cmd) {
    ytrace("DrawCursor ({},{}) shape={} percent={}",
           cmd.row, cmd.col, static_cast<int>(cmd.shape), cmd.percent);
    PixelRect rect = cursorRect(cmd.row, cmd.col, cmd.shape, cmd.percent);
    if (cmd.shape == CursorShape::Hollow) {
        surface.frameRect(rect, cmd.color);
    } else {
        surface.fillRect(rect, cmd.color);
    }
}

void DrawExecutor::apply(GridSurface&, const SetCursorPosCmd& cmd) {
    ytrace("SetCursorPos ({},{})", cmd.row, cmd.col);
    if (_cursorPosListener) {
        _cursorPosListener(cmd.row, cmd.col);
    }
}

void DrawExecutor::apply(GridSurface& surface, const DrawInvertedRectCmd& cmd) {
    ytrace("DrawInvertedRect ({},{}) {}x{}", cmd.row, cmd.col, cmd.nrows, cmd.ncols);
    if (cmd.nrows <= 0 || cmd.ncols <= 0) return;
    surface.invertRect(_geometry.rectForCellRange(cmd.row, cmd.col,
                                                  cmd.row + cmd.nrows - 1,
                                                  cmd.col + cmd.ncols - 1));
}

} // namespace celldraw
