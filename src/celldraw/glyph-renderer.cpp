#include <celldraw/glyph-renderer.h>
#include <celldraw/draw-command.h>

#include <exception>
#include <string>

namespace celldraw {

PixelRect GlyphRenderer::runRect(int row, int col, int cells, size_t units, int32_t flags) const {
    CellSize cell = _geometry.cellSize();
    PixelPoint origin = _geometry.originForCell(row, col);
    int span = cells > 0 ? cells : static_cast<int>(units);

    PixelRect rect{origin.x, origin.y, span * cell.width, cell.height};
    if (flags & DRAW_WIDE) {
        rect.width *= 2;
    }
    return rect;
}

Result<void> GlyphRenderer::drawRun(GridSurface& surface, int row, int col,
                                    std::u32string_view text, int cells, int32_t flags,
                                    Color fg, Color bg, Color sp) {
    PixelRect rect = runRect(row, col, cells, text.size(), flags);

    if (!(flags & DRAW_TRANSP)) {
        surface.fillRect(rect, bg);
    }

    if (!_rasterizer) {
        return Err<void>("GlyphRenderer: no rasterizer set");
    }

    GlyphRun run;
    run.rect = rect;
    run.baseline = _baseline;
    run.text = text;
    run.advance = _geometry.cellSize().width * ((flags & DRAW_WIDE) ? 2 : 1);
    run.flags = flags;
    run.fg = fg;

    Result<void> painted = Ok();
    try {
        painted = _rasterizer->paintRun(surface, run);
    } catch (const std::exception& e) {
        painted = Err<void>(std::string("rasterizer threw: ") + e.what());
    } catch (...) {
        painted = Err<void>("rasterizer threw a non-standard exception");
    }
    if (!painted) {
        return Err<void>("GlyphRenderer: run at (" + std::to_string(row) + "," +
                         std::to_string(col) + ") drawn without decoration", painted);
    }

    if (flags & DRAW_UNDERL) {
        drawUnderline(surface, rect, row, fg);
    }
    if (flags & DRAW_UNDERC) {
        drawUndercurl(surface, rect, row, sp);
    }
    return Ok();
}

void GlyphRenderer::drawUnderline(GridSurface& surface, const PixelRect& rect, int row,
                                  Color color) {
    int y = (row + 1) * _geometry.cellSize().height + UNDERLINE_OFFSET;
    surface.fillRect({rect.x, y, rect.width, UNDERLINE_HEIGHT}, color);
}

void GlyphRenderer::drawUndercurl(GridSurface& surface, const PixelRect& rect, int row,
                                  Color color) {
    int y = (row + 1) * _geometry.cellSize().height + UNDERCURL_OFFSET;
    int lineEnd = rect.x + rect.width;

    PixelRect dot{rect.x, y, UNDERCURL_DOT_WIDTH, UNDERCURL_HEIGHT};
    for (int i = 0; dot.x < lineEnd; ++i) {
        if (i % 2) {
            surface.fillRect(dot, color);
        }
        dot.x += UNDERCURL_DOT_DISTANCE;
    }
}

} // namespace celldraw
