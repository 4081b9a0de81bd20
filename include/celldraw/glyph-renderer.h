#pragma once

#include <celldraw/glyph-rasterizer.h>
#include <celldraw/grid-surface.h>

#include <string_view>

namespace celldraw {

//-----------------------------------------------------------------------------
// GlyphRenderer - paints one DrawString run onto the grid surface
//
// Background fill, glyphs through the rasterizer, then underline/undercurl.
//-----------------------------------------------------------------------------
class GlyphRenderer {
public:
    static constexpr int UNDERLINE_OFFSET = -2;
    static constexpr int UNDERLINE_HEIGHT = 1;
    static constexpr int UNDERCURL_OFFSET = -2;
    static constexpr int UNDERCURL_HEIGHT = 2;
    static constexpr int UNDERCURL_DOT_WIDTH = 2;
    static constexpr int UNDERCURL_DOT_DISTANCE = 2;

    explicit GlyphRenderer(const GridGeometry& geometry) : _geometry(geometry) {}

    void setRasterizer(GlyphRasterizer::Ptr rasterizer) { _rasterizer = std::move(rasterizer); }
    const GlyphRasterizer::Ptr& rasterizer() const { return _rasterizer; }

    // Baseline offset from the top of a cell
    void setBaseline(int baseline) { _baseline = baseline; }
    int baseline() const { return _baseline; }

    // Area covered by a run; `units` is used when `cells` is not positive
    PixelRect runRect(int row, int col, int cells, size_t units, int32_t flags) const;

    // Never throws. A rasterizer failure is returned after the background
    // has been painted; decorations are skipped in that case.
    Result<void> drawRun(GridSurface& surface, int row, int col, std::u32string_view text,
                         int cells, int32_t flags, Color fg, Color bg, Color sp);

private:
    void drawUnderline(GridSurface& surface, const PixelRect& rect, int row, Color color);
    void drawUndercurl(GridSurface& surface, const PixelRect& rect, int row, Color color);

    const GridGeometry& _geometry;
    GlyphRasterizer::Ptr _rasterizer;
    int _baseline = 0;
};

} // namespace celldraw
