#pragma once

#include <celldraw/draw-command.h>
#include <celldraw/geometry.h>
#include <celldraw/glyph-renderer.h>
#include <celldraw/grid-surface.h>

#include <functional>

namespace celldraw {

//-----------------------------------------------------------------------------
// DrawExecutor - applies decoded draw records to the grid surface
//
// Stateless apart from the default background; the surface is borrowed per
// call and must be inside a batch scope.
//-----------------------------------------------------------------------------
class DrawExecutor {
public:
    using CursorPosListener = std::function<void(int row, int col)>;

    DrawExecutor(const GridGeometry& geometry, GlyphRenderer& renderer)
        : _geometry(geometry), _renderer(renderer) {}

    void setDefaultBackground(Color color) { _defaultBg = color; }
    Color defaultBackground() const { return _defaultBg; }

    void setCursorPosListener(CursorPosListener listener) { _cursorPosListener = std::move(listener); }

    void apply(GridSurface& surface, const DrawCommand& command);

    void apply(GridSurface& surface, const ClearAllCmd& cmd);
    void apply(GridSurface& surface, const ClearBlockCmd& cmd);
    void apply(GridSurface& surface, const DeleteLinesCmd& cmd);
    void apply(GridSurface& surface, const InsertLinesCmd& cmd);
    void apply(GridSurface& surface, const DrawStringCmd& cmd);
    void apply(GridSurface& surface, const DrawCursorCmd& cmd);
    void apply(GridSurface& surface, const SetCursorPosCmd& cmd);
    void apply(GridSurface& surface, const DrawInvertedRectCmd& cmd);

    // Cell rect reduced to the visible part of a cursor shape
    PixelRect cursorRect(int row, int col, CursorShape shape, int percent) const;

private:
    const GridGeometry& _geometry;
    GlyphRenderer& _renderer;
    Color _defaultBg = colors::Black;
    CursorPosListener _cursorPosListener;
};

} // namespace celldraw
