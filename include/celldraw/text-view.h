#pragma once

#include <celldraw/color.h>
#include <celldraw/draw-executor.h>
#include <celldraw/geometry.h>
#include <celldraw/glyph-rasterizer.h>
#include <celldraw/glyph-renderer.h>
#include <celldraw/grid-surface.h>
#include <celldraw/host-message.h>
#include <celldraw/result.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace celldraw {

class Config;

// Presentation settings of a text view
struct ViewStyle {
    std::string fontPath;
    float pointSize = 12.0f;
    float cellWidthMultiplier = 1.0f;
    float linespace = 0.0f;
    bool antialias = true;
    Inset inset{2, 1};
    GridSize minGrid{GridGeometry::DEFAULT_MIN_ROWS, GridGeometry::DEFAULT_MIN_COLUMNS};
    GridSize grid{24, 80};
    Color background = colors::White;
    Color foreground = colors::Black;

    static ViewStyle fromConfig(const Config& config);
};

struct BatchStats {
    size_t recordsApplied = 0;
    bool stoppedEarly = false;   // an undecodable record ended the batch
    size_t bytesConsumed = 0;    // bytes of the applied records
};

// Outcome of comparing the requested grid with the allocated surface
struct GridReconcile {
    bool resize = false;
    PixelSize size;              // surface size the requested grid needs
};

GridReconcile reconcileGrid(GridSize requested, const GridGeometry& geometry,
                            PixelSize current);

//-----------------------------------------------------------------------------
// TextView - presenter for one character grid
//
// Owns the off-screen surface and applies draw batches to it. Grid size and
// font changes are only recorded; the surface is reallocated at the start of
// the next batch. The display callback fires once per batch.
//-----------------------------------------------------------------------------
class TextView {
public:
    using DisplayCallback = std::function<void(const TextView&)>;
    using HostCallback = std::function<void(HostMessageId, std::vector<uint8_t>)>;

    explicit TextView(const ViewStyle& style = ViewStyle());

    TextView(const TextView&) = delete;
    TextView& operator=(const TextView&) = delete;

    //-------------------------------------------------------------------------
    // Grid
    //-------------------------------------------------------------------------
    void setMaxRows(int rows, int columns);
    GridSize requestedGrid() const { return _requestedGrid; }
    GridSize appliedGrid() const { return _appliedGrid; }

    //-------------------------------------------------------------------------
    // Drawing
    //-------------------------------------------------------------------------
    Result<BatchStats> performBatchDraw(const uint8_t* data, size_t size);
    Result<BatchStats> performBatchDraw(const std::vector<uint8_t>& batch) {
        return performBatchDraw(batch.data(), batch.size());
    }

    // Repaint `frame`: default background, then the content at the inset
    void display(GridSurface& frame);

    bool needsDisplay() const { return _dirty; }
    const GridSurface& surface() const { return _surface; }

    //-------------------------------------------------------------------------
    // Font and style
    //-------------------------------------------------------------------------
    void setFont(GlyphRasterizer::Ptr rasterizer);
    const GlyphRasterizer::Ptr& font() const { return _renderer.rasterizer(); }

    void setLinespace(float linespace);
    float linespace() const { return _linespace; }

    void setCellWidthMultiplier(float multiplier);
    float cellWidthMultiplier() const { return _cellWidthMultiplier; }

    void setAntialias(bool antialias);
    bool antialias() const { return _antialias; }

    void setDefaultColors(Color background, Color foreground);
    Color defaultBackground() const { return _executor.defaultBackground(); }
    Color defaultForeground() const { return _defaultFg; }

    void setInset(Inset inset) { _geometry.setInset(inset); }
    Inset inset() const { return _geometry.inset(); }

    CellSize cellSize() const { return _geometry.cellSize(); }
    int baseline() const { return _renderer.baseline(); }
    const GridGeometry& geometry() const { return _geometry; }

    //-------------------------------------------------------------------------
    // Sizing and hit testing
    //-------------------------------------------------------------------------
    ConstrainedSize constrain(PixelSize size) const {
        return _geometry.constrain(_requestedGrid, size);
    }
    PixelSize desiredSize() const { return _geometry.desiredSize(_requestedGrid); }
    PixelSize minSize() const { return _geometry.minSize(); }
    std::optional<CellPos> convertPoint(PixelPoint point, int viewHeight) const {
        return _geometry.pixelToCell(point, viewHeight);
    }

    //-------------------------------------------------------------------------
    // Host interaction
    //-------------------------------------------------------------------------
    void setDisplayCallback(DisplayCallback callback) { _displayCallback = std::move(callback); }
    void setHostCallback(HostCallback callback) { _hostCallback = std::move(callback); }
    void setCursorPosListener(DrawExecutor::CursorPosListener listener) {
        _executor.setCursorPosListener(std::move(listener));
    }

    // Ask the host to switch fonts; an empty name is ignored
    void requestFontChange(const std::string& name, float pointSize);

private:
    void updateCellSize();

    GridGeometry _geometry;
    GlyphRenderer _renderer{_geometry};
    DrawExecutor _executor{_geometry, _renderer};
    GridSurface _surface;

    GridSize _requestedGrid;
    GridSize _appliedGrid;
    float _linespace = 0.0f;
    float _cellWidthMultiplier = 1.0f;
    bool _antialias = true;
    Color _defaultFg = colors::Black;
    bool _dirty = false;

    DisplayCallback _displayCallback;
    HostCallback _hostCallback;
};

} // namespace celldraw
