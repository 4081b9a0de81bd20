#include <celldraw/text-view.h>
#include <celldraw/batch-decoder.h>
#include <celldraw/config.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace celldraw {

//=============================================================================
// ViewStyle
//=============================================================================

ViewStyle ViewStyle::fromConfig(const Config& config) {
    ViewStyle style;
    style.fontPath = config.get<std::string>(Config::KEY_FONT_PATH, style.fontPath);
    style.pointSize = config.get<float>(Config::KEY_FONT_SIZE, style.pointSize);
    style.cellWidthMultiplier = config.get<float>(Config::KEY_FONT_CELL_WIDTH_MULTIPLIER,
                                                  style.cellWidthMultiplier);
    style.linespace = config.get<float>(Config::KEY_FONT_LINESPACE, style.linespace);
    style.antialias = config.get<bool>(Config::KEY_FONT_ANTIALIAS, style.antialias);
    style.inset.width = config.get<int>(Config::KEY_VIEW_INSET_WIDTH, style.inset.width);
    style.inset.height = config.get<int>(Config::KEY_VIEW_INSET_HEIGHT, style.inset.height);
    style.minGrid.rows = config.get<int>(Config::KEY_VIEW_MIN_ROWS, style.minGrid.rows);
    style.minGrid.columns = config.get<int>(Config::KEY_VIEW_MIN_COLUMNS, style.minGrid.columns);
    style.grid.rows = config.get<int>(Config::KEY_GRID_ROWS, style.grid.rows);
    style.grid.columns = config.get<int>(Config::KEY_GRID_COLUMNS, style.grid.columns);
    style.background = config.getColor(Config::KEY_COLORS_BACKGROUND).value_or(style.background);
    style.foreground = config.getColor(Config::KEY_COLORS_FOREGROUND).value_or(style.foreground);
    return style;
}

GridReconcile reconcileGrid(GridSize requested, const GridGeometry& geometry,
                            PixelSize current) {
    PixelSize wanted = geometry.textAreaSize(requested);
    return {wanted != current, wanted};
}

//=============================================================================
// TextView
//=============================================================================

TextView::TextView(const ViewStyle& style)
    : _requestedGrid(style.grid)
    , _linespace(style.linespace)
    , _cellWidthMultiplier(style.cellWidthMultiplier)
    , _antialias(style.antialias)
    , _defaultFg(style.foreground) {
    _geometry.setInset(style.inset);
    _geometry.setMinGrid(style.minGrid);
    _executor.setDefaultBackground(style.background);
}

void TextView::setMaxRows(int rows, int columns) {
    _requestedGrid = {std::max(0, rows), std::max(0, columns)};
    ydebug("TextView: requested grid {}x{}", _requestedGrid.rows, _requestedGrid.columns);
}

Result<BatchStats> TextView::performBatchDraw(const uint8_t* data, size_t size) {
    auto reconcile = reconcileGrid(_requestedGrid, _geometry, _surface.size());
    if (reconcile.resize) {
        _surface.resizeTo(reconcile.size);
    }
    _appliedGrid = _requestedGrid;

    BatchStats stats;
    {
        GridSurface::BatchScope scope(_surface);
        if (!scope) {
            return Err<BatchStats>("TextView: cannot open batch", scope.status());
        }

        BatchDecoder decoder(data, size);
        while (!decoder.atEnd()) {
            size_t recordStart = decoder.offset();
            auto command = decoder.next();
            if (!command) {
                ywarn("TextView: batch stopped after {} records: {}",
                      stats.recordsApplied, error_msg(command));
                stats.stoppedEarly = true;
                stats.bytesConsumed = recordStart;
                break;
            }
            _executor.apply(_surface, *command);
            ++stats.recordsApplied;
            stats.bytesConsumed = decoder.offset();
        }
    }

    _dirty = true;
    if (_displayCallback) {
        _displayCallback(*this);
    }
    return Ok(stats);
}

void TextView::display(GridSurface& frame) {
    frame.clearAll(_executor.defaultBackground());
    Inset inset = _geometry.inset();
    frame.blit(_surface, inset.width, inset.height);
    _dirty = false;
}

//-----------------------------------------------------------------------------
// Font
//-----------------------------------------------------------------------------

void TextView::setFont(GlyphRasterizer::Ptr rasterizer) {
    if (rasterizer) {
        rasterizer->setAntialias(_antialias);
        yinfo("TextView: font {} {}pt", rasterizer->name(), rasterizer->pointSize());
    }
    _renderer.setRasterizer(std::move(rasterizer));
    updateCellSize();
}

void TextView::setLinespace(float linespace) {
    _linespace = linespace;
    updateCellSize();
}

void TextView::setCellWidthMultiplier(float multiplier) {
    _cellWidthMultiplier = multiplier;
    updateCellSize();
}

void TextView::setAntialias(bool antialias) {
    _antialias = antialias;
    if (auto& rasterizer = _renderer.rasterizer()) {
        rasterizer->setAntialias(antialias);
    }
}

void TextView::setDefaultColors(Color background, Color foreground) {
    _executor.setDefaultBackground(background);
    _defaultFg = foreground;
}

void TextView::updateCellSize() {
    const auto& rasterizer = _renderer.rasterizer();
    if (!rasterizer) return;

    FontMetrics m = rasterizer->metrics();
    CellSize cell;
    cell.width = std::max(1, static_cast<int>(std::ceil(m.emAdvance * _cellWidthMultiplier)));
    cell.height = std::max(1, static_cast<int>(std::ceil(m.lineHeight + _linespace)));
    _geometry.setCellSize(cell);
    _renderer.setBaseline(static_cast<int>(std::lround(m.ascender)));

    ydebug("TextView: cell size {}x{} baseline {}", cell.width, cell.height,
           _renderer.baseline());
}

//-----------------------------------------------------------------------------
// Host
//-----------------------------------------------------------------------------

void TextView::requestFontChange(const std::string& name, float pointSize) {
    if (name.empty()) {
        ydebug("TextView: ignoring font change without a name");
        return;
    }
    if (!_hostCallback) {
        ywarn("TextView: no host to send font change to");
        return;
    }
    _hostCallback(HostMessageId::SetFont, encodeSetFontMessage(name, pointSize));
}

} // namespace celldraw
