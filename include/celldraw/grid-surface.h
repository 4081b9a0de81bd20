#pragma once

#include <celldraw/color.h>
#include <celldraw/geometry.h>
#include <celldraw/result.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace celldraw {

//-----------------------------------------------------------------------------
// GridSurface - off-screen ARGB pixel buffer holding the rendered grid
//
// Row 0 is the top of the text area. The surface is reallocated, never
// resized in place. All rects are surface-local and are intersected with the
// buffer bounds before any pixel is touched.
//-----------------------------------------------------------------------------
class GridSurface {
public:
    // Releases the drawing bracket on scope exit, whatever path is taken
    class BatchScope {
    public:
        explicit BatchScope(GridSurface& surface) : _surface(surface) {
            _opened = _surface.beginBatch();
        }
        ~BatchScope() {
            if (_opened) (void)_surface.endBatch();
        }

        BatchScope(const BatchScope&) = delete;
        BatchScope& operator=(const BatchScope&) = delete;

        explicit operator bool() const { return _opened.has_value(); }
        const Result<void>& status() const { return _opened; }

    private:
        GridSurface& _surface;
        Result<void> _opened;
    };

    GridSurface() = default;
    explicit GridSurface(PixelSize size);

    // Discard the pixel store and allocate a fresh one
    void resizeTo(PixelSize size);

    Result<void> beginBatch();
    Result<void> endBatch();
    bool isDrawing() const { return _drawing; }

    int width() const { return _size.width; }
    int height() const { return _size.height; }
    PixelSize size() const { return _size; }
    bool empty() const { return _pixels.empty(); }

    // Number of reallocations since construction
    uint32_t generation() const { return _generation; }

    Color pixel(int x, int y) const;
    const std::vector<uint32_t>& pixels() const { return _pixels; }

    void clearAll(Color color);
    void fillRect(const PixelRect& rect, Color color);
    void frameRect(const PixelRect& rect, Color color);

    // Move the pixels of `rect` by `dy` rows (negative = up). Source rows
    // that are not overwritten keep their old content.
    void copyRegion(const PixelRect& rect, int dy);

    // Difference blend with opaque white: rgb' = 255 - rgb
    void invertRect(const PixelRect& rect);

    // Blend an 8-bit coverage mask of maskWidth x maskHeight at (x, y)
    void blendCoverage(int x, int y, const uint8_t* mask, int maskWidth,
                       int maskHeight, int maskPitch, Color color);

    // Copy `src` at (x, y)
    void blit(const GridSurface& src, int x, int y);

    Result<void> writePpm(const std::string& path) const;

private:
    PixelRect clip(const PixelRect& rect) const;
    uint32_t* row(int y) { return _pixels.data() + static_cast<size_t>(y) * _size.width; }
    const uint32_t* row(int y) const {
        return _pixels.data() + static_cast<size_t>(y) * _size.width;
    }

    PixelSize _size;
    std::vector<uint32_t> _pixels;
    uint32_t _generation = 0;
    bool _drawing = false;
};

} // namespace celldraw
