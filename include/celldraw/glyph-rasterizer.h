#pragma once

#include <celldraw/color.h>
#include <celldraw/geometry.h>
#include <celldraw/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace celldraw {

class GridSurface;

// Font metrics in pixels at the rasterizer's current size
struct FontMetrics {
    float ascender = 0.0f;
    float descender = 0.0f;     // positive distance below the baseline
    float lineHeight = 0.0f;    // default line height of the face
    float emAdvance = 0.0f;     // advance of 'm'
};

// One run of glyphs laid out on the cell grid
struct GlyphRun {
    PixelRect rect;             // target area, surface space
    int baseline = 0;           // baseline offset from rect.y
    std::u32string_view text;   // one glyph per code point
    int advance = 1;            // fixed pen advance per glyph
    int32_t flags = 0;          // DRAW_* bits (bold/italic are synthesized)
    Color fg;
};

//-----------------------------------------------------------------------------
// GlyphRasterizer - the font backend seen by the glyph renderer
//
// Implementations paint coverage in run.fg only; backgrounds and decorations
// belong to GlyphRenderer. There is no shaping: code points map to glyphs
// one to one, so ligatures never form.
//-----------------------------------------------------------------------------
class GlyphRasterizer {
public:
    using Ptr = std::shared_ptr<GlyphRasterizer>;

    virtual ~GlyphRasterizer() = default;

    virtual const std::string& name() const = 0;
    virtual float pointSize() const = 0;
    virtual FontMetrics metrics() const = 0;

    virtual void setAntialias(bool enabled) = 0;
    virtual bool antialias() const = 0;

    virtual Result<void> paintRun(GridSurface& surface, const GlyphRun& run) = 0;
};

} // namespace celldraw
