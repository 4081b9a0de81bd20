#pragma once

#include <celldraw/base/factory.h>
#include <celldraw/glyph-rasterizer.h>

#include <memory>
#include <string>

namespace celldraw::font {

/**
 * FreeTypeRasterizer - FreeType 2 backend for the glyph renderer
 *
 * Loads one face at a point size (72 dpi, so points == pixels) and renders
 * glyph coverage straight into the grid surface. Bold and italic are
 * synthesized from the regular face: outline emboldening and a shear
 * transform. Rendered glyphs are cached per (code point, bold, italic) until
 * the antialias mode changes.
 */
class FreeTypeRasterizer : public GlyphRasterizer,
                           public base::ObjectFactory<FreeTypeRasterizer> {
public:
    using Ptr = std::shared_ptr<FreeTypeRasterizer>;
    using base::ObjectFactory<FreeTypeRasterizer>::create;

    // Horizontal shear for synthetic italic, 16.16 fixed point (0.25)
    static constexpr long ITALIC_SKEW = 0x4000;

    static Result<Ptr> createImpl(ContextType& ctx, const std::string& fontPath,
                                  float pointSize);

    ~FreeTypeRasterizer() override = default;

    virtual const std::string& path() const = 0;
    virtual size_t cachedGlyphCount() const = 0;

protected:
    FreeTypeRasterizer() = default;
};

} // namespace celldraw::font
