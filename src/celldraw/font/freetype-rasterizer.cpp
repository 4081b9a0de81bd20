#include <celldraw/font/freetype-rasterizer.h>
#include <celldraw/font/freetype.h>
#include <celldraw/draw-command.h>
#include <celldraw/grid-surface.h>
#include <ytrace/ytrace.hpp>

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_OUTLINE_H

#include <cmath>
#include <string>
#include <unordered_map>
#include <vector>

namespace celldraw::font {

namespace {

// Rendered glyph, 8-bit coverage, positioned relative to the pen
struct CachedGlyph {
    int left = 0;       // bitmap_left
    int top = 0;        // bitmap_top (distance above the baseline)
    int width = 0;
    int rows = 0;
    std::vector<uint8_t> coverage;
};

inline uint64_t glyphKey(char32_t cp, bool bold, bool italic) {
    return (static_cast<uint64_t>(cp) << 2) | (bold ? 1u : 0u) | (italic ? 2u : 0u);
}

} // anonymous namespace

//=============================================================================
// FreeTypeRasterizerImpl
//=============================================================================

class FreeTypeRasterizerImpl : public FreeTypeRasterizer {
public:
    FreeTypeRasterizerImpl(std::string path, float pointSize)
        : _path(std::move(path)), _pointSize(pointSize) {}

    ~FreeTypeRasterizerImpl() override {
        if (_face) FT_Done_Face(_face);
        if (_library) FT_Done_FreeType(_library);
    }

    Result<void> init() {
        FT_Library lib = ftLibrary();
        if (!lib) {
            return Err<void>("FreeType library not available");
        }
        // The face may outlive the creating thread's library instance
        if (FT_Error err = FT_Reference_Library(lib); err) {
            return Err<void>("FT_Reference_Library failed (FreeType error " +
                             std::to_string(err) + ")");
        }
        _library = lib;

        if (_pointSize <= 0.0f) {
            return Err<void>("Invalid point size " + std::to_string(_pointSize));
        }

        if (FT_Error err = FT_New_Face(lib, _path.c_str(), 0, &_face); err) {
            _face = nullptr;
            return Err<void>("Failed to load font: " + _path +
                             " (FreeType error " + std::to_string(err) + ")");
        }

        auto charSize = static_cast<FT_F26Dot6>(std::lround(_pointSize * 64.0f));
        if (FT_Error err = FT_Set_Char_Size(_face, 0, charSize, 72, 72); err) {
            return Err<void>("Failed to set size " + std::to_string(_pointSize) +
                             " on " + _path + " (FreeType error " + std::to_string(err) + ")");
        }

        _name = _face->family_name ? _face->family_name : _path;
        if (_face->style_name && std::string(_face->style_name) != "Regular") {
            _name += " ";
            _name += _face->style_name;
        }

        updateMetrics();

        yinfo("FreeTypeRasterizer loaded: {} ({}pt, ascender={:.1f}, lineHeight={:.1f}, em={:.1f})",
              _name, _pointSize, _metrics.ascender, _metrics.lineHeight, _metrics.emAdvance);
        return Ok();
    }

    //=========================================================================
    // GlyphRasterizer
    //=========================================================================

    const std::string& name() const override { return _name; }
    float pointSize() const override { return _pointSize; }
    FontMetrics metrics() const override { return _metrics; }

    void setAntialias(bool enabled) override {
        if (enabled == _antialias) return;
        _antialias = enabled;
        _cache.clear();
    }

    bool antialias() const override { return _antialias; }

    Result<void> paintRun(GridSurface& surface, const GlyphRun& run) override {
        bool bold = run.flags & DRAW_BOLD;
        bool italic = run.flags & DRAW_ITALIC;
        int baselineY = run.rect.y + run.baseline;

        int failed = 0;
        for (size_t i = 0; i < run.text.size(); ++i) {
            char32_t cp = run.text[i];
            int penX = run.rect.x + static_cast<int>(i) * run.advance;

            auto glyphRes = glyphFor(cp, bold, italic);
            if (!glyphRes) {
                ydebug("FreeTypeRasterizer: U+{:04X}: {}", static_cast<uint32_t>(cp),
                       error_msg(glyphRes));
                ++failed;
                continue;
            }
            const CachedGlyph* glyph = *glyphRes;
            if (glyph->coverage.empty()) continue;

            surface.blendCoverage(penX + glyph->left, baselineY - glyph->top,
                                  glyph->coverage.data(), glyph->width, glyph->rows,
                                  glyph->width, run.fg);
        }

        if (failed) {
            return Err<void>("FreeTypeRasterizer: " + std::to_string(failed) +
                             " glyph(s) failed to render");
        }
        return Ok();
    }

    //=========================================================================
    // FreeTypeRasterizer
    //=========================================================================

    const std::string& path() const override { return _path; }
    size_t cachedGlyphCount() const override { return _cache.size(); }

private:
    void updateMetrics() {
        const FT_Size_Metrics& m = _face->size->metrics;
        _metrics.ascender = static_cast<float>(m.ascender) / 64.0f;
        _metrics.descender = static_cast<float>(-m.descender) / 64.0f;
        _metrics.lineHeight = static_cast<float>(m.height) / 64.0f;

        FT_Set_Transform(_face, nullptr, nullptr);
        if (FT_Load_Char(_face, 'm', FT_LOAD_DEFAULT) == 0) {
            _metrics.emAdvance = static_cast<float>(_face->glyph->advance.x) / 64.0f;
        } else {
            _metrics.emAdvance = static_cast<float>(m.max_advance) / 64.0f;
            ywarn("FreeTypeRasterizer: no 'm' in {}, using max advance", _name);
        }
    }

    Result<const CachedGlyph*> glyphFor(char32_t cp, bool bold, bool italic) {
        uint64_t key = glyphKey(cp, bold, italic);
        if (auto it = _cache.find(key); it != _cache.end()) {
            return &it->second;
        }

        auto rendered = renderGlyph(cp, bold, italic);
        if (!rendered) {
            return Err<const CachedGlyph*>("render failed", rendered);
        }
        auto [it, inserted] = _cache.emplace(key, std::move(*rendered));
        return &it->second;
    }

    Result<CachedGlyph> renderGlyph(char32_t cp, bool bold, bool italic) {
        FT_Matrix shear = {0x10000, italic ? ITALIC_SKEW : 0, 0, 0x10000};
        FT_Set_Transform(_face, italic ? &shear : nullptr, nullptr);

        // Index 0 (.notdef) is rendered like any other glyph
        FT_UInt glyphIndex = FT_Get_Char_Index(_face, static_cast<FT_ULong>(cp));
        FT_Int32 loadFlags = _antialias ? FT_LOAD_TARGET_NORMAL : FT_LOAD_TARGET_MONO;
        FT_Error err = FT_Load_Glyph(_face, glyphIndex, loadFlags);
        FT_Set_Transform(_face, nullptr, nullptr);
        if (err) {
            return Err<CachedGlyph>("FT_Load_Glyph error " + std::to_string(err));
        }

        FT_GlyphSlot slot = _face->glyph;
        if (bold && slot->format == FT_GLYPH_FORMAT_OUTLINE) {
            FT_Pos strength = FT_MulFix(_face->units_per_EM, _face->size->metrics.y_scale) / 24;
            if (FT_Outline_Embolden(&slot->outline, strength)) {
                ydebug("FreeTypeRasterizer: embolden failed for U+{:04X}",
                       static_cast<uint32_t>(cp));
            }
        }

        if (slot->format != FT_GLYPH_FORMAT_BITMAP) {
            FT_Render_Mode mode = _antialias ? FT_RENDER_MODE_NORMAL : FT_RENDER_MODE_MONO;
            if (FT_Error rerr = FT_Render_Glyph(slot, mode); rerr) {
                return Err<CachedGlyph>("FT_Render_Glyph error " + std::to_string(rerr));
            }
        }

        const FT_Bitmap& bitmap = slot->bitmap;
        CachedGlyph glyph;
        glyph.left = slot->bitmap_left;
        glyph.top = slot->bitmap_top;
        glyph.width = static_cast<int>(bitmap.width);
        glyph.rows = static_cast<int>(bitmap.rows);

        if (glyph.width == 0 || glyph.rows == 0) {
            return glyph;   // e.g. space
        }

        glyph.coverage.resize(static_cast<size_t>(glyph.width) * glyph.rows, 0);
        for (int y = 0; y < glyph.rows; ++y) {
            const uint8_t* src = bitmap.buffer + static_cast<ptrdiff_t>(y) * bitmap.pitch;
            uint8_t* dst = glyph.coverage.data() + static_cast<size_t>(y) * glyph.width;
            switch (bitmap.pixel_mode) {
                case FT_PIXEL_MODE_GRAY:
                    for (int x = 0; x < glyph.width; ++x) dst[x] = src[x];
                    break;
                case FT_PIXEL_MODE_MONO:
                    for (int x = 0; x < glyph.width; ++x) {
                        dst[x] = (src[x >> 3] & (0x80 >> (x & 7))) ? 0xFF : 0x00;
                    }
                    break;
                default:
                    return Err<CachedGlyph>("unsupported pixel mode " +
                                            std::to_string(bitmap.pixel_mode));
            }
        }
        return glyph;
    }

    std::string _path;
    std::string _name;
    float _pointSize;
    bool _antialias = true;
    FT_Library _library = nullptr;
    FT_Face _face = nullptr;
    FontMetrics _metrics;
    std::unordered_map<uint64_t, CachedGlyph> _cache;
};

//=============================================================================
// FreeTypeRasterizer::createImpl - ObjectFactory entry point
//=============================================================================

Result<FreeTypeRasterizer::Ptr> FreeTypeRasterizer::createImpl(ContextType&,
                                                              const std::string& fontPath,
                                                              float pointSize) {
    auto impl = std::make_shared<FreeTypeRasterizerImpl>(fontPath, pointSize);
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize FreeTypeRasterizer", res);
    }
    return Ok(Ptr(std::move(impl)));
}

} // namespace celldraw::font
