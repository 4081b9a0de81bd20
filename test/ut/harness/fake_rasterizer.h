#pragma once

//=============================================================================
// Fake Rasterizer for Testing
//
// Paints every non-space code point as a solid box from the top of the cell
// down to the baseline, so tests can check glyph placement pixel by pixel
// without a font file.
//=============================================================================

#include <celldraw/glyph-rasterizer.h>
#include <celldraw/grid-surface.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace celldraw::test {

struct PaintedRun {
    PixelRect rect;
    std::u32string text;
    int advance = 0;
    int32_t flags = 0;
    Color fg;
};

class FakeRasterizer : public GlyphRasterizer {
public:
    using Ptr = std::shared_ptr<FakeRasterizer>;

    // 6x10 cells with the baseline at 8 unless told otherwise
    explicit FakeRasterizer(FontMetrics metrics = {8.0f, 2.0f, 10.0f, 6.0f})
        : _metrics(metrics) {}

    const std::string& name() const override { return _name; }
    float pointSize() const override { return 10.0f; }
    FontMetrics metrics() const override { return _metrics; }

    void setAntialias(bool enabled) override { _antialias = enabled; }
    bool antialias() const override { return _antialias; }

    Result<void> paintRun(GridSurface& surface, const GlyphRun& run) override {
        if (_throw) {
            throw std::runtime_error("fake rasterizer exploded");
        }
        if (_throwCode) {
            throw _throwCode;
        }
        _runs.push_back({run.rect, std::u32string(run.text), run.advance, run.flags, run.fg});
        if (_fail) {
            return Err<void>("fake rasterizer failure");
        }

        for (size_t i = 0; i < run.text.size(); ++i) {
            if (run.text[i] == U' ') continue;
            int x = run.rect.x + static_cast<int>(i) * run.advance;
            surface.fillRect({x, run.rect.y, run.advance, run.baseline}, run.fg);
        }
        return Ok();
    }

    void setMetrics(FontMetrics metrics) { _metrics = metrics; }
    void setFailing(bool fail) { _fail = fail; }
    void setThrowing(bool doThrow) { _throw = doThrow; }
    // throws a bare int, not derived from std::exception
    void setThrowingCode(int code) { _throwCode = code; }

    const std::vector<PaintedRun>& runs() const { return _runs; }
    void clearRuns() { _runs.clear(); }

private:
    std::string _name = "fake";
    FontMetrics _metrics;
    bool _antialias = true;
    bool _fail = false;
    bool _throw = false;
    int _throwCode = 0;
    std::vector<PaintedRun> _runs;
};

} // namespace celldraw::test
