//=============================================================================
// Glyph Renderer Tests
//
// Cell size 6x10, baseline 8: the fake rasterizer paints rows 0..7 of a cell,
// underline sits on row 8 and undercurl covers rows 8..9.
//=============================================================================

#include <boost/ut.hpp>
#include "harness/fake_rasterizer.h"

#include <celldraw/draw-command.h>
#include <celldraw/glyph-renderer.h>
#include <celldraw/utf8.h>

using namespace boost::ut;
using namespace celldraw;
using namespace celldraw::test;

namespace {

constexpr Color Bg = Color(0xFF202020);
constexpr Color Fg = Color(0xFFE0E0E0);
constexpr Color Sp = Color(0xFFFF0000);
constexpr Color Old = Color(0xFF0000FF);

struct Fixture {
    GridGeometry geometry{{6, 10}, {}};
    GlyphRenderer renderer{geometry};
    FakeRasterizer::Ptr font = std::make_shared<FakeRasterizer>();
    GridSurface surface{{60, 40}};

    Fixture() {
        renderer.setRasterizer(font);
        renderer.setBaseline(8);
        surface.clearAll(Old);
    }

    Result<void> draw(int row, int col, const std::u32string& text, int cells, int32_t flags) {
        return renderer.drawRun(surface, row, col, text, cells, flags, Fg, Bg, Sp);
    }
};

} // anonymous namespace

suite glyph_renderer_tests = [] {
    "run rect spans cells times cell width"_test = [] {
        GridGeometry g({6, 10}, {});
        GlyphRenderer r(g);
        auto rect = r.runRect(2, 3, 4, 9, 0);
        expect(rect == PixelRect{18, 20, 24, 10});
    };

    "run rect falls back to unit count without cells"_test = [] {
        GridGeometry g({6, 10}, {});
        GlyphRenderer r(g);
        expect(r.runRect(0, 0, 0, 5, 0).width == 30_i);
    };

    "wide runs double the rect and the advance"_test = [] {
        Fixture f;
        expect(f.renderer.runRect(0, 0, 2, 2, DRAW_WIDE).width == 24_i);

        expect(f.draw(1, 1, U"\u4E2D\u6587", 2, DRAW_WIDE).has_value());
        expect(f.font->runs().size() == 1_ul);
        expect(f.font->runs()[0].advance == 12_i);
        // background covers four cells starting at column 1
        expect(f.surface.pixel(6, 18) == Bg);
        expect(f.surface.pixel(29, 18) == Bg);
        expect(f.surface.pixel(30, 18) == Old);
    };

    "background is filled before the glyphs"_test = [] {
        Fixture f;
        expect(f.draw(0, 0, U"a ", 2, 0).has_value());
        expect(f.surface.pixel(0, 0) == Fg) << "glyph box";
        expect(f.surface.pixel(0, 9) == Bg) << "below the baseline";
        expect(f.surface.pixel(7, 0) == Bg) << "space has no glyph";
        expect(f.surface.pixel(12, 0) == Old) << "outside the run";
    };

    "transparent runs keep the old background"_test = [] {
        Fixture f;
        expect(f.draw(0, 0, U" ", 1, DRAW_TRANSP).has_value());
        expect(f.surface.pixel(0, 0) == Old);
        expect(f.surface.pixel(5, 9) == Old);
    };

    "underline is one row in the foreground color"_test = [] {
        Fixture f;
        expect(f.draw(1, 0, U"  ", 2, DRAW_UNDERL).has_value());
        // (row + 1) * cellHeight - 2 = 18
        expect(f.surface.pixel(0, 18) == Fg);
        expect(f.surface.pixel(11, 18) == Fg);
        expect(f.surface.pixel(0, 17) == Bg);
        expect(f.surface.pixel(0, 19) == Bg);
        expect(f.surface.pixel(12, 18) == Old);
    };

    "undercurl fills every other dot in the special color"_test = [] {
        Fixture f;
        expect(f.draw(0, 0, U" ", 1, DRAW_UNDERC).has_value());
        // dots at x = 0, 2, 4; odd steps (x = 2) are filled, 2 px tall
        expect(f.surface.pixel(0, 8) == Bg);
        expect(f.surface.pixel(1, 8) == Bg);
        expect(f.surface.pixel(2, 8) == Sp);
        expect(f.surface.pixel(3, 9) == Sp);
        expect(f.surface.pixel(4, 8) == Bg);
    };

    "rasterizer failure keeps the background and skips decoration"_test = [] {
        Fixture f;
        f.font->setFailing(true);
        auto res = f.draw(0, 0, U"x", 1, DRAW_UNDERL);
        expect(!res.has_value());
        expect(res.error().message().find("without decoration") != std::string::npos);
        expect(f.surface.pixel(0, 0) == Bg);
        expect(f.surface.pixel(0, 8) == Bg) << "no underline";
    };

    "rasterizer exceptions do not escape"_test = [] {
        Fixture f;
        f.font->setThrowing(true);
        auto res = f.draw(0, 0, U"x", 1, 0);
        expect(!res.has_value());
        expect(res.error().message().find("exploded") != std::string::npos);
    };

    "non-standard rasterizer exceptions do not escape"_test = [] {
        Fixture f;
        f.font->setThrowingCode(42);
        auto res = f.draw(0, 0, U"x", 1, DRAW_UNDERL);
        expect(!res.has_value());
        expect(res.error().message().find("non-standard") != std::string::npos);
        expect(f.surface.pixel(0, 0) == Bg) << "background drawn before the throw";
    };

    "no rasterizer is an error after the background"_test = [] {
        GridGeometry g({6, 10}, {});
        GlyphRenderer r(g);
        GridSurface s({12, 10});
        auto res = r.drawRun(s, 0, 0, U"a", 1, 0, Fg, Bg, Sp);
        expect(!res.has_value());
        expect(s.pixel(0, 0) == Bg);
    };

    "style flags reach the rasterizer"_test = [] {
        Fixture f;
        expect(f.draw(0, 0, U"b", 1, DRAW_BOLD | DRAW_ITALIC).has_value());
        expect(f.font->runs()[0].flags == (DRAW_BOLD | DRAW_ITALIC));
        expect(f.font->runs()[0].fg == Fg);
    };
};

suite utf8_tests = [] {
    "utf8 decodes multi byte sequences"_test = [] {
        auto text = utf8ToUtf32("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
        expect(text == U"a\u00E9\u4E2D\U0001F600");
    };

    "malformed utf8 becomes replacement characters"_test = [] {
        expect(utf8ToUtf32("\xFF") == U"\uFFFD");
        expect(utf8ToUtf32("a\xC3") == U"a\uFFFD");
        expect(utf8ToUtf32("\xC0\xAF").find(U'/') == std::u32string::npos);   // overlong '/'
        expect(utf8ToUtf32("\xED\xA0\x80").find(U'\uFFFD') != std::u32string::npos);
    };
};
