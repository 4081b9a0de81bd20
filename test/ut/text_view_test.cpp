//=============================================================================
// Text View Tests
//=============================================================================

#include <boost/ut.hpp>
#include "harness/fake_rasterizer.h"

#include <celldraw/batch-writer.h>
#include <celldraw/host-message.h>
#include <celldraw/text-view.h>

#include <vector>

using namespace boost::ut;
using namespace celldraw;
using namespace celldraw::test;

namespace {

constexpr Color Paper = Color(0xFFFAFAFA);
constexpr Color Ink = Color(0xFF101010);

ViewStyle testStyle() {
    ViewStyle style;
    style.inset = {2, 1};
    style.grid = {4, 10};
    style.background = Paper;
    style.foreground = Ink;
    return style;
}

} // anonymous namespace

suite text_view_tests = [] {
    "cell size follows the font metrics"_test = [] {
        TextView view(testStyle());
        auto font = std::make_shared<FakeRasterizer>(FontMetrics{8.4f, 2.0f, 10.2f, 6.1f});
        view.setFont(font);
        expect(view.cellSize() == CellSize{7, 11});   // ceil(6.1), ceil(10.2)
        expect(view.baseline() == 8_i);

        view.setLinespace(2.0f);
        expect(view.cellSize().height == 13_i);       // ceil(10.2 + 2)

        view.setCellWidthMultiplier(1.5f);
        expect(view.cellSize().width == 10_i);        // ceil(6.1 * 1.5)
    };

    "cell size never drops below one pixel"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>(FontMetrics{0.0f, 0.0f, 0.0f, 0.0f}));
        expect(view.cellSize() == CellSize{1, 1});
    };

    "antialias is forwarded to the font"_test = [] {
        TextView view(testStyle());
        auto font = std::make_shared<FakeRasterizer>();
        view.setAntialias(false);
        view.setFont(font);
        expect(!font->antialias());
        view.setAntialias(true);
        expect(font->antialias());
    };

    "grid changes apply at the next batch"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());

        expect(view.performBatchDraw(DrawBatchWriter().clearAll().bytes()).has_value());
        expect(view.surface().size() == PixelSize{60, 40});
        auto gen = view.surface().generation();

        view.setMaxRows(6, 12);
        expect(view.requestedGrid() == GridSize{6, 12});
        expect(view.appliedGrid() == GridSize{4, 10});
        expect(view.surface().size() == PixelSize{60, 40}) << "no resize before drawing";

        expect(view.performBatchDraw(DrawBatchWriter().clearAll().bytes()).has_value());
        expect(view.appliedGrid() == GridSize{6, 12});
        expect(view.surface().size() == PixelSize{72, 60});
        expect(view.surface().generation() == gen + 1);

        // same size again: no reallocation
        expect(view.performBatchDraw(std::vector<uint8_t>{}).has_value());
        expect(view.surface().generation() == gen + 1);
    };

    "font change resizes lazily"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        expect(view.performBatchDraw(std::vector<uint8_t>{}).has_value());

        view.setLinespace(4.0f);
        expect(view.surface().height() == 40_i);
        expect(view.performBatchDraw(std::vector<uint8_t>{}).has_value());
        expect(view.surface().height() == 56_i);
    };

    "reconcile only asks for a resize on mismatch"_test = [] {
        GridGeometry g({6, 10}, {});
        auto same = reconcileGrid({4, 10}, g, {60, 40});
        expect(!same.resize);
        auto differ = reconcileGrid({5, 10}, g, {60, 40});
        expect(differ.resize);
        expect(differ.size == PixelSize{60, 50});
    };

    "display fires once per batch"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        int repaints = 0;
        view.setDisplayCallback([&](const TextView& v) {
            ++repaints;
            expect(v.needsDisplay());
            expect(!v.surface().isDrawing());
        });

        DrawBatchWriter w;
        for (int i = 0; i < 20; ++i) {
            w.clearBlock(Ink, 0, 0, 0, 0);
        }
        auto stats = view.performBatchDraw(w.bytes());
        expect(stats.has_value());
        expect(stats->recordsApplied == 20_ul);
        expect(repaints == 1_i);
    };

    "undecodable record stops the batch but keeps earlier drawing"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        int repaints = 0;
        view.setDisplayCallback([&](const TextView&) { ++repaints; });

        DrawBatchWriter w;
        w.clearAll()
         .clearBlock(Ink, 0, 0, 0, 0)
         .setCursorPos(0, 0);
        size_t goodBytes = w.size();
        w.raw(0xFFFFFFFFu).clearBlock(Ink, 1, 1, 1, 1);

        auto stats = view.performBatchDraw(w.bytes());
        expect(stats.has_value());
        expect(stats->recordsApplied == 3_ul);
        expect(stats->stoppedEarly);
        expect(stats->bytesConsumed == goodBytes);
        expect(repaints == 1_i);
        expect(view.surface().pixel(0, 0) == Ink);
        expect(view.surface().pixel(7, 11) == Paper) << "record after the bad tag never ran";
        expect(!view.surface().isDrawing());

        // the next batch draws normally
        auto next = view.performBatchDraw(DrawBatchWriter().clearBlock(Ink, 1, 1, 1, 1).bytes());
        expect(next.has_value());
        expect(!next->stoppedEarly);
        expect(view.surface().pixel(7, 11) == Ink);
    };

    "clear all paints the default background"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        view.setDefaultColors(Ink, Paper);
        expect(view.defaultBackground() == Ink);
        expect(view.defaultForeground() == Paper);
        expect(view.performBatchDraw(DrawBatchWriter().clearAll().bytes()).has_value());
        expect(view.surface().pixel(59, 39) == Ink);
    };

    "display composites content at the inset"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        expect(view.performBatchDraw(DrawBatchWriter().clearBlock(Ink, 0, 0, 3, 9).bytes())
                   .has_value());

        GridSurface frame(view.desiredSize());
        expect(frame.size() == PixelSize{64, 42});
        view.display(frame);
        expect(!view.needsDisplay());
        expect(frame.pixel(0, 0) == Paper);
        expect(frame.pixel(1, 0) == Paper);
        expect(frame.pixel(2, 1) == Ink);
        expect(frame.pixel(61, 40) == Ink);
        expect(frame.pixel(62, 41) == Paper);
    };

    "sizing delegates to the geometry"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        expect(view.desiredSize() == PixelSize{64, 42});
        expect(view.minSize() == PixelSize{30 * 6 + 4, 4 * 10 + 2});

        auto c = view.constrain({100, 100});
        expect(c.grid == GridSize{9, 16});
        expect(view.constrain(c.size).grid == c.grid);

        auto cell = view.convertPoint({2 + 6 + 1, 42 - (1 + 10 + 1)}, 42);
        expect(cell.has_value());
        expect(cell->row == 1_i);
        expect(cell->column == 1_i);
    };

    "cursor position reaches the listener"_test = [] {
        TextView view(testStyle());
        view.setFont(std::make_shared<FakeRasterizer>());
        int row = -1, col = -1;
        view.setCursorPosListener([&](int r, int c) { row = r; col = c; });
        expect(view.performBatchDraw(DrawBatchWriter().setCursorPos(3, 7).bytes()).has_value());
        expect(row == 3_i);
        expect(col == 7_i);
    };

    "font change request goes to the host"_test = [] {
        TextView view(testStyle());
        std::vector<std::pair<HostMessageId, std::vector<uint8_t>>> sent;
        view.setHostCallback([&](HostMessageId id, std::vector<uint8_t> bytes) {
            sent.emplace_back(id, std::move(bytes));
        });

        view.requestFontChange("", 12.0f);
        expect(sent.empty()) << "empty names are ignored";

        view.requestFontChange("DejaVu Sans Mono", 13.5f);
        expect(sent.size() == 1_ul);
        expect(sent[0].first == HostMessageId::SetFont);

        const auto& bytes = sent[0].second;
        expect(bytes.size() == sizeof(float) + sizeof(uint32_t) + 17);
        auto msg = decodeSetFontMessage(bytes.data(), bytes.size());
        expect(msg.has_value());
        expect(msg->name == "DejaVu Sans Mono");
        expect(msg->pointSize == 13.5_f);
        expect(bytes.back() == 0);
    };

    "malformed font messages are rejected"_test = [] {
        auto bytes = encodeSetFontMessage("Menlo", 11.0f);
        expect(!decodeSetFontMessage(bytes.data(), 5).has_value());
        bytes.back() = 'x';
        expect(!decodeSetFontMessage(bytes.data(), bytes.size()).has_value());
    };
};
