#include <celldraw/grid-surface.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace celldraw {

namespace {

inline uint32_t blendChannel(uint32_t src, uint32_t dst, uint32_t alpha) {
    return (src * alpha + dst * (255 - alpha) + 127) / 255;
}

inline uint32_t blendPixel(uint32_t dst, Color src, uint32_t coverage) {
    uint32_t alpha = (static_cast<uint32_t>(src.a()) * coverage + 127) / 255;
    if (alpha == 0) return dst;
    if (alpha == 255) return src.argb;

    Color d(dst);
    uint32_t r = blendChannel(src.r(), d.r(), alpha);
    uint32_t g = blendChannel(src.g(), d.g(), alpha);
    uint32_t b = blendChannel(src.b(), d.b(), alpha);
    uint32_t a = alpha + (static_cast<uint32_t>(d.a()) * (255 - alpha) + 127) / 255;
    return (a << 24) | (r << 16) | (g << 8) | b;
}

} // anonymous namespace

GridSurface::GridSurface(PixelSize size) {
    resizeTo(size);
}

void GridSurface::resizeTo(PixelSize size) {
    size.width = std::max(size.width, 0);
    size.height = std::max(size.height, 0);

    // Fresh store rather than std::vector::resize: old contents never survive
    std::vector<uint32_t> fresh(static_cast<size_t>(size.width) * size.height, 0u);
    _pixels.swap(fresh);
    _size = size;
    ++_generation;
    ydebug("GridSurface: reallocated {}x{} (generation {})",
           _size.width, _size.height, _generation);
}

Result<void> GridSurface::beginBatch() {
    if (_drawing) {
        return Err<void>("GridSurface: batch already open");
    }
    _drawing = true;
    return Ok();
}

Result<void> GridSurface::endBatch() {
    if (!_drawing) {
        return Err<void>("GridSurface: no open batch");
    }
    _drawing = false;
    return Ok();
}

Color GridSurface::pixel(int x, int y) const {
    if (x < 0 || y < 0 || x >= _size.width || y >= _size.height) {
        return colors::Transparent;
    }
    return Color(row(y)[x]);
}

PixelRect GridSurface::clip(const PixelRect& rect) const {
    int x0 = std::max(rect.x, 0);
    int y0 = std::max(rect.y, 0);
    int x1 = std::min(rect.x + rect.width, _size.width);
    int y1 = std::min(rect.y + rect.height, _size.height);
    if (x1 <= x0 || y1 <= y0) return {};
    return {x0, y0, x1 - x0, y1 - y0};
}

void GridSurface::clearAll(Color color) {
    std::fill(_pixels.begin(), _pixels.end(), color.argb);
}

void GridSurface::fillRect(const PixelRect& rect, Color color) {
    PixelRect r = clip(rect);
    if (r.empty()) return;

    for (int y = r.y; y < r.y + r.height; ++y) {
        uint32_t* line = row(y) + r.x;
        std::fill(line, line + r.width, color.argb);
    }
}

void GridSurface::frameRect(const PixelRect& rect, Color color) {
    if (rect.empty()) return;

    fillRect({rect.x, rect.y, rect.width, 1}, color);
    fillRect({rect.x, rect.y + rect.height - 1, rect.width, 1}, color);
    fillRect({rect.x, rect.y, 1, rect.height}, color);
    fillRect({rect.x + rect.width - 1, rect.y, 1, rect.height}, color);
}

void GridSurface::copyRegion(const PixelRect& rect, int dy) {
    PixelRect src = clip(rect);
    if (src.empty() || dy == 0) return;

    // Only rows whose destination lands inside the surface are moved
    int firstRow = std::max(src.y, -dy);
    int lastRow = std::min(src.y + src.height, _size.height - dy);  // exclusive
    if (lastRow <= firstRow) return;

    size_t bytes = static_cast<size_t>(src.width) * sizeof(uint32_t);
    if (dy < 0) {
        // Moving up: walk top to bottom so sources are read before overwritten
        for (int y = firstRow; y < lastRow; ++y) {
            std::memmove(row(y + dy) + src.x, row(y) + src.x, bytes);
        }
    } else {
        for (int y = lastRow - 1; y >= firstRow; --y) {
            std::memmove(row(y + dy) + src.x, row(y) + src.x, bytes);
        }
    }
}

void GridSurface::invertRect(const PixelRect& rect) {
    PixelRect r = clip(rect);
    if (r.empty()) return;

    for (int y = r.y; y < r.y + r.height; ++y) {
        uint32_t* line = row(y) + r.x;
        for (int x = 0; x < r.width; ++x) {
            line[x] ^= 0x00FFFFFFu;
        }
    }
}

void GridSurface::blendCoverage(int x, int y, const uint8_t* mask, int maskWidth,
                                int maskHeight, int maskPitch, Color color) {
    if (!mask) return;
    PixelRect r = clip({x, y, maskWidth, maskHeight});
    if (r.empty()) return;

    for (int py = r.y; py < r.y + r.height; ++py) {
        const uint8_t* src = mask + static_cast<ptrdiff_t>(py - y) * maskPitch + (r.x - x);
        uint32_t* dst = row(py) + r.x;
        for (int px = 0; px < r.width; ++px) {
            if (src[px]) dst[px] = blendPixel(dst[px], color, src[px]);
        }
    }
}

void GridSurface::blit(const GridSurface& src, int x, int y) {
    PixelRect r = clip({x, y, src.width(), src.height()});
    if (r.empty()) return;

    size_t bytes = static_cast<size_t>(r.width) * sizeof(uint32_t);
    for (int py = r.y; py < r.y + r.height; ++py) {
        std::memcpy(row(py) + r.x, src.row(py - y) + (r.x - x), bytes);
    }
}

Result<void> GridSurface::writePpm(const std::string& path) const {
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return Err<void>("GridSurface: cannot open " + path);
    }

    out << "P6\n" << _size.width << " " << _size.height << "\n255\n";
    std::vector<char> line(static_cast<size_t>(_size.width) * 3);
    for (int y = 0; y < _size.height; ++y) {
        const uint32_t* src = row(y);
        for (int x = 0; x < _size.width; ++x) {
            Color c(src[x]);
            line[x * 3 + 0] = static_cast<char>(c.r());
            line[x * 3 + 1] = static_cast<char>(c.g());
            line[x * 3 + 2] = static_cast<char>(c.b());
        }
        out.write(line.data(), static_cast<std::streamsize>(line.size()));
    }

    if (!out) {
        return Err<void>("GridSurface: write failed for " + path);
    }
    return Ok();
}

} // namespace celldraw
