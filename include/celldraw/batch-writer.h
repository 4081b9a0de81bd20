#pragma once

#include <celldraw/draw-command.h>

#include <cstdint>
#include <string_view>
#include <vector>

namespace celldraw {

// DrawBatchWriter - producer side of the batch format, record by record.
// Colors are written as their packed value; the reader decides whether the
// alpha byte is significant.
class DrawBatchWriter {
public:
    DrawBatchWriter& clearAll();
    DrawBatchWriter& clearBlock(Color color, int32_t row1, int32_t col1,
                                int32_t row2, int32_t col2);
    DrawBatchWriter& deleteLines(Color color, int32_t row, int32_t count,
                                 int32_t bottom, int32_t left, int32_t right);
    DrawBatchWriter& insertLines(Color color, int32_t row, int32_t count,
                                 int32_t bottom, int32_t left, int32_t right);
    DrawBatchWriter& drawString(Color bg, Color fg, Color sp, int32_t row, int32_t col,
                                int32_t cells, int32_t flags, std::string_view utf8);
    DrawBatchWriter& drawCursor(Color color, int32_t row, int32_t col,
                                CursorShape shape, int32_t percent);
    DrawBatchWriter& setCursorPos(int32_t row, int32_t col);
    DrawBatchWriter& drawInvertedRect(int32_t row, int32_t col, int32_t nrows,
                                      int32_t ncols);

    // Raw 32-bit value, e.g. a tag this writer does not know about
    DrawBatchWriter& raw(uint32_t value);

    DrawBatchWriter& write(const DrawCommand& command);

    const std::vector<uint8_t>& bytes() const { return _bytes; }
    std::vector<uint8_t> take() { return std::move(_bytes); }
    size_t size() const { return _bytes.size(); }
    void clear() { _bytes.clear(); }

private:
    template<typename T>
    void put(T value);
    void putTag(DrawType type) { put(static_cast<int32_t>(type)); }

    std::vector<uint8_t> _bytes;
};

} // namespace celldraw
