#include <celldraw/batch-writer.h>

#include <cstring>
#include <type_traits>

namespace celldraw {

template<typename T>
void DrawBatchWriter::put(T value) {
    size_t at = _bytes.size();
    _bytes.resize(at + sizeof(T));
    std::memcpy(_bytes.data() + at, &value, sizeof(T));
}

DrawBatchWriter& DrawBatchWriter::clearAll() {
    putTag(DrawType::ClearAll);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::clearBlock(Color color, int32_t row1, int32_t col1,
                                             int32_t row2, int32_t col2) {
    putTag(DrawType::ClearBlock);
    put(color.argb);
    put(row1);
    put(col1);
    put(row2);
    put(col2);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::deleteLines(Color color, int32_t row, int32_t count,
                                              int32_t bottom, int32_t left, int32_t right) {
    putTag(DrawType::DeleteLines);
    put(color.argb);
    put(row);
    put(count);
    put(bottom);
    put(left);
    put(right);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::insertLines(Color color, int32_t row, int32_t count,
                                              int32_t bottom, int32_t left, int32_t right) {
    putTag(DrawType::InsertLines);
    put(color.argb);
    put(row);
    put(count);
    put(bottom);
    put(left);
    put(right);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::drawString(Color bg, Color fg, Color sp, int32_t row,
                                             int32_t col, int32_t cells, int32_t flags,
                                             std::string_view utf8) {
    putTag(DrawType::DrawString);
    put(bg.argb);
    put(fg.argb);
    put(sp.argb);
    put(row);
    put(col);
    put(cells);
    put(flags);
    put(static_cast<int32_t>(utf8.size()));
    _bytes.insert(_bytes.end(), utf8.begin(), utf8.end());
    return *this;
}

DrawBatchWriter& DrawBatchWriter::drawCursor(Color color, int32_t row, int32_t col,
                                             CursorShape shape, int32_t percent) {
    putTag(DrawType::DrawCursor);
    put(color.argb);
    put(row);
    put(col);
    put(static_cast<int32_t>(shape));
    put(percent);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::setCursorPos(int32_t row, int32_t col) {
    putTag(DrawType::SetCursorPos);
    put(row);
    put(col);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::drawInvertedRect(int32_t row, int32_t col, int32_t nrows,
                                                   int32_t ncols) {
    putTag(DrawType::DrawInvertedRect);
    put(row);
    put(col);
    put(nrows);
    put(ncols);
    put(int32_t{0});
    return *this;
}

DrawBatchWriter& DrawBatchWriter::raw(uint32_t value) {
    put(value);
    return *this;
}

DrawBatchWriter& DrawBatchWriter::write(const DrawCommand& command) {
    std::visit([this](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, ClearAllCmd>) {
            clearAll();
        } else if constexpr (std::is_same_v<T, ClearBlockCmd>) {
            clearBlock(cmd.color, cmd.row1, cmd.col1, cmd.row2, cmd.col2);
        } else if constexpr (std::is_same_v<T, DeleteLinesCmd>) {
            deleteLines(cmd.color, cmd.row, cmd.count, cmd.bottom, cmd.left, cmd.right);
        } else if constexpr (std::is_same_v<T, InsertLinesCmd>) {
            insertLines(cmd.color, cmd.row, cmd.count, cmd.bottom, cmd.left, cmd.right);
        } else if constexpr (std::is_same_v<T, DrawStringCmd>) {
            drawString(cmd.bg, cmd.fg, cmd.sp, cmd.row, cmd.col, cmd.cells, cmd.flags,
                       cmd.text);
        } else if constexpr (std::is_same_v<T, DrawCursorCmd>) {
            drawCursor(cmd.color, cmd.row, cmd.col, cmd.shape, cmd.percent);
        } else if constexpr (std::is_same_v<T, SetCursorPosCmd>) {
            setCursorPos(cmd.row, cmd.col);
        } else if constexpr (std::is_same_v<T, DrawInvertedRectCmd>) {
            putTag(DrawType::DrawInvertedRect);
            put(cmd.row);
            put(cmd.col);
            put(cmd.nrows);
            put(cmd.ncols);
            put(cmd.reserved);
        }
    }, command);
    return *this;
}

} // namespace celldraw
