#include <celldraw/batch-decoder.h>

#include <cstring>
#include <string>

namespace celldraw {

const char* drawTypeName(DrawType type) {
    switch (type) {
        case DrawType::ClearAll: return "ClearAll";
        case DrawType::ClearBlock: return "ClearBlock";
        case DrawType::DeleteLines: return "DeleteLines";
        case DrawType::DrawString: return "DrawString";
        case DrawType::InsertLines: return "InsertLines";
        case DrawType::DrawCursor: return "DrawCursor";
        case DrawType::SetCursorPos: return "SetCursorPos";
        case DrawType::DrawInvertedRect: return "DrawInvertedRect";
    }
    return "Unknown";
}

template<typename T>
bool BatchDecoder::read(T& out) {
    if (_size - _offset < sizeof(T)) return false;
    // Records are unaligned; memcpy keeps the native-endian load well defined
    std::memcpy(&out, _data + _offset, sizeof(T));
    _offset += sizeof(T);
    return true;
}

bool BatchDecoder::readColor(Color& out, bool withAlpha) {
    uint32_t packed = 0;
    if (!read(packed)) return false;
    out = withAlpha ? Color::fromArgb(packed) : Color::fromRgb(packed);
    return true;
}

Result<DrawCommand> BatchDecoder::fail(std::string message) {
    _failed = true;
    _error = Error(std::move(message));
    return std::unexpected(_error);
}

Result<DrawCommand> BatchDecoder::next() {
    if (_failed) {
        return std::unexpected(_error);
    }
    if (atEnd()) {
        return fail("BatchDecoder: read past end of batch");
    }

    size_t recordStart = _offset;
    int32_t tag = 0;
    if (!read(tag)) {
        return fail("BatchDecoder: truncated tag at offset " + std::to_string(recordStart));
    }

    auto truncated = [&](DrawType type) {
        return fail(std::string("BatchDecoder: truncated ") + drawTypeName(type) +
                    " record at offset " + std::to_string(recordStart));
    };

    switch (static_cast<DrawType>(tag)) {
        case DrawType::ClearAll:
            return DrawCommand{ClearAllCmd{}};

        case DrawType::ClearBlock: {
            ClearBlockCmd cmd{};
            if (!readColor(cmd.color, true) || !read(cmd.row1) || !read(cmd.col1) ||
                !read(cmd.row2) || !read(cmd.col2)) {
                return truncated(DrawType::ClearBlock);
            }
            return DrawCommand{cmd};
        }

        case DrawType::DeleteLines: {
            DeleteLinesCmd cmd{};
            if (!readColor(cmd.color, true) || !read(cmd.row) || !read(cmd.count) ||
                !read(cmd.bottom) || !read(cmd.left) || !read(cmd.right)) {
                return truncated(DrawType::DeleteLines);
            }
            return DrawCommand{cmd};
        }

        case DrawType::InsertLines: {
            InsertLinesCmd cmd{};
            if (!readColor(cmd.color, true) || !read(cmd.row) || !read(cmd.count) ||
                !read(cmd.bottom) || !read(cmd.left) || !read(cmd.right)) {
                return truncated(DrawType::InsertLines);
            }
            return DrawCommand{cmd};
        }

        case DrawType::DrawString: {
            DrawStringCmd cmd{};
            int32_t len = 0;
            if (!readColor(cmd.bg, true) || !readColor(cmd.fg, false) ||
                !readColor(cmd.sp, false) || !read(cmd.row) || !read(cmd.col) ||
                !read(cmd.cells) || !read(cmd.flags) || !read(len)) {
                return truncated(DrawType::DrawString);
            }
            if (len < 0 || static_cast<size_t>(len) > _size - _offset) {
                return truncated(DrawType::DrawString);
            }
            cmd.text.assign(reinterpret_cast<const char*>(_data + _offset),
                            static_cast<size_t>(len));
            _offset += static_cast<size_t>(len);
            return DrawCommand{std::move(cmd)};
        }

        case DrawType::DrawCursor: {
            DrawCursorCmd cmd{};
            int32_t shape = 0;
            if (!readColor(cmd.color, false) || !read(cmd.row) || !read(cmd.col) ||
                !read(shape) || !read(cmd.percent)) {
                return truncated(DrawType::DrawCursor);
            }
            cmd.shape = static_cast<CursorShape>(shape);
            return DrawCommand{cmd};
        }

        case DrawType::SetCursorPos: {
            SetCursorPosCmd cmd{};
            if (!read(cmd.row) || !read(cmd.col)) {
                return truncated(DrawType::SetCursorPos);
            }
            return DrawCommand{cmd};
        }

        case DrawType::DrawInvertedRect: {
            DrawInvertedRectCmd cmd{};
            if (!read(cmd.row) || !read(cmd.col) || !read(cmd.nrows) ||
                !read(cmd.ncols) || !read(cmd.reserved)) {
                return truncated(DrawType::DrawInvertedRect);
            }
            return DrawCommand{cmd};
        }
    }

    _unknownTag = tag;
    return fail("BatchDecoder: unknown draw type (type=" + std::to_string(tag) +
                ") at offset " + std::to_string(recordStart));
}

} // namespace celldraw
