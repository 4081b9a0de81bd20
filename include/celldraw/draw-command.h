#pragma once

#include <celldraw/color.h>

#include <cstdint>
#include <string>
#include <variant>

namespace celldraw {

//=============================================================================
// Draw batch wire format
//
// A batch is a flat sequence of records with no framing: a 32-bit tag
// followed by the tag's fixed fields, all native-endian and unpadded. The
// field order below is the contract with the producer.
//=============================================================================

enum class DrawType : int32_t {
    ClearAll = 1,
    ClearBlock = 2,
    DeleteLines = 3,
    DrawString = 4,
    InsertLines = 5,
    DrawCursor = 6,
    SetCursorPos = 7,
    DrawInvertedRect = 8,
};

const char* drawTypeName(DrawType type);

// DrawString flags
constexpr int32_t DRAW_TRANSP = 0x01;   // leave the background untouched
constexpr int32_t DRAW_BOLD = 0x02;
constexpr int32_t DRAW_UNDERL = 0x04;
constexpr int32_t DRAW_UNDERC = 0x08;   // undercurl, painted in the special color
constexpr int32_t DRAW_ITALIC = 0x10;
constexpr int32_t DRAW_CURSOR = 0x20;
constexpr int32_t DRAW_WIDE = 0x40;     // each glyph spans two cells

enum class CursorShape : int32_t {
    Block = 0,
    Horizontal = 1,
    Vertical = 2,
    Hollow = 3,
    VerticalRight = 4,
};

//-----------------------------------------------------------------------------
// Decoded records
//-----------------------------------------------------------------------------

struct ClearAllCmd {};

struct ClearBlockCmd {
    Color color;
    int32_t row1, col1, row2, col2;
};

struct DeleteLinesCmd {
    Color color;
    int32_t row, count, bottom, left, right;
};

struct InsertLinesCmd {
    Color color;
    int32_t row, count, bottom, left, right;
};

struct DrawStringCmd {
    Color bg, fg, sp;
    int32_t row, col, cells, flags;
    std::string text;   // UTF-8, exactly `len` bytes from the wire
};

struct DrawCursorCmd {
    Color color;
    int32_t row, col;
    CursorShape shape;
    int32_t percent;
};

struct SetCursorPosCmd {
    int32_t row, col;
};

struct DrawInvertedRectCmd {
    int32_t row, col, nrows, ncols;
    int32_t reserved;
};

using DrawCommand = std::variant<ClearAllCmd,
                                 ClearBlockCmd,
                                 DeleteLinesCmd,
                                 InsertLinesCmd,
                                 DrawStringCmd,
                                 DrawCursorCmd,
                                 SetCursorPosCmd,
                                 DrawInvertedRectCmd>;

} // namespace celldraw
