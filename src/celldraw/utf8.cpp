#include <celldraw/utf8.h>

#include <cstdint>

namespace celldraw {

namespace {

constexpr char32_t REPLACEMENT = 0xFFFD;

inline bool isContinuation(uint8_t byte) { return (byte & 0xC0) == 0x80; }

} // anonymous namespace

std::u32string utf8ToUtf32(std::string_view utf8) {
    std::u32string out;
    out.reserve(utf8.size());

    const uint8_t* ptr = reinterpret_cast<const uint8_t*>(utf8.data());
    const uint8_t* end = ptr + utf8.size();

    while (ptr < end) {
        uint8_t lead = *ptr;
        uint32_t cp = 0;
        int extra = 0;
        uint32_t minValue = 0;

        if ((lead & 0x80) == 0) {
            out.push_back(lead);
            ++ptr;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F;
            extra = 1;
            minValue = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F;
            extra = 2;
            minValue = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07;
            extra = 3;
            minValue = 0x10000;
        } else {
            out.push_back(REPLACEMENT);
            ++ptr;
            continue;
        }

        ++ptr;
        int consumed = 0;
        while (consumed < extra && ptr < end && isContinuation(*ptr)) {
            cp = (cp << 6) | (*ptr & 0x3F);
            ++ptr;
            ++consumed;
        }

        if (consumed != extra || cp < minValue || cp > 0x10FFFF ||
            (cp >= 0xD800 && cp <= 0xDFFF)) {
            out.push_back(REPLACEMENT);
        } else {
            out.push_back(static_cast<char32_t>(cp));
        }
    }

    return out;
}

} // namespace celldraw
