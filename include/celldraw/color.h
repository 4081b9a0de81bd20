#pragma once

#include <cstdint>

namespace celldraw {

// Packed 0xAARRGGBB color, the pixel format of GridSurface.
struct Color {
    uint32_t argb = 0xFF000000;

    constexpr Color() = default;
    constexpr explicit Color(uint32_t packed) : argb(packed) {}

    // Wire colors with an alpha byte (clear/scroll colors, string background)
    static constexpr Color fromArgb(uint32_t packed) { return Color(packed); }

    // Wire colors without alpha (string foreground/special, cursor): opaque
    static constexpr Color fromRgb(uint32_t packed) {
        return Color(0xFF000000u | (packed & 0x00FFFFFFu));
    }

    static constexpr Color fromRgba(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
        return Color((static_cast<uint32_t>(a) << 24) |
                     (static_cast<uint32_t>(r) << 16) |
                     (static_cast<uint32_t>(g) << 8) |
                     static_cast<uint32_t>(b));
    }

    constexpr uint8_t a() const { return static_cast<uint8_t>(argb >> 24); }
    constexpr uint8_t r() const { return static_cast<uint8_t>(argb >> 16); }
    constexpr uint8_t g() const { return static_cast<uint8_t>(argb >> 8); }
    constexpr uint8_t b() const { return static_cast<uint8_t>(argb); }

    constexpr bool operator==(const Color&) const = default;
};

namespace colors {
inline constexpr Color Black = Color(0xFF000000);
inline constexpr Color White = Color(0xFFFFFFFF);
inline constexpr Color Transparent = Color(0x00000000);
} // namespace colors

} // namespace celldraw
