#pragma once

#include <isobox/result.hpp>
#include <cstdint>
#include <string>

namespace isobox {

//=============================================================================
// Packed RGBA: (a << 24) | (b << 16) | (g << 8) | r
//=============================================================================
namespace color {

constexpr uint32_t TRANSPARENT = 0x00000000u;
constexpr uint32_t BLACK       = 0xFF000000u;
constexpr uint32_t WHITE       = 0xFFFFFFFFu;
constexpr uint32_t GRAY        = 0xFF888888u;
constexpr uint32_t DARK_GRAY   = 0xFF444444u;
constexpr uint32_t LIGHT_GRAY  = 0xFFCCCCCCu;
constexpr uint32_t RED         = 0xFF0000FFu;
constexpr uint32_t GREEN       = 0xFF00FF00u;
constexpr uint32_t BLUE        = 0xFFFF0000u;

constexpr uint32_t pack(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 0xFF) {
    return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(b) << 16) |
           (static_cast<uint32_t>(g) << 8) | static_cast<uint32_t>(r);
}

constexpr uint8_t red(uint32_t c)   { return static_cast<uint8_t>(c & 0xFF); }
constexpr uint8_t green(uint32_t c) { return static_cast<uint8_t>((c >> 8) & 0xFF); }
constexpr uint8_t blue(uint32_t c)  { return static_cast<uint8_t>((c >> 16) & 0xFF); }
constexpr uint8_t alpha(uint32_t c) { return static_cast<uint8_t>((c >> 24) & 0xFF); }

// Accepts "#RGB", "#RRGGBB", "#RRGGBBAA" and preset names ("gray", "black", ...)
Result<uint32_t> parse(const std::string& str);

// "#rrggbb" (alpha dropped)
std::string toHex(uint32_t c);

} // namespace color
} // namespace isobox
