#include <isobox/color.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_map>

namespace isobox {
namespace color {

static const std::unordered_map<std::string, uint32_t>& presets() {
    static const std::unordered_map<std::string, uint32_t> table = {
        {"transparent", TRANSPARENT},
        {"black", BLACK},
        {"white", WHITE},
        {"gray", GRAY},
        {"grey", GRAY},
        {"darkgray", DARK_GRAY},
        {"lightgray", LIGHT_GRAY},
        {"red", RED},
        {"green", GREEN},
        {"blue", BLUE},
    };
    return table;
}

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Result<uint32_t> parse(const std::string& str) {
    if (str.empty()) return Err<uint32_t>("empty color");

    if (str[0] != '#') {
        std::string name = str;
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        auto it = presets().find(name);
        if (it == presets().end()) {
            return Err<uint32_t>("unknown color name: " + str);
        }
        return Ok(it->second);
    }

    std::string hex = str.substr(1);
    if (hex.size() == 3) hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
    if (hex.size() == 6) hex += "FF";
    if (hex.size() != 8) return Err<uint32_t>("bad color length: " + str);

    uint8_t bytes[4];
    for (size_t i = 0; i < 4; ++i) {
        int hi = hexDigit(hex[i * 2]);
        int lo = hexDigit(hex[i * 2 + 1]);
        if (hi < 0 || lo < 0) return Err<uint32_t>("bad hex digit in color: " + str);
        bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Ok(pack(bytes[0], bytes[1], bytes[2], bytes[3]));
}

std::string toHex(uint32_t c) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", red(c), green(c), blue(c));
    return buf;
}

} // namespace color
} // namespace isobox
