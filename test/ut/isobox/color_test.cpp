//=============================================================================
// Color Unit Tests
//=============================================================================

#include <boost/ut.hpp>

#include <isobox/color.h>

#include <string>

using namespace boost::ut;
using namespace isobox;

suite color_tests = [] {

    "channel packing"_test = [] {
        constexpr uint32_t c = color::pack(0x12, 0x34, 0x56, 0x78);
        static_assert(c == 0x78563412u);
        expect(color::red(c) == 0x12);
        expect(color::green(c) == 0x34);
        expect(color::blue(c) == 0x56);
        expect(color::alpha(c) == 0x78);
        expect(color::pack(1, 2, 3) >> 24 == 0xFFu);
    };

    "hex forms"_test = [] {
        auto six = color::parse("#ff8000");
        expect(fatal(six.has_value()));
        expect(*six == color::pack(0xFF, 0x80, 0x00));

        auto three = color::parse("#F80");
        expect(fatal(three.has_value()));
        expect(*three == color::pack(0xFF, 0x88, 0x00));

        auto eight = color::parse("#00000080");
        expect(fatal(eight.has_value()));
        expect(color::alpha(*eight) == 0x80);
    };

    "preset names"_test = [] {
        expect(*color::parse("gray") == color::GRAY);
        expect(*color::parse("Grey") == color::GRAY);
        expect(*color::parse("BLACK") == color::BLACK);
        expect(*color::parse("transparent") == color::TRANSPARENT);
    };

    "malformed colors fail"_test = [] {
        expect(!color::parse("").has_value());
        expect(!color::parse("mauve-ish").has_value());
        expect(!color::parse("#12345").has_value());
        expect(!color::parse("#gg0000").has_value());
        expect(error_msg(color::parse("#zzz")).find("hex") != std::string::npos);
    };

    "toHex drops alpha"_test = [] {
        expect(color::toHex(color::GRAY) == "#888888");
        expect(color::toHex(color::pack(0x0a, 0xb0, 0xff, 0x10)) == "#0ab0ff");
        expect(color::toHex(*color::parse("#abc")) == "#aabbcc");
    };
};
