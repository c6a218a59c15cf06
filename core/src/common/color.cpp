#include "shotmontage/color.h"
#include "shotmontage/error.h"

#include <cstdio>

namespace ShotMontage {

namespace {

static int HexDigit(char c) {
    if (c >= '0' && c <= '9') { return c - '0'; }
    if (c >= 'a' && c <= 'f') { return c - 'a' + 10; }
    if (c >= 'A' && c <= 'F') { return c - 'A' + 10; }
    return -1;
}

} // namespace

Color Color::FromHex(const std::string& hex) {
    std::string s = hex;
    if (!s.empty() && s.front() == '#') { s.erase(0, 1); }
    if (s.size() == 3) { s = {s[0], s[0], s[1], s[1], s[2], s[2]}; }
    if (s.size() != 6) { throw InputError("Invalid colour: " + hex); }

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        const int hi = HexDigit(s[static_cast<size_t>(2 * i)]);
        const int lo = HexDigit(s[static_cast<size_t>(2 * i + 1)]);
        if (hi < 0 || lo < 0) { throw InputError("Invalid colour: " + hex); }
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return Color{channels[0], channels[1], channels[2]};
}

std::string Color::ToHex() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return std::string(buf);
}

} // namespace ShotMontage
