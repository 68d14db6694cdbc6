#include "Color.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace {
    int hexDigit(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
        return -1;
    }

    float channel(const std::string& text, size_t offset)
    {
        int hi = hexDigit(text[offset]);
        int lo = hexDigit(text[offset + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("Invalid colour string: " + text);
        }
        return static_cast<float>(hi * 16 + lo) / 255.0f;
    }

    int toByte(float v)
    {
        if (v < 0.0f) v = 0.0f;
        if (v > 1.0f) v = 1.0f;
        return static_cast<int>(std::lround(v * 255.0f));
    }
}

Color parseHexColor(const std::string& text)
{
    if ((text.size() != 7 && text.size() != 9) || text[0] != '#') {
        throw std::runtime_error("Invalid colour string: " + text + " (expected #rrggbb)");
    }

    Color c;
    c.r = channel(text, 1);
    c.g = channel(text, 3);
    c.b = channel(text, 5);
    c.a = (text.size() == 9) ? channel(text, 7) : 1.0f;
    return c;
}

std::string toHexColor(const Color& c)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", toByte(c.r), toByte(c.g), toByte(c.b));
    return buf;
}

std::vector<Color> defaultPalette()
{
    return {
        parseHexColor("#ffbf00"),
        parseHexColor("#00ffff"),
        parseHexColor("#ffffff"),
    };
}
