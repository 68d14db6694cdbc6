#pragma once

#include <string>
#include <vector>

// RGBA display colour, components in [0,1]
struct Color {
    float r;
    float g;
    float b;
    float a;
};

// "#rrggbb" or "#rrggbbaa". Throws std::runtime_error on anything else.
Color parseHexColor(const std::string& text);

std::string toHexColor(const Color& c);

// Amber, cyan, white
std::vector<Color> defaultPalette();
