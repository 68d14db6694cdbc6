#pragma once

#include "Vector2.hpp"
#include <vector>

// Axis-aligned extent of a set of positions. top/bottom are min/max y.
struct BoundingBox {
    double left;
    double right;
    double top;
    double bottom;
    double width;
    double height;

    Vector2 center() const { return Vector2((left + right) / 2.0, (top + bottom) / 2.0); }

    // Throws std::invalid_argument on an empty input.
    static BoundingBox compute(const std::vector<Vector2>& positions);
};
