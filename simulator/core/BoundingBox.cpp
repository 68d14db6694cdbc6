#include "BoundingBox.hpp"
#include <algorithm>
#include <stdexcept>

BoundingBox BoundingBox::compute(const std::vector<Vector2>& positions)
{
    if (positions.empty()) {
        throw std::invalid_argument("BoundingBox::compute needs at least one position");
    }

    BoundingBox box;
    box.left = box.right = positions[0].x;
    box.top = box.bottom = positions[0].y;

    for (size_t i = 1; i < positions.size(); ++i) {
        box.left = std::min(box.left, positions[i].x);
        box.right = std::max(box.right, positions[i].x);
        box.top = std::min(box.top, positions[i].y);
        box.bottom = std::max(box.bottom, positions[i].y);
    }

    box.width = box.right - box.left;
    box.height = box.bottom - box.top;
    return box;
}
