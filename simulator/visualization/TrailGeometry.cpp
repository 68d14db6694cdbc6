#include "TrailGeometry.h"

int appendTrailVertices(const Body& body, const Color& color, std::vector<float>& out)
{
    const auto& trail = body.trail();
    if (trail.empty()) return 0;

    const int count = static_cast<int>(trail.size()) + 1;
    out.reserve(out.size() + static_cast<size_t>(count) * kTrailFloatsPerVertex);

    auto push = [&](const Vector2& p, float alpha) {
        out.push_back(static_cast<float>(p.x));
        out.push_back(static_cast<float>(p.y));
        out.push_back(color.r);
        out.push_back(color.g);
        out.push_back(color.b);
        out.push_back(color.a * alpha);
    };

    push(body.position(), 1.0f);
    for (size_t i = 0; i < trail.size(); ++i) {
        float alpha = 1.0f - static_cast<float>(i + 1) / static_cast<float>(count);
        push(trail[i], alpha);
    }
    return count;
}
