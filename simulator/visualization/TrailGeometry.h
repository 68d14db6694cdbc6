#pragma once

#include "Body.hpp"
#include "Color.hpp"
#include <vector>

// Interleaved vertex layout shared by the trail VBO: x, y, r, g, b, a
constexpr int kTrailFloatsPerVertex = 6;

// Appends a line strip for one body: its current position first at full
// opacity, then the trail from newest to oldest fading linearly towards zero.
// Returns the number of vertices appended (0 for a body without history).
int appendTrailVertices(const Body& body, const Color& color, std::vector<float>& out);
