#pragma once
#include "Body.hpp"
#include "SimulationConfig.hpp"
#include <vector>

// Damped, capped gravitational pull between two masses at distance dist.
// dist is floored at cfg.minDistance before use.
double pairwiseForceMagnitude(double massA, double massB, double dist, const SimulationConfig& cfg);

// Force on b due to a; a receives the exact negation.
// Points from b towards a, so both bodies are pulled together.
Vector2 pairwiseForce(const Body& a, const Body& b, const SimulationConfig& cfg);

// Net force on every body from all unordered pairs of live bodies,
// evaluated at the current positions. Dead bodies get a zero entry.
std::vector<Vector2> calculateForces(const std::vector<Body>& bodies, const SimulationConfig& cfg);

// Applies calculateForces() to the velocities. No body moves here.
void applyForces(std::vector<Body>& bodies, const SimulationConfig& cfg);
