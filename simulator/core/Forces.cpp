#include "Forces.hpp"
#include <algorithm>
#include <cmath>

double pairwiseForceMagnitude(double massA, double massB, double dist, const SimulationConfig& cfg)
{
    double d = std::max(dist, cfg.minDistance);
    double raw = cfg.gravitationalConstant * massA * massB / (d * d);
    return std::min(raw, cfg.forceCap) * cfg.forceDamping;
}

Vector2 pairwiseForce(const Body& a, const Body& b, const SimulationConfig& cfg)
{
    Vector2 diff = a.position() - b.position();
    double dist = std::max(diff.magnitude(), cfg.minDistance);
    Vector2 direction = diff / dist;

    double forceMag = pairwiseForceMagnitude(a.mass(), b.mass(), dist, cfg);
    return direction * forceMag;
}

std::vector<Vector2> calculateForces(const std::vector<Body>& bodies, const SimulationConfig& cfg)
{
    std::vector<Vector2> forces(bodies.size(), Vector2::zero());

    for (size_t i = 0; i < bodies.size(); ++i) {
        if (bodies[i].isDead()) continue;
        for (size_t j = i + 1; j < bodies.size(); ++j) {
            if (bodies[j].isDead()) continue;

            Vector2 f = pairwiseForce(bodies[i], bodies[j], cfg);
            forces[i] += -f;
            forces[j] += f;
        }
    }
    return forces;
}

void applyForces(std::vector<Body>& bodies, const SimulationConfig& cfg)
{
    // All pair forces come from start-of-step positions; velocities change only afterwards
    std::vector<Vector2> forces = calculateForces(bodies, cfg);
    for (size_t i = 0; i < bodies.size(); ++i) {
        bodies[i].applyForce(forces[i]);
    }
}
