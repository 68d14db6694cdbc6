#include "Initializer.hpp"
#include <cmath>
#include <sstream>

namespace {
    const double TWO_PI = 2.0 * std::acos(-1.0);
}

using namespace std;

//------------------------------------------------------------------------------
// initRandomBodies:
// Position: (random() - 0.5) scaled componentwise by (width, height).
// Mass:     uniform in (massMin, massMax).
// Velocity: fromPolar(uniform(speedMin, speedMax) * speedScale, uniform(0, 2pi)).
// The caller is expected to have clamped width/height to a positive extent.
InitResult Initializer::initRandomBodies(const SimulationConfig& cfg,
                                         double width,
                                         double height,
                                         mt19937& rng)
{
    uniform_real_distribution<double> massDist(nextafter(cfg.massMin, cfg.massMax), cfg.massMax);
    uniform_real_distribution<double> speedDist(cfg.speedMin, cfg.speedMax);
    uniform_real_distribution<double> angleDist(0.0, TWO_PI);

    const Vector2 extent(width, height);
    const Vector2 half(0.5, 0.5);

    vector<Body> bodies;
    bodies.reserve(static_cast<size_t>(cfg.bodyCount));

    for (int i = 0; i < cfg.bodyCount; ++i) {
        Vector2 position = scale(Vector2::random(rng) - half, extent);
        double mass = massDist(rng);
        double speed = speedDist(rng) * cfg.speedScale;
        Vector2 velocity = Vector2::fromPolar(speed, angleDist(rng));

        bodies.emplace_back(position, velocity, mass, cfg.trailCapacity);
    }

    ostringstream metaStream;
    metaStream << "# Initializer: Random bodies\n"
               << "# bodies: " << cfg.bodyCount << "\n"
               << "# viewport: " << width << " x " << height << "\n"
               << "# mass range: [" << cfg.massMin << ", " << cfg.massMax << ")\n"
               << "# speed range: [" << cfg.speedMin * cfg.speedScale << ", "
               << cfg.speedMax * cfg.speedScale << ")\n";

    return { bodies, metaStream.str() };
}
