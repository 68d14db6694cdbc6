#pragma once

#include <cstddef>
#include <cstdint>

// Tunables of the three-body core. Defaults reproduce the reference look:
// weak gravity, damped and capped pair forces, and a slow tracking camera.
struct SimulationConfig {
    int bodyCount = 3;
    size_t trailCapacity = 60;           // trail samples kept per body

    double gravitationalConstant = 0.4;
    double minDistance = 10.0;           // pair distance floor (world units)
    double forceCap = 10000.0;           // applied before damping
    double forceDamping = 0.25;

    double divergenceMultiplier = 1.6;   // limit = min(width, height) * multiplier
    double cameraEase = 0.995;           // per-step smoothing factor, tuned for stepRate
    double initialZoom = 0.875;

    double massMin = 20.0;
    double massMax = 60.0;
    double speedMin = 0.1;               // initial speed = uniform(speedMin, speedMax) * speedScale
    double speedMax = 1.1;
    double speedScale = 0.25;

    uint32_t seed = 0;                   // 0 = seed from std::random_device

    double stepRate = 60.0;              // fixed steps per second driven by the loop
    int maxStepsPerFrame = 4;

    // Throws std::runtime_error describing the first bad field.
    void validate() const;

    // Smallest viewport dimension accepted; zero-sized viewports would force a reset every step.
    static constexpr double kMinViewportExtent = 1.0;
};
