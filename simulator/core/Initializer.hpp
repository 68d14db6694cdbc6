#pragma once
#include <random>
#include <string>
#include <vector>
#include "Body.hpp"
#include "SimulationConfig.hpp"

// Structure to hold initialization result and metadata
struct InitResult {
    std::vector<Body> bodies;
    std::string metadata;
};

class Initializer {
public:
    // Scatters cfg.bodyCount bodies uniformly over a width x height viewport
    // centered at the origin, with random masses and random-direction velocities.
    static InitResult initRandomBodies(const SimulationConfig& cfg,
                                       double width,
                                       double height,
                                       std::mt19937& rng);
};
