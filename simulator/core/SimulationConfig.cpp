#include "SimulationConfig.hpp"
#include <stdexcept>
#include <string>

namespace {
    void require(bool condition, const std::string& message) {
        if (!condition) {
            throw std::runtime_error("Invalid simulation config: " + message);
        }
    }
}

void SimulationConfig::validate() const
{
    require(bodyCount > 0, "bodyCount must be positive");
    require(trailCapacity > 0, "trailCapacity must be positive");
    require(gravitationalConstant > 0.0, "gravitationalConstant must be positive");
    require(minDistance > 0.0, "minDistance must be positive");
    require(forceCap > 0.0, "forceCap must be positive");
    require(forceDamping > 0.0, "forceDamping must be positive");
    require(divergenceMultiplier > 0.0, "divergenceMultiplier must be positive");
    require(cameraEase >= 0.0 && cameraEase <= 1.0, "cameraEase must lie in [0, 1]");
    require(initialZoom > 0.0, "initialZoom must be positive");
    require(massMin > 0.0 && massMin < massMax, "mass range must satisfy 0 < massMin < massMax");
    require(speedMin >= 0.0 && speedMin < speedMax, "speed range must satisfy 0 <= speedMin < speedMax");
    require(speedScale > 0.0, "speedScale must be positive");
    require(stepRate > 0.0, "stepRate must be positive");
    require(maxStepsPerFrame > 0, "maxStepsPerFrame must be positive");
}
