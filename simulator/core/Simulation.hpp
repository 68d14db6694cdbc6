#pragma once

#include "Body.hpp"
#include "BoundingBox.hpp"
#include "SimulationConfig.hpp"
#include "Vector2.hpp"
#include <functional>
#include <random>
#include <string>
#include <vector>

struct Camera {
    Vector2 position;
    double zoom;
};

struct Bounds {
    double width;
    double height;
};

enum class RunEndReason {
    DIVERGED,
    USER_RESET
};

struct RunEndedEvent {
    double durationSeconds;
    RunEndReason reason;
};

// Owns the bodies and the tracking camera of one simulated system.
// A run lasts from one initialize() to the next; every run end is reported
// through the run-ended callback before the new bodies are created.
class Simulation
{
public:
    using Clock = std::function<double()>;                        // seconds, monotonic
    using RunEndedCallback = std::function<void(const RunEndedEvent&)>;

    // Defaults to std::chrono::steady_clock when no clock is given.
    Simulation(const SimulationConfig& cfg, double width, double height, Clock clock = Clock());

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    // Replaces every body and resets the camera and the run clock.
    void initialize();

    // One frame: forces, advance, divergence check, camera.
    // Returns true when the step ended the run and reinitialized.
    bool step();

    // User-requested reset; reports the current run whether or not it diverged.
    void reset();

    void resize(double width, double height);

    // Replaces the body set wholesale; size must match cfg.bodyCount.
    void loadBodies(std::vector<Body> bodies);

    void setRunEndedCallback(RunEndedCallback cb) { m_onRunEnded = std::move(cb); }

    const std::vector<Body>& bodies() const { return m_bodies; }
    const Camera& camera() const { return m_camera; }
    const Bounds& bounds() const { return m_bounds; }
    const SimulationConfig& config() const { return m_config; }
    const std::string& metadata() const { return m_metadata; }

    double now() const { return m_clock(); }
    double runStartTime() const { return m_runStart; }
    double runElapsedSeconds() const;
    double divergenceLimit() const;

    // False when no body is alive.
    bool liveBoundingBox(BoundingBox& out) const;

private:
    void endRun(RunEndReason reason);
    void updateCamera(const BoundingBox& box);
    static double clampExtent(double v);

    SimulationConfig m_config;
    Bounds m_bounds;
    Clock m_clock;
    RunEndedCallback m_onRunEnded;
    std::mt19937 m_rng;

    std::vector<Body> m_bodies;
    Camera m_camera;
    double m_runStart;
    std::string m_metadata;
};
