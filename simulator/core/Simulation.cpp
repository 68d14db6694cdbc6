#include "Simulation.hpp"
#include "Forces.hpp"
#include "Initializer.hpp"
#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>

namespace
{
    double steadySeconds()
    {
        using namespace std::chrono;
        return duration<double>(steady_clock::now().time_since_epoch()).count();
    }

    uint32_t resolveSeed(uint32_t seed)
    {
        if (seed != 0) return seed;
        std::random_device rd;
        return rd();
    }
}

Simulation::Simulation(const SimulationConfig& cfg, double width, double height, Clock clock)
    : m_config(cfg),
      m_bounds{clampExtent(width), clampExtent(height)},
      m_clock(clock ? std::move(clock) : Clock(steadySeconds)),
      m_rng(resolveSeed(cfg.seed)),
      m_camera{Vector2::zero(), cfg.initialZoom},
      m_runStart(0.0)
{
    m_config.validate();
    initialize();
}

double Simulation::clampExtent(double v)
{
    return std::max(v, SimulationConfig::kMinViewportExtent);
}

void Simulation::initialize()
{
    InitResult result = Initializer::initRandomBodies(m_config, m_bounds.width, m_bounds.height, m_rng);
    m_bodies = std::move(result.bodies);
    m_metadata = std::move(result.metadata);

    m_camera.position = Vector2::zero();
    m_camera.zoom = m_config.initialZoom;
    m_runStart = m_clock();
}

bool Simulation::step()
{
    applyForces(m_bodies, m_config);

    for (auto& body : m_bodies) {
        body.advance();
    }

    BoundingBox box;
    if (!liveBoundingBox(box)) {
        return false;
    }

    double limit = divergenceLimit();
    if (box.width > limit || box.height > limit) {
        endRun(RunEndReason::DIVERGED);
        return true;
    }

    updateCamera(box);
    return false;
}

void Simulation::reset()
{
    endRun(RunEndReason::USER_RESET);
}

void Simulation::endRun(RunEndReason reason)
{
    RunEndedEvent event{runElapsedSeconds(), reason};
    if (m_onRunEnded) {
        m_onRunEnded(event);
    }
    initialize();
}

void Simulation::updateCamera(const BoundingBox& box)
{
    const double ease = m_config.cameraEase;
    m_camera.position = m_camera.position * ease + box.center() * (1.0 - ease);
}

void Simulation::resize(double width, double height)
{
    m_bounds.width = clampExtent(width);
    m_bounds.height = clampExtent(height);
}

void Simulation::loadBodies(std::vector<Body> bodies)
{
    if (bodies.size() != static_cast<size_t>(m_config.bodyCount)) {
        throw std::invalid_argument("loadBodies expects " + std::to_string(m_config.bodyCount)
                                    + " bodies, got " + std::to_string(bodies.size()));
    }
    m_bodies = std::move(bodies);
}

double Simulation::runElapsedSeconds() const
{
    return m_clock() - m_runStart;
}

double Simulation::divergenceLimit() const
{
    return std::min(m_bounds.width, m_bounds.height) * m_config.divergenceMultiplier;
}

bool Simulation::liveBoundingBox(BoundingBox& out) const
{
    std::vector<Vector2> positions;
    positions.reserve(m_bodies.size());
    for (const auto& body : m_bodies) {
        if (!body.isDead()) positions.push_back(body.position());
    }
    if (positions.empty()) return false;

    out = BoundingBox::compute(positions);
    return true;
}
