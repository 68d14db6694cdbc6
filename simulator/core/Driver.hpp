#pragma once

#include "RunStatistics.hpp"
#include "Simulation.hpp"
#include "SimulationConfig.hpp"
#include <memory>
#include <string>

// Where run statistics are persisted; empty paths disable that output.
struct StatisticsSink {
    std::string statsFile;
    std::string runLogFile;
};

// Steps the simulation at a fixed rate and forwards run-ended events to the
// statistics collaborator. Owns the simulation for its whole lifetime.
class Driver
{
public:
    Driver(const SimulationConfig& cfg, double width, double height,
           const StatisticsSink& sink = StatisticsSink(),
           Simulation::Clock clock = Simulation::Clock());

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;

    // Runs every whole 1/stepRate interval contained in the accumulated time,
    // at most maxStepsPerFrame per call. Returns the number of steps taken.
    int advance(double elapsedSeconds);

    // Single step, ignoring the accumulator.
    bool stepOnce();

    // Ends the current run immediately and starts a new one.
    void requestReset();

    void togglePause() { m_paused = !m_paused; }
    bool isPaused() const { return m_paused; }

    void resize(double width, double height) { m_simulation->resize(width, height); }

    const Simulation& simulation() const { return *m_simulation; }
    Simulation& simulation() { return *m_simulation; }
    const RunStatistics& statistics() const { return m_stats; }

    double currentRunSeconds() const { return m_stats.currentRunElapsed(m_simulation->now()); }

private:
    void onRunEnded(const RunEndedEvent& event);
    void syncRunStart() { m_stats.markRunStarted(m_simulation->runStartTime()); }

    std::unique_ptr<Simulation> m_simulation;
    RunStatistics m_stats;
    StatisticsSink m_sink;
    double m_stepInterval;
    double m_accumulator;
    int m_maxStepsPerFrame;
    bool m_paused;
};
