#include "Driver.hpp"
#include "OutputUtils.hpp"
#include <iostream>
#include <stdexcept>

Driver::Driver(const SimulationConfig& cfg, double width, double height,
               const StatisticsSink& sink, Simulation::Clock clock)
    : m_simulation(new Simulation(cfg, width, height, std::move(clock))),
      m_sink(sink),
      m_stepInterval(1.0 / cfg.stepRate),
      m_accumulator(0.0),
      m_maxStepsPerFrame(cfg.maxStepsPerFrame),
      m_paused(false)
{
    if (!m_sink.statsFile.empty() && m_stats.load(m_sink.statsFile)) {
        std::cout << "Loaded statistics: " << m_stats.totalRuns() << " runs, longest "
                  << formatDuration(m_stats.longestRunSeconds()) << "\n";
    }

    m_simulation->setRunEndedCallback([this](const RunEndedEvent& event) { onRunEnded(event); });
    syncRunStart();
}

int Driver::advance(double elapsedSeconds)
{
    if (m_paused || elapsedSeconds <= 0.0) return 0;

    m_accumulator += elapsedSeconds;

    int steps = 0;
    while (m_accumulator >= m_stepInterval && steps < m_maxStepsPerFrame) {
        if (m_simulation->step()) syncRunStart();
        m_accumulator -= m_stepInterval;
        ++steps;
    }

    // Drop time we could not catch up on instead of spiralling
    if (steps == m_maxStepsPerFrame && m_accumulator >= m_stepInterval) {
        m_accumulator = 0.0;
    }
    return steps;
}

bool Driver::stepOnce()
{
    bool reset = m_simulation->step();
    if (reset) syncRunStart();
    return reset;
}

void Driver::requestReset()
{
    m_accumulator = 0.0;
    m_simulation->reset();
    syncRunStart();
}

void Driver::onRunEnded(const RunEndedEvent& event)
{
    m_stats.recordRunEnded(event);

    std::cout << "Run " << m_stats.totalRuns() << " ended after "
              << formatDuration(event.durationSeconds) << " ("
              << (event.reason == RunEndReason::DIVERGED ? "diverged" : "reset") << ")\n";

    try {
        if (!m_sink.statsFile.empty()) {
            m_stats.save(m_sink.statsFile);
        }
        if (!m_sink.runLogFile.empty()) {
            appendRunLog(m_sink.runLogFile, m_stats.totalRuns(), event);
        }
    }
    catch (const std::runtime_error& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
    }
}
