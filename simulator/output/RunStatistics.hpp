#pragma once

#include "Simulation.hpp"
#include <string>

// Cross-run counters fed by run-ended events. Persisted as a small JSON document
// so the totals survive restarts.
class RunStatistics
{
public:
    RunStatistics();

    void recordRunEnded(const RunEndedEvent& event);
    void markRunStarted(double now) { m_currentRunStart = now; }

    int totalRuns() const { return m_totalRuns; }
    double longestRunSeconds() const { return m_longestRunSeconds; }
    double currentRunStart() const { return m_currentRunStart; }
    double currentRunElapsed(double now) const { return now - m_currentRunStart; }

    // Missing file -> fresh counters, returns false. Unreadable or corrupt
    // content is reported on stderr and also yields fresh counters.
    bool load(const std::string& path);

    // Throws std::runtime_error if the file cannot be written.
    void save(const std::string& path) const;

private:
    int m_totalRuns;
    double m_longestRunSeconds;
    double m_currentRunStart;
};
