#include "RunStatistics.hpp"
#include <algorithm>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

RunStatistics::RunStatistics()
    : m_totalRuns(0),
      m_longestRunSeconds(0.0),
      m_currentRunStart(0.0)
{
}

void RunStatistics::recordRunEnded(const RunEndedEvent& event)
{
    ++m_totalRuns;
    m_longestRunSeconds = std::max(m_longestRunSeconds, event.durationSeconds);
}

bool RunStatistics::load(const std::string& path)
{
    m_totalRuns = 0;
    m_longestRunSeconds = 0.0;

    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    try {
        json j;
        in >> j;
        m_totalRuns = j.at("totalRuns").get<int>();
        m_longestRunSeconds = j.at("longestRunSeconds").get<double>();
    }
    catch (const json::exception& ex) {
        std::cerr << "Ignoring corrupt statistics file " << path << ": " << ex.what() << "\n";
        m_totalRuns = 0;
        m_longestRunSeconds = 0.0;
        return false;
    }

    if (m_totalRuns < 0 || m_longestRunSeconds < 0.0) {
        std::cerr << "Ignoring statistics file " << path << " with negative counters\n";
        m_totalRuns = 0;
        m_longestRunSeconds = 0.0;
        return false;
    }
    return true;
}

void RunStatistics::save(const std::string& path) const
{
    json j;
    j["totalRuns"] = m_totalRuns;
    j["longestRunSeconds"] = m_longestRunSeconds;

    std::ofstream out(path);
    if (!out) {
        throw std::runtime_error("Could not open statistics file " + path + " for writing");
    }
    out << j.dump(2) << "\n";
}
