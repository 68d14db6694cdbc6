#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "Color.hpp"
#include "SimulationConfig.hpp"
#include "OutputModes.hpp"

using json = nlohmann::json;

// Structure to hold all configuration parameters
struct Config {
    OutputMode outputMode = OutputMode::VISUALIZATION;
    long headlessSteps = 100000;

    int windowWidth = 1280;
    int windowHeight = 720;
    std::string windowTitle = "Three Body";

    SimulationConfig simulation;
    std::vector<Color> palette = defaultPalette();

    std::string statsFile = "run_stats.json";
    std::string runLogFile;           // empty: no CSV run log
};

// Builds a Config from a parsed document. Absent keys keep their defaults;
// present keys of the wrong type or with bad values throw std::runtime_error.
Config configFromJson(const json& j);

// Function to parse the JSON configuration file
Config parseConfig(const std::string& path);

OutputMode parseOutputMode(const std::string& name);
std::string outputModeName(OutputMode mode);
