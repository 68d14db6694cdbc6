#include "ConfigParser.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace {
    // Reads j[key] into out when present; wraps type errors with the key name.
    template <typename T>
    void readOptional(const json& j, const char* key, T& out)
    {
        auto it = j.find(key);
        if (it == j.end()) return;
        try {
            out = it->get<T>();
        }
        catch (const json::exception& ex) {
            throw std::runtime_error(std::string("Bad value for config key '") + key + "': " + ex.what());
        }
    }

    // Unsigned keys go through a signed read so -1 is rejected instead of wrapping.
    template <typename T>
    void readNonNegative(const json& j, const char* key, T& out)
    {
        long long value = static_cast<long long>(out);
        readOptional(j, key, value);
        if (value < 0) {
            throw std::runtime_error(std::string("Bad value for config key '") + key + "': must not be negative");
        }
        if (static_cast<unsigned long long>(value) > std::numeric_limits<T>::max()) {
            throw std::runtime_error(std::string("Bad value for config key '") + key + "': out of range");
        }
        out = static_cast<T>(value);
    }

    void readSimulation(const json& s, SimulationConfig& sim)
    {
        readOptional(s, "bodyCount", sim.bodyCount);
        readNonNegative(s, "trailCapacity", sim.trailCapacity);
        readOptional(s, "gravitationalConstant", sim.gravitationalConstant);
        readOptional(s, "minDistance", sim.minDistance);
        readOptional(s, "forceCap", sim.forceCap);
        readOptional(s, "forceDamping", sim.forceDamping);
        readOptional(s, "divergenceMultiplier", sim.divergenceMultiplier);
        readOptional(s, "cameraEase", sim.cameraEase);
        readOptional(s, "initialZoom", sim.initialZoom);
        readOptional(s, "massMin", sim.massMin);
        readOptional(s, "massMax", sim.massMax);
        readOptional(s, "speedMin", sim.speedMin);
        readOptional(s, "speedMax", sim.speedMax);
        readOptional(s, "speedScale", sim.speedScale);
        readNonNegative(s, "seed", sim.seed);
        readOptional(s, "stepRate", sim.stepRate);
        readOptional(s, "maxStepsPerFrame", sim.maxStepsPerFrame);
    }
}

OutputMode parseOutputMode(const std::string& name)
{
    if (name == "HEADLESS") {
        return OutputMode::HEADLESS;
    } else if (name == "VISUALIZATION") {
        return OutputMode::VISUALIZATION;
    }
    throw std::runtime_error("Unknown output mode: " + name);
}

std::string outputModeName(OutputMode mode)
{
    switch (mode) {
        case OutputMode::HEADLESS:
            return "Headless";
        case OutputMode::VISUALIZATION:
            return "Real-time Visualization";
    }
    return "Unknown";
}

Config configFromJson(const json& j)
{
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }

    Config cfg;

    if (j.contains("outputMode")) {
        std::string mode;
        readOptional(j, "outputMode", mode);
        cfg.outputMode = parseOutputMode(mode);
    }
    readOptional(j, "headlessSteps", cfg.headlessSteps);

    if (j.contains("window")) {
        const json& w = j["window"];
        readOptional(w, "width", cfg.windowWidth);
        readOptional(w, "height", cfg.windowHeight);
        readOptional(w, "title", cfg.windowTitle);
    }

    if (j.contains("simulation")) {
        readSimulation(j["simulation"], cfg.simulation);
    }

    if (j.contains("palette")) {
        std::vector<std::string> colours;
        readOptional(j, "palette", colours);
        if (colours.empty()) {
            throw std::runtime_error("palette must list at least one colour");
        }
        cfg.palette.clear();
        for (const auto& c : colours) {
            cfg.palette.push_back(parseHexColor(c));
        }
    }

    if (j.contains("statistics")) {
        const json& s = j["statistics"];
        readOptional(s, "file", cfg.statsFile);
        readOptional(s, "runLog", cfg.runLogFile);
    }

    if (cfg.windowWidth <= 0 || cfg.windowHeight <= 0) {
        throw std::runtime_error("window width and height must be positive");
    }
    if (cfg.headlessSteps < 0) {
        throw std::runtime_error("headlessSteps must not be negative");
    }
    cfg.simulation.validate();

    return cfg;
}

Config parseConfig(const std::string& path)
{
    std::ifstream in(path);
    if (!in.is_open()) {
        throw std::runtime_error("Failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    }
    catch (const json::parse_error& ex) {
        throw std::runtime_error("Failed to parse config file " + path + ": " + ex.what());
    }
    return configFromJson(j);
}
