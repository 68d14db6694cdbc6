#include "ConfigParser.hpp"
#include "Driver.hpp"
#include "OutputUtils.hpp"
#include "VisualizationUtils.h"
#include <algorithm>
#include <iostream>
#include <string>
#include <chrono>

namespace {

void printUsage(const char* argv0)
{
    std::cout << "Usage: " << argv0 << " [--config <path>] [--headless [steps]]\n";
}

// Runs without a window. The run clock counts simulated seconds at the fixed
// step rate so durations match what the interactive mode would report.
void runHeadless(const Config& cfg)
{
    long stepCount = 0;
    const double stepRate = cfg.simulation.stepRate;
    Driver driver(cfg.simulation, cfg.windowWidth, cfg.windowHeight,
                  StatisticsSink{cfg.statsFile, cfg.runLogFile},
                  [&stepCount, stepRate]() { return stepCount / stepRate; });

    std::cout << driver.simulation().metadata();

    const long total = cfg.headlessSteps;
    const long progressEvery = std::max(1L, total / 100);
    for (long i = 0; i < total; ++i) {
        ++stepCount;
        driver.stepOnce();
        if (i % progressEvery == 0) {
            printProgressBar(static_cast<int>(i * 100 / std::max(1L, total)), 100);
        }
    }
    printProgressBar(100, 100);
    std::cout << "\n";

    const RunStatistics& stats = driver.statistics();
    std::cout << "Total runs: " << stats.totalRuns() << "\n";
    std::cout << "Longest run: " << formatDuration(stats.longestRunSeconds()) << "\n";
    std::cout << "Current run: " << formatDuration(driver.currentRunSeconds()) << "\n";
}

int runInteractive(Config& cfg)
{
    if (!VisualizationUtils::initVisualization(cfg.windowWidth, cfg.windowHeight, cfg.windowTitle.c_str())) {
        std::cerr << "Error: could not initialize visualization\n";
        return 1;
    }

    {
        Driver driver(cfg.simulation, VisualizationUtils::windowWidth, VisualizationUtils::windowHeight,
                      StatisticsSink{cfg.statsFile, cfg.runLogFile});
        VisualizationUtils::runVisualization(driver, cfg.palette, cfg.windowTitle);
    }

    VisualizationUtils::cleanupVisualization();
    return 0;
}

}

int main(int argc, char* argv[])
{
    std::string configPath = "config.json";
    bool forceHeadless = false;
    long headlessSteps = -1;

    try
    {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                configPath = argv[++i];
            } else if (arg == "--headless") {
                forceHeadless = true;
                if (i + 1 < argc && argv[i + 1][0] != '-') {
                    headlessSteps = std::stol(argv[++i]);
                }
            } else if (arg == "--help" || arg == "-h") {
                printUsage(argv[0]);
                return 0;
            } else {
                std::cerr << "Error: unknown argument " << arg << "\n";
                printUsage(argv[0]);
                return 1;
            }
        }

        // Load configuration from JSON file
        Config cfg = parseConfig(configPath);
        if (forceHeadless) {
            cfg.outputMode = OutputMode::HEADLESS;
        }
        if (headlessSteps >= 0) {
            cfg.headlessSteps = headlessSteps;
        }

        const SimulationConfig& sim = cfg.simulation;
        std::cout << "Output mode: " << outputModeName(cfg.outputMode) << "\n";
        std::cout << "Bodies: " << sim.bodyCount << ", G = " << sim.gravitationalConstant
                  << ", step rate: " << sim.stepRate << " Hz\n";
        std::cout << "Viewport: " << cfg.windowWidth << " x " << cfg.windowHeight << "\n";

        auto start = std::chrono::high_resolution_clock::now();

        int status = 0;
        switch (cfg.outputMode) {
            case OutputMode::HEADLESS:
                runHeadless(cfg);
                break;
            case OutputMode::VISUALIZATION:
                status = runInteractive(cfg);
                break;
        }

        auto end = std::chrono::high_resolution_clock::now();
        std::chrono::duration<double> elapsed = end - start;
        std::cout << "Session time: " << elapsed.count() << " seconds" << std::endl;

        return status;
    }
    catch(const std::exception &ex)
    {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
