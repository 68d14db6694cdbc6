#include "OutputUtils.hpp"
#include "Simulation.hpp"
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <iomanip>
#include <stdexcept>

void appendRunLog(const std::string &filename, int runIndex, const RunEndedEvent &event)
{
    bool exists = std::ifstream(filename).good();

    std::ofstream csvFile(filename, std::ios::app);
    if (!csvFile) {
        throw std::runtime_error("Could not open run log " + filename + " for writing");
    }

    if (!exists) {
        csvFile << "run,duration_seconds,reason\n";
    }

    csvFile << runIndex << ","
            << std::fixed << std::setprecision(3) << event.durationSeconds << ","
            << (event.reason == RunEndReason::DIVERGED ? "diverged" : "reset") << "\n";
}

std::string formatDuration(double seconds)
{
    if (!(seconds > 0.0)) seconds = 0.0;

    long tenths = static_cast<long>(std::floor(seconds * 10.0));
    long minutes = tenths / 600;
    long secs = (tenths / 10) % 60;
    long frac = tenths % 10;

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%02ld:%02ld.%ld", minutes, secs, frac);
    return buf;
}

void printProgressBar(int currentStep, int totalSteps)
{
    double progress = (totalSteps == 0) ? 0.0 : static_cast<double>(currentStep) / totalSteps;
    int barWidth = 50;
    int pos = static_cast<int>(barWidth * progress);
    std::cout << "\r[";
    for (int j = 0; j < barWidth; ++j) {
        if (j < pos) std::cout << "=";
        else if (j == pos) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << int(progress * 100.0) << " %";
    std::cout.flush();
}
