#pragma once
#include <string>

struct RunEndedEvent;

// Append one run to a CSV log (run,duration_seconds,reason); writes the header on a new file
void appendRunLog(const std::string &filename, int runIndex, const RunEndedEvent &event);

// mm:ss.t
std::string formatDuration(double seconds);

// Progress bar display
void printProgressBar(int currentStep, int totalSteps);
