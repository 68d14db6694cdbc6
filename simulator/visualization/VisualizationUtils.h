#pragma once

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <string>
#include <vector>
#include "BodyRenderer.h"
#include "Color.hpp"
#include "Driver.hpp"

// Window, input and frame loop for the interactive mode
namespace VisualizationUtils
{
    // Window and renderer state
    extern GLFWwindow* window;
    extern int windowWidth;
    extern int windowHeight;
    extern bool visualizationInitialized;
    extern BodyRenderer* renderer;

    // Set while runVisualization() is active so the key callback can reach them
    extern Driver* driver;
    extern std::vector<Color>* palette;

    // Initialization and cleanup
    bool initVisualization(int width, int height, const char* windowTitle = "Three Body");
    void cleanupVisualization();

    // Mouse/resize callbacks
    void scroll_callback(GLFWwindow* window, double xoffset, double yoffset);
    void framebuffer_size_callback(GLFWwindow* window, int width, int height);

    // Keyboard callback - must be set by the caller
    void setupKeyboardCallback();

    // Help display
    void printKeyboardControls();

    // Steps the driver by wall-clock time and renders until the window closes
    void runVisualization(Driver& driver, std::vector<Color>& palette, const std::string& title);

    // Replaces palette[index] with the next preset colour
    void cycleBodyColor(std::vector<Color>& palette, size_t index);

    // Window title updates
    void updateWindowTitle(const std::string& title, double runSeconds, int totalRuns,
                           double longestRunSeconds, double fps, bool paused);
}
