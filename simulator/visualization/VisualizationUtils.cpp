#include "VisualizationUtils.h"
#include "OutputUtils.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <cmath>
#include <algorithm>

namespace VisualizationUtils
{
    // Global state
    GLFWwindow* window = nullptr;
    int windowWidth = 1280;
    int windowHeight = 720;
    bool visualizationInitialized = false;
    BodyRenderer* renderer = nullptr;
    Driver* driver = nullptr;
    std::vector<Color>* palette = nullptr;

    namespace {
        const char* kColorPresets[] = {
            "#ffbf00", "#00ffff", "#ffffff", "#ff4f6d", "#7cff6b", "#9d7bff", "#ff8a3d"
        };
        const size_t kColorPresetCount = sizeof(kColorPresets) / sizeof(kColorPresets[0]);
    }

    void scroll_callback(GLFWwindow* window, double xoffset, double yoffset) {
        if (renderer) {
            renderer->handleMouseScroll(yoffset);
        }
    }

    void framebuffer_size_callback(GLFWwindow* window, int width, int height) {
        if (width <= 0 || height <= 0) return;  // minimised
        windowWidth = width;
        windowHeight = height;
        if (renderer) {
            renderer->setViewport(width, height);
        }
        if (driver) {
            driver->resize(width, height);
        }
    }

    bool initVisualization(int width, int height, const char* windowTitle) {
        if (visualizationInitialized) return true;

        if (!glfwInit()) {
            std::cerr << "Failed to initialize GLFW" << std::endl;
            return false;
        }

        glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
        glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
        glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
        glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
        glfwWindowHint(GLFW_DOUBLEBUFFER, GLFW_TRUE);
        glfwWindowHint(GLFW_SAMPLES, 4);

        windowWidth = width;
        windowHeight = height;
        window = glfwCreateWindow(windowWidth, windowHeight, windowTitle, NULL, NULL);
        if (!window) {
            std::cerr << "Failed to create GLFW window" << std::endl;
            glfwTerminate();
            return false;
        }

        glfwMakeContextCurrent(window);
        // Present once per display refresh
        glfwSwapInterval(1);

        glewExperimental = GL_TRUE;
        GLenum glewError = glewInit();
        if (glewError != GLEW_OK) {
            std::cerr << "GLEW initialization failed: " << glewGetErrorString(glewError) << std::endl;
            glfwDestroyWindow(window);
            window = nullptr;
            glfwTerminate();
            return false;
        }

        std::cout << "OpenGL Version: " << glGetString(GL_VERSION) << std::endl;
        std::cout << "OpenGL Renderer: " << glGetString(GL_RENDERER) << std::endl;

        // glewInit can leave a benign GL_INVALID_ENUM behind on core profiles
        while (glGetError() != GL_NO_ERROR);

        glfwSetScrollCallback(window, scroll_callback);
        glfwSetFramebufferSizeCallback(window, framebuffer_size_callback);

        glClearColor(0.0f, 0.0f, 0.0f, 1.0f);

        int fbWidth = 0, fbHeight = 0;
        glfwGetFramebufferSize(window, &fbWidth, &fbHeight);
        // Simulation bounds and projection both work in framebuffer pixels
        windowWidth = fbWidth;
        windowHeight = fbHeight;

        renderer = new BodyRenderer();
        if (!renderer->init(fbWidth, fbHeight)) {
            std::cerr << "Failed to initialize body renderer" << std::endl;
            delete renderer;
            renderer = nullptr;
            glfwDestroyWindow(window);
            window = nullptr;
            glfwTerminate();
            return false;
        }
        renderer->setViewport(fbWidth, fbHeight);

        visualizationInitialized = true;
        return true;
    }

    void cycleBodyColor(std::vector<Color>& colors, size_t index) {
        if (index >= colors.size()) return;

        std::string current = toHexColor(colors[index]);
        size_t next = 0;
        for (size_t i = 0; i < kColorPresetCount; ++i) {
            if (current == kColorPresets[i]) {
                next = (i + 1) % kColorPresetCount;
                break;
            }
        }
        colors[index] = parseHexColor(kColorPresets[next]);
    }

    void setupKeyboardCallback() {
        glfwSetKeyCallback(window, [](GLFWwindow* window, int key, int scancode, int action, int mods) {
            if (action != GLFW_PRESS) return;

            switch (key) {
                case GLFW_KEY_R:
                    // End the current run and start over
                    if (driver) {
                        driver->requestReset();
                    }
                    break;
                case GLFW_KEY_SPACE:
                    if (driver) {
                        driver->togglePause();
                    }
                    break;
                case GLFW_KEY_1:
                case GLFW_KEY_2:
                case GLFW_KEY_3:
                    if (palette) {
                        cycleBodyColor(*palette, static_cast<size_t>(key - GLFW_KEY_1));
                    }
                    break;
                case GLFW_KEY_T:
                    if (renderer) {
                        renderer->toggleTrails();
                    }
                    break;
                case GLFW_KEY_Z:
                    if (renderer) {
                        renderer->resetView();
                    }
                    break;
                case GLFW_KEY_H:
                    printKeyboardControls();
                    break;
                case GLFW_KEY_ESCAPE:
                    glfwSetWindowShouldClose(window, GLFW_TRUE);
                    break;
            }
        });
    }

    void runVisualization(Driver& activeDriver, std::vector<Color>& activePalette, const std::string& title) {
        driver = &activeDriver;
        palette = &activePalette;
        driver->resize(windowWidth, windowHeight);

        setupKeyboardCallback();
        printKeyboardControls();

        using clock = std::chrono::steady_clock;
        auto lastFrame = clock::now();
        auto lastTitle = lastFrame;
        int framesSinceTitle = 0;
        double fps = 0.0;

        while (!glfwWindowShouldClose(window)) {
            auto now = clock::now();
            double elapsed = std::chrono::duration<double>(now - lastFrame).count();
            lastFrame = now;

            driver->advance(elapsed);

            glClear(GL_COLOR_BUFFER_BIT);
            renderer->render(driver->simulation(), *palette);
            glfwSwapBuffers(window);
            glfwPollEvents();

            ++framesSinceTitle;
            double sinceTitle = std::chrono::duration<double>(now - lastTitle).count();
            if (sinceTitle >= 0.25) {
                fps = framesSinceTitle / sinceTitle;
                framesSinceTitle = 0;
                lastTitle = now;
                const RunStatistics& stats = driver->statistics();
                updateWindowTitle(title, driver->currentRunSeconds(), stats.totalRuns(),
                                  stats.longestRunSeconds(), fps, driver->isPaused());
            }
        }

        driver = nullptr;
        palette = nullptr;
    }

    void cleanupVisualization() {
        if (!visualizationInitialized) return;

        if (renderer) {
            renderer->cleanup();
            delete renderer;
            renderer = nullptr;
        }

        if (window) {
            glfwDestroyWindow(window);
            window = nullptr;
        }

        glfwTerminate();
        visualizationInitialized = false;
    }

    void printKeyboardControls() {
        std::cout << "\n╔═════════════════════════════════════════════════════╗" << std::endl;
        std::cout << "║               KEYBOARD CONTROLS                     ║" << std::endl;
        std::cout << "╠═════════════════════════════════════════════════════╣" << std::endl;
        std::cout << "║  R         - Reset the run                          ║" << std::endl;
        std::cout << "║  Space     - Pause/resume                           ║" << std::endl;
        std::cout << "║  1/2/3     - Cycle colour of body 1/2/3             ║" << std::endl;
        std::cout << "║  T         - Toggle trails                          ║" << std::endl;
        std::cout << "║  Scroll    - Zoom in/out                            ║" << std::endl;
        std::cout << "║  Z         - Reset zoom                             ║" << std::endl;
        std::cout << "║  H         - Show this help                         ║" << std::endl;
        std::cout << "║  ESC       - Exit simulation                        ║" << std::endl;
        std::cout << "╚═════════════════════════════════════════════════════╝" << std::endl;
        std::cout << std::endl;
    }

    void updateWindowTitle(const std::string& title, double runSeconds, int totalRuns,
                           double longestRunSeconds, double fps, bool paused) {
        std::string text = title + " - run " + formatDuration(runSeconds) +
                           " - runs " + std::to_string(totalRuns) +
                           " - longest " + formatDuration(longestRunSeconds) +
                           " - " + std::to_string(int(fps)) + " FPS";
        if (paused) {
            text += " [paused]";
        }
        glfwSetWindowTitle(window, text.c_str());
    }
}
