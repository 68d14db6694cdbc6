#pragma once

// Define how the driver presents the simulation
enum class OutputMode {
    HEADLESS,         // Fixed number of steps, no window, statistics printed at the end
    VISUALIZATION     // Real-time visualization with OpenGL
};
