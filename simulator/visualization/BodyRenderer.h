#pragma once

#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <vector>
#include "Color.hpp"
#include "Simulation.hpp"
#include "ShaderManager.h"
#include "CameraController.h"

// Draws one frame of a Simulation: faded trails first, then each body as a
// glowing point sprite with a solid core. Colours come in with every frame.
class BodyRenderer {
public:
    BodyRenderer();
    ~BodyRenderer();

    bool init(int framebufferWidth, int framebufferHeight);
    void cleanup();

    void render(const Simulation& simulation, const std::vector<Color>& palette);

    void setViewport(int width, int height);

    // Camera delegate methods
    void handleMouseScroll(double yoffset) { m_camera.handleScroll(yoffset); }
    void resetView() { m_camera.resetView(); }

    void toggleTrails() { m_showTrails = !m_showTrails; }

private:
    void renderTrails(const Simulation& simulation, const std::vector<Color>& palette);
    void renderBodies(const Simulation& simulation, const std::vector<Color>& palette);

    // OpenGL resources
    GLuint m_bodyVAO;
    GLuint m_bodyVBO;
    GLuint m_trailVAO;
    GLuint m_trailVBO;

    // Component managers
    ShaderManager m_shaderManager;
    CameraController m_camera;

    // Rendering parameters
    float m_glowScale;
    bool m_showTrails;

    // Reused per frame
    std::vector<float> m_bodyData;
    std::vector<float> m_trailData;
    std::vector<int> m_trailFirst;
    std::vector<int> m_trailCount;
};
