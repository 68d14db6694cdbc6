#include "BodyRenderer.h"
#include "TrailGeometry.h"
#include <iostream>

namespace {
    // x, y, radius, r, g, b, a
    constexpr int kBodyFloatsPerVertex = 7;

    const Color& paletteColor(const std::vector<Color>& palette, size_t index) {
        static const Color fallback{1.0f, 1.0f, 1.0f, 1.0f};
        if (palette.empty()) return fallback;
        return palette[index % palette.size()];
    }
}

BodyRenderer::BodyRenderer()
    : m_bodyVAO(0),
      m_bodyVBO(0),
      m_trailVAO(0),
      m_trailVBO(0),
      m_glowScale(3.0f),
      m_showTrails(true)
{
}

BodyRenderer::~BodyRenderer() {
    cleanup();
}

void BodyRenderer::cleanup() {
    if (m_bodyVBO) {
        glDeleteBuffers(1, &m_bodyVBO);
        m_bodyVBO = 0;
    }

    if (m_trailVBO) {
        glDeleteBuffers(1, &m_trailVBO);
        m_trailVBO = 0;
    }

    if (m_bodyVAO) {
        glDeleteVertexArrays(1, &m_bodyVAO);
        m_bodyVAO = 0;
    }

    if (m_trailVAO) {
        glDeleteVertexArrays(1, &m_trailVAO);
        m_trailVAO = 0;
    }
}

bool BodyRenderer::init(int framebufferWidth, int framebufferHeight) {
    // Initialize shaders
    if (!m_shaderManager.init()) {
        std::cerr << "Failed to initialize shader manager" << std::endl;
        return false;
    }

    const GLsizei bodyStride = sizeof(float) * kBodyFloatsPerVertex;
    const GLsizei trailStride = sizeof(float) * kTrailFloatsPerVertex;

    // Bodies: position + radius, colour
    glGenVertexArrays(1, &m_bodyVAO);
    glGenBuffers(1, &m_bodyVBO);
    glBindVertexArray(m_bodyVAO);
    glBindBuffer(GL_ARRAY_BUFFER, m_bodyVBO);
    glBufferData(GL_ARRAY_BUFFER, 0, NULL, GL_DYNAMIC_DRAW);
    glVertexAttribPointer(0, 3, GL_FLOAT, GL_FALSE, bodyStride, (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, bodyStride, (void*)(sizeof(float) * 3));
    glEnableVertexAttribArray(1);

    // Trails: position, colour with faded alpha
    glGenVertexArrays(1, &m_trailVAO);
    glGenBuffers(1, &m_trailVBO);
    glBindVertexArray(m_trailVAO);
    glBindBuffer(GL_ARRAY_BUFFER, m_trailVBO);
    glBufferData(GL_ARRAY_BUFFER, 0, NULL, GL_DYNAMIC_DRAW);
    glVertexAttribPointer(0, 2, GL_FLOAT, GL_FALSE, trailStride, (void*)0);
    glEnableVertexAttribArray(0);
    glVertexAttribPointer(1, 4, GL_FLOAT, GL_FALSE, trailStride, (void*)(sizeof(float) * 2));
    glEnableVertexAttribArray(1);

    glBindVertexArray(0);
    glBindBuffer(GL_ARRAY_BUFFER, 0);

    // Set up OpenGL state for point sprites
    glEnable(GL_PROGRAM_POINT_SIZE);
    glEnable(GL_BLEND);
    glDisable(GL_DEPTH_TEST);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);

    m_camera.init(framebufferWidth, framebufferHeight);
    return true;
}

void BodyRenderer::setViewport(int width, int height) {
    m_camera.setViewport(width, height);
    glViewport(0, 0, width, height);
}

void BodyRenderer::render(const Simulation& simulation, const std::vector<Color>& palette) {
    if (!m_bodyVBO || !m_trailVBO) return;

    m_camera.update(simulation.camera());

    if (m_showTrails) {
        renderTrails(simulation, palette);
    }
    renderBodies(simulation, palette);

    glBindVertexArray(0);
    glUseProgram(0);
}

void BodyRenderer::renderTrails(const Simulation& simulation, const std::vector<Color>& palette) {
    m_trailData.clear();
    m_trailFirst.clear();
    m_trailCount.clear();

    const auto& bodies = simulation.bodies();
    int first = 0;
    for (size_t i = 0; i < bodies.size(); ++i) {
        int count = appendTrailVertices(bodies[i], paletteColor(palette, i), m_trailData);
        if (count > 1) {
            m_trailFirst.push_back(first);
            m_trailCount.push_back(count);
        }
        first += count;
    }
    if (m_trailFirst.empty()) return;

    glBindBuffer(GL_ARRAY_BUFFER, m_trailVBO);
    glBufferData(GL_ARRAY_BUFFER, m_trailData.size() * sizeof(float), m_trailData.data(), GL_DYNAMIC_DRAW);

    m_shaderManager.setTrailUniforms(m_camera.getViewProjectionMatrix());
    glBindVertexArray(m_trailVAO);
    glMultiDrawArrays(GL_LINE_STRIP, m_trailFirst.data(), m_trailCount.data(),
                      static_cast<GLsizei>(m_trailFirst.size()));
}

void BodyRenderer::renderBodies(const Simulation& simulation, const std::vector<Color>& palette) {
    const auto& bodies = simulation.bodies();
    // Radius floor follows the simulation zoom, not the view-only multiplier
    const double zoom = simulation.camera().zoom;

    m_bodyData.clear();
    for (size_t i = 0; i < bodies.size(); ++i) {
        const Body& body = bodies[i];
        const Color& c = paletteColor(palette, i);
        m_bodyData.push_back(static_cast<float>(body.position().x));
        m_bodyData.push_back(static_cast<float>(body.position().y));
        m_bodyData.push_back(static_cast<float>(body.radius(zoom)));
        m_bodyData.push_back(c.r);
        m_bodyData.push_back(c.g);
        m_bodyData.push_back(c.b);
        m_bodyData.push_back(c.a);
    }
    if (m_bodyData.empty()) return;

    glBindBuffer(GL_ARRAY_BUFFER, m_bodyVBO);
    glBufferData(GL_ARRAY_BUFFER, m_bodyData.size() * sizeof(float), m_bodyData.data(), GL_DYNAMIC_DRAW);

    m_shaderManager.setBodyUniforms(m_camera.getViewProjectionMatrix(),
                                    m_camera.getEffectiveZoom(), m_glowScale);
    glBindVertexArray(m_bodyVAO);
    glDrawArrays(GL_POINTS, 0, static_cast<GLsizei>(bodies.size()));
}
