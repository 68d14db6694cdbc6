#pragma once

#include "Simulation.hpp"
#include "Vector2.hpp"

// Turns the simulation camera (tracked centre + zoom) into a 2D orthographic
// transform for the current framebuffer. A user zoom multiplier (scroll wheel)
// is layered on top without touching the simulation.
class CameraController {
public:
    CameraController();

    // Initialize matrices
    void init(int windowWidth, int windowHeight);

    void setViewport(int width, int height);
    void update(const Camera& camera);
    void resetView();

    void handleScroll(double yoffset);

    float getUserZoom() const { return m_userZoom; }
    // Simulation zoom times the user multiplier
    float getEffectiveZoom() const { return m_zoom * m_userZoom; }
    int getViewportWidth() const { return m_viewportWidth; }
    int getViewportHeight() const { return m_viewportHeight; }

    // Pixel coordinates, origin top-left, y down
    Vector2 worldToScreen(const Vector2& world) const;

    // Column-major, for glUniformMatrix4fv
    const float* getViewProjectionMatrix() const { return m_viewProjMatrix; }

private:
    void updateMatrices();

    float m_centerX;
    float m_centerY;
    float m_zoom;
    float m_userZoom;
    int m_viewportWidth;
    int m_viewportHeight;

    float m_viewProjMatrix[16];
};
