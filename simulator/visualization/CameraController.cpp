#include "CameraController.h"
#include <cmath>
#include <algorithm>

CameraController::CameraController()
    : m_centerX(0.0f),
      m_centerY(0.0f),
      m_zoom(1.0f),
      m_userZoom(1.0f),
      m_viewportWidth(1),
      m_viewportHeight(1)
{
    // Initialize matrix to identity
    for (int i = 0; i < 16; i++) {
        m_viewProjMatrix[i] = (i % 5 == 0) ? 1.0f : 0.0f;
    }
}

void CameraController::init(int windowWidth, int windowHeight) {
    setViewport(windowWidth, windowHeight);
}

void CameraController::setViewport(int width, int height) {
    // Minimised windows report 0x0
    m_viewportWidth = std::max(width, 1);
    m_viewportHeight = std::max(height, 1);
    updateMatrices();
}

void CameraController::update(const Camera& camera) {
    m_centerX = static_cast<float>(camera.position.x);
    m_centerY = static_cast<float>(camera.position.y);
    m_zoom = static_cast<float>(camera.zoom);
    updateMatrices();
}

void CameraController::updateMatrices() {
    float z = getEffectiveZoom();
    float sx = 2.0f * z / static_cast<float>(m_viewportWidth);
    // World y grows downwards like a canvas, clip space y grows upwards
    float sy = -2.0f * z / static_cast<float>(m_viewportHeight);

    for (int i = 0; i < 16; i++) {
        m_viewProjMatrix[i] = 0.0f;
    }

    m_viewProjMatrix[0] = sx;
    m_viewProjMatrix[5] = sy;
    m_viewProjMatrix[10] = 1.0f;
    m_viewProjMatrix[12] = -m_centerX * sx;
    m_viewProjMatrix[13] = -m_centerY * sy;
    m_viewProjMatrix[15] = 1.0f;
}

void CameraController::resetView() {
    m_userZoom = 1.0f;
    updateMatrices();
}

void CameraController::handleScroll(double yoffset) {
    float zoomFactor = 1.1f;

    m_userZoom *= (yoffset > 0) ? zoomFactor : 1.0f/zoomFactor;

    // Limit how close/far we can get
    m_userZoom = std::max(0.1f, std::min(m_userZoom, 10.0f));

    updateMatrices();
}

Vector2 CameraController::worldToScreen(const Vector2& world) const {
    double z = getEffectiveZoom();
    return Vector2((world.x - m_centerX) * z + m_viewportWidth * 0.5,
                   (world.y - m_centerY) * z + m_viewportHeight * 0.5);
}
