#pragma once

#include <GL/glew.h>
#include <string>
#include <vector>

// Class to handle shader compilation, linking and uniform setting
class ShaderManager {
public:
    ShaderManager();
    ~ShaderManager();

    // Initialize and compile shaders
    bool init();

    // Set uniforms for the body shader; glowScale is the glow radius over the core radius
    void setBodyUniforms(const float* viewProjMatrix, float zoom, float glowScale);

    // Set uniforms for the trail shader
    void setTrailUniforms(const float* viewProjMatrix);

private:
    // Shader program IDs
    GLuint m_bodyShaderProgram;
    GLuint m_trailShaderProgram;

    // Helper methods
    GLuint compileShader(GLenum type, const char* source);
    GLuint linkProgram(GLuint vertexShader, GLuint fragmentShader);
    GLuint buildProgram(const char* vertexSource, const char* fragmentSource);

    // Shader source code
    const char* getBodyVertexShader() const;
    const char* getBodyFragmentShader() const;
    const char* getTrailVertexShader() const;
    const char* getTrailFragmentShader() const;
};
