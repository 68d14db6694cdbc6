#include "ShaderManager.h"
#include <iostream>

ShaderManager::ShaderManager()
    : m_bodyShaderProgram(0),
      m_trailShaderProgram(0)
{
}

ShaderManager::~ShaderManager() {
    if (m_bodyShaderProgram) {
        glDeleteProgram(m_bodyShaderProgram);
        m_bodyShaderProgram = 0;
    }

    if (m_trailShaderProgram) {
        glDeleteProgram(m_trailShaderProgram);
        m_trailShaderProgram = 0;
    }
}

bool ShaderManager::init() {
    m_bodyShaderProgram = buildProgram(getBodyVertexShader(), getBodyFragmentShader());
    if (!m_bodyShaderProgram) return false;

    m_trailShaderProgram = buildProgram(getTrailVertexShader(), getTrailFragmentShader());
    return m_trailShaderProgram != 0;
}

GLuint ShaderManager::buildProgram(const char* vertexSource, const char* fragmentSource) {
    GLuint vertex = compileShader(GL_VERTEX_SHADER, vertexSource);
    if (!vertex) return 0;

    GLuint fragment = compileShader(GL_FRAGMENT_SHADER, fragmentSource);
    if (!fragment) {
        glDeleteShader(vertex);
        return 0;
    }

    GLuint program = linkProgram(vertex, fragment);
    glDeleteShader(vertex);
    glDeleteShader(fragment);
    return program;
}

GLuint ShaderManager::compileShader(GLenum type, const char* source) {
    GLuint shader = glCreateShader(type);
    glShaderSource(shader, 1, &source, NULL);
    glCompileShader(shader);

    GLint success;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetShaderInfoLog(shader, 512, NULL, infoLog);
        std::cerr << "Shader compilation failed: " << infoLog << std::endl;
        glDeleteShader(shader);
        return 0;
    }

    return shader;
}

GLuint ShaderManager::linkProgram(GLuint vertexShader, GLuint fragmentShader) {
    GLuint program = glCreateProgram();
    glAttachShader(program, vertexShader);
    glAttachShader(program, fragmentShader);
    glLinkProgram(program);

    GLint success;
    glGetProgramiv(program, GL_LINK_STATUS, &success);
    if (!success) {
        char infoLog[512];
        glGetProgramInfoLog(program, 512, NULL, infoLog);
        std::cerr << "Shader program linking failed: " << infoLog << std::endl;
        glDeleteProgram(program);
        return 0;
    }

    return program;
}

void ShaderManager::setBodyUniforms(const float* viewProjMatrix, float zoom, float glowScale) {
    glUseProgram(m_bodyShaderProgram);

    GLint matrixLoc = glGetUniformLocation(m_bodyShaderProgram, "viewProjMatrix");
    glUniformMatrix4fv(matrixLoc, 1, GL_FALSE, viewProjMatrix);

    GLint zoomLoc = glGetUniformLocation(m_bodyShaderProgram, "zoom");
    glUniform1f(zoomLoc, zoom);

    GLint glowLoc = glGetUniformLocation(m_bodyShaderProgram, "glowScale");
    glUniform1f(glowLoc, glowScale);
}

void ShaderManager::setTrailUniforms(const float* viewProjMatrix) {
    glUseProgram(m_trailShaderProgram);

    GLint matrixLoc = glGetUniformLocation(m_trailShaderProgram, "viewProjMatrix");
    glUniformMatrix4fv(matrixLoc, 1, GL_FALSE, viewProjMatrix);
}

const char* ShaderManager::getBodyVertexShader() const {
    return
        "#version 330 core\n"
        "layout(location = 0) in vec3 body;\n"   // xy = world position, z = radius in world units
        "layout(location = 1) in vec4 color;\n"
        "uniform mat4 viewProjMatrix;\n"
        "uniform float zoom;\n"
        "uniform float glowScale;\n"
        "out vec4 bodyColor;\n"
        "void main() {\n"
        "    gl_Position = viewProjMatrix * vec4(body.xy, 0.0, 1.0);\n"
        "    // Sprite covers the whole glow; the solid core is 1/glowScale of it\n"
        "    gl_PointSize = max(2.0 * body.z * zoom * glowScale, 1.0);\n"
        "    bodyColor = color;\n"
        "}\n";
}

const char* ShaderManager::getBodyFragmentShader() const {
    return
        "#version 330 core\n"
        "in vec4 bodyColor;\n"
        "out vec4 FragColor;\n"
        "uniform float glowScale;\n"
        "void main() {\n"
        "    float dist = distance(gl_PointCoord, vec2(0.5, 0.5)) * 2.0;\n"
        "    if (dist > 1.0) {\n"
        "        discard;\n"
        "    }\n"
        "    float core = 1.0 / glowScale;\n"
        "    if (dist <= core) {\n"
        "        FragColor = vec4(bodyColor.rgb, bodyColor.a);\n"
        "        return;\n"
        "    }\n"
        "    // Radial gradient from the core edge out to transparent\n"
        "    float t = (dist - core) / (1.0 - core);\n"
        "    float glow = (1.0 - t) * (1.0 - t) * 0.5;\n"
        "    FragColor = vec4(bodyColor.rgb, bodyColor.a * glow);\n"
        "}\n";
}

const char* ShaderManager::getTrailVertexShader() const {
    return
        "#version 330 core\n"
        "layout(location = 0) in vec2 position;\n"
        "layout(location = 1) in vec4 color;\n"
        "uniform mat4 viewProjMatrix;\n"
        "out vec4 vertexColor;\n"
        "void main() {\n"
        "    gl_Position = viewProjMatrix * vec4(position, 0.0, 1.0);\n"
        "    vertexColor = color;\n"
        "}\n";
}

const char* ShaderManager::getTrailFragmentShader() const {
    return
        "#version 330 core\n"
        "in vec4 vertexColor;\n"
        "out vec4 FragColor;\n"
        "void main() {\n"
        "    FragColor = vertexColor;\n"
        "}\n";
}
