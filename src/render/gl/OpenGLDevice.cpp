#include "render/gl/OpenGLDevice.hpp"

#include <iostream>

#define GL_GLEXT_PROTOTYPES
#include <SDL3/SDL_opengl.h>

namespace
{
GLuint CompileShader(GLenum type, const std::string& source, std::string& error_log)
{
    GLuint shader = glCreateShader(type);
    if (shader == 0) {
        error_log = "glCreateShader failed";
        return 0;
    }
    const char* source_ptr = source.c_str();
    glShaderSource(shader, 1, &source_ptr, nullptr);
    glCompileShader(shader);

    GLint status = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length = 0;
        glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &log_length);
        std::string log(static_cast<size_t>(log_length > 0 ? log_length : 1), '\0');
        glGetShaderInfoLog(shader, static_cast<GLsizei>(log.size()), nullptr, log.data());
        error_log = (type == GL_VERTEX_SHADER ? "vertex shader: " : "fragment shader: ") + log;
        glDeleteShader(shader);
        return 0;
    }
    return shader;
}
}  // namespace

bool OpenGLDevice::HasUsableContext()
{
    const GLubyte* version = glGetString(GL_VERSION);
    if (version == nullptr) {
        return false;
    }
    GLint major = 0;
    GLint minor = 0;
    glGetIntegerv(GL_MAJOR_VERSION, &major);
    glGetIntegerv(GL_MINOR_VERSION, &minor);
    return major > 3 || (major == 3 && minor >= 3);
}

std::string OpenGLDevice::GetDescription() const
{
    const GLubyte* version = glGetString(GL_VERSION);
    const GLubyte* renderer = glGetString(GL_RENDERER);
    std::string description = "OpenGL ";
    description += version != nullptr ? reinterpret_cast<const char*>(version) : "(no context)";
    if (renderer != nullptr) {
        description += " on ";
        description += reinterpret_cast<const char*>(renderer);
    }
    return description;
}

GpuBufferPair OpenGLDevice::CreateBufferPair()
{
    GpuBufferPair buffers;
    glGenVertexArrays(1, &buffers.vertex_array);
    glGenBuffers(1, &buffers.vertex_buffer);
    glGenBuffers(1, &buffers.index_buffer);
    if (!buffers.IsValid()) {
        std::cerr << "OpenGLDevice::CreateBufferPair Error: GL error 0x" << std::hex << glGetError() << std::dec << std::endl;
        DestroyBufferPair(buffers);
        return GpuBufferPair();
    }
    return buffers;
}

void OpenGLDevice::DestroyBufferPair(const GpuBufferPair& buffers)
{
    if (buffers.index_buffer != 0) {
        glDeleteBuffers(1, &buffers.index_buffer);
    }
    if (buffers.vertex_buffer != 0) {
        glDeleteBuffers(1, &buffers.vertex_buffer);
    }
    if (buffers.vertex_array != 0) {
        glDeleteVertexArrays(1, &buffers.vertex_array);
    }
}

bool OpenGLDevice::UploadGeometry(const GpuBufferPair& buffers, const std::vector<float>& vertices, const std::vector<uint32_t>& indices)
{
    if (!buffers.IsValid()) {
        return false;
    }
    glBindVertexArray(buffers.vertex_array);
    glBindBuffer(GL_ARRAY_BUFFER, buffers.vertex_buffer);
    glBufferData(GL_ARRAY_BUFFER, static_cast<GLsizeiptr>(vertices.size() * sizeof(float)), vertices.empty() ? nullptr : vertices.data(), GL_DYNAMIC_DRAW);
    // The element buffer binding is part of the vertex array state.
    glBindBuffer(GL_ELEMENT_ARRAY_BUFFER, buffers.index_buffer);
    glBufferData(GL_ELEMENT_ARRAY_BUFFER, static_cast<GLsizeiptr>(indices.size() * sizeof(uint32_t)), indices.empty() ? nullptr : indices.data(), GL_DYNAMIC_DRAW);
    glBindVertexArray(0);

    GLenum const kError = glGetError();
    if (kError != GL_NO_ERROR) {
        std::cerr << "OpenGLDevice::UploadGeometry Error: GL error 0x" << std::hex << kError << std::dec << std::endl;
        return false;
    }
    return true;
}

uint32_t OpenGLDevice::CreateProgram(const std::string& vertex_source, const std::string& fragment_source, std::string& error_log)
{
    GLuint vertex_shader = CompileShader(GL_VERTEX_SHADER, vertex_source, error_log);
    if (vertex_shader == 0) {
        return 0;
    }
    GLuint fragment_shader = CompileShader(GL_FRAGMENT_SHADER, fragment_source, error_log);
    if (fragment_shader == 0) {
        glDeleteShader(vertex_shader);
        return 0;
    }

    GLuint program = glCreateProgram();
    glAttachShader(program, vertex_shader);
    glAttachShader(program, fragment_shader);
    glLinkProgram(program);
    // Shaders are owned by the program once linked.
    glDeleteShader(vertex_shader);
    glDeleteShader(fragment_shader);

    GLint status = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &status);
    if (status != GL_TRUE) {
        GLint log_length = 0;
        glGetProgramiv(program, GL_INFO_LOG_LENGTH, &log_length);
        std::string log(static_cast<size_t>(log_length > 0 ? log_length : 1), '\0');
        glGetProgramInfoLog(program, static_cast<GLsizei>(log.size()), nullptr, log.data());
        error_log = "link: " + log;
        glDeleteProgram(program);
        return 0;
    }
    return program;
}

void OpenGLDevice::DeleteProgram(uint32_t program)
{
    if (program != 0) {
        glDeleteProgram(program);
    }
}

void OpenGLDevice::UseProgram(uint32_t program)
{
    glUseProgram(program);
}

int OpenGLDevice::GetUniformLocation(uint32_t program, const std::string& name)
{
    return glGetUniformLocation(program, name.c_str());
}

int OpenGLDevice::GetAttribLocation(uint32_t program, const std::string& name)
{
    return glGetAttribLocation(program, name.c_str());
}

void OpenGLDevice::SetUniformMatrix3(int location, const std::array<float, 9>& matrix)
{
    glUniformMatrix3fv(location, 1, GL_FALSE, matrix.data());
}

void OpenGLDevice::SetUniformVec4(int location, const std::array<float, 4>& value)
{
    glUniform4f(location, value[0], value[1], value[2], value[3]);
}

void OpenGLDevice::SetUniformFloat(int location, float value)
{
    glUniform1f(location, value);
}

void OpenGLDevice::DrawTriangles(const GpuBufferPair& buffers, int position_attrib, size_t index_count)
{
    if (!buffers.IsValid() || index_count == 0 || position_attrib < 0) {
        return;
    }
    glBindVertexArray(buffers.vertex_array);
    glBindBuffer(GL_ARRAY_BUFFER, buffers.vertex_buffer);
    glEnableVertexAttribArray(static_cast<GLuint>(position_attrib));
    glVertexAttribPointer(static_cast<GLuint>(position_attrib), 2, GL_FLOAT, GL_FALSE, 0, nullptr);
    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(index_count), GL_UNSIGNED_INT, nullptr);
    glBindVertexArray(0);
}

void OpenGLDevice::SetViewport(int width, int height)
{
    glViewport(0, 0, width, height);
}

void OpenGLDevice::Clear(const std::array<float, 4>& color)
{
    glClearColor(color[0], color[1], color[2], color[3]);
    glClear(GL_COLOR_BUFFER_BIT);
}

void OpenGLDevice::EnableAlphaBlending()
{
    glDisable(GL_DEPTH_TEST);
    glEnable(GL_BLEND);
    glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
}
