#include "render/gl/ShaderProgram.hpp"

#include <iostream>
#include <utility>

namespace layout_shaders
{
const char* const kFillVertexShader = R"(#version 330 core
in vec2 a_position;
uniform mat3 u_viewMatrix;
void main()
{
    vec3 clip = u_viewMatrix * vec3(a_position, 1.0);
    gl_Position = vec4(clip.xy, 0.0, 1.0);
}
)";

const char* const kFillFragmentShader = R"(#version 330 core
uniform vec4 u_color;
uniform float u_opacity;
out vec4 frag_color;
void main()
{
    frag_color = vec4(u_color.rgb, u_color.a * u_opacity);
}
)";
}  // namespace layout_shaders

ShaderProgram::ShaderProgram(GpuDevice& device, std::string vertex_source, std::string fragment_source)
    : m_device_(device), m_vertex_source_(std::move(vertex_source)), m_fragment_source_(std::move(fragment_source))
{
}

ShaderProgram::~ShaderProgram()
{
    Dispose();
}

bool ShaderProgram::Compile()
{
    if (m_compile_attempted_) {
        return m_program_ != 0;
    }
    m_compile_attempted_ = true;

    std::string error_log;
    m_program_ = m_device_.CreateProgram(m_vertex_source_, m_fragment_source_, error_log);
    if (m_program_ == 0) {
        std::cerr << "ShaderProgram::Compile Error: " << error_log << std::endl;
        return false;
    }
    return true;
}

void ShaderProgram::Use()
{
    if (m_program_ != 0) {
        m_device_.UseProgram(m_program_);
    }
}

void ShaderProgram::Dispose()
{
    if (m_program_ != 0) {
        m_device_.DeleteProgram(m_program_);
        m_program_ = 0;
    }
    m_uniform_locations_.clear();
    m_attribute_locations_.clear();
    m_compile_attempted_ = false;
}

int ShaderProgram::GetUniformLocation(const std::string& name)
{
    auto it = m_uniform_locations_.find(name);
    if (it != m_uniform_locations_.end()) {
        return it->second;
    }
    int const kLocation = m_program_ != 0 ? m_device_.GetUniformLocation(m_program_, name) : -1;
    if (kLocation < 0) {
        std::cerr << "ShaderProgram Warning: Uniform '" << name << "' not found" << std::endl;
    }
    m_uniform_locations_.emplace(name, kLocation);
    return kLocation;
}

int ShaderProgram::GetAttributeLocation(const std::string& name)
{
    auto it = m_attribute_locations_.find(name);
    if (it != m_attribute_locations_.end()) {
        return it->second;
    }
    int const kLocation = m_program_ != 0 ? m_device_.GetAttribLocation(m_program_, name) : -1;
    if (kLocation < 0) {
        std::cerr << "ShaderProgram Warning: Attribute '" << name << "' not found" << std::endl;
    }
    m_attribute_locations_.emplace(name, kLocation);
    return kLocation;
}

void ShaderProgram::SetUniformMatrix3(const std::string& name, const std::array<float, 9>& matrix)
{
    int const kLocation = GetUniformLocation(name);
    if (kLocation >= 0) {
        m_device_.SetUniformMatrix3(kLocation, matrix);
    }
}

void ShaderProgram::SetUniformVec4(const std::string& name, const std::array<float, 4>& value)
{
    int const kLocation = GetUniformLocation(name);
    if (kLocation >= 0) {
        m_device_.SetUniformVec4(kLocation, value);
    }
}

void ShaderProgram::SetUniformFloat(const std::string& name, float value)
{
    int const kLocation = GetUniformLocation(name);
    if (kLocation >= 0) {
        m_device_.SetUniformFloat(kLocation, value);
    }
}
