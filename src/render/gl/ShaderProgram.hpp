#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "render/gl/GpuDevice.hpp"

// Compiled and linked program with cached uniform and attribute locations.
class ShaderProgram
{
public:
    ShaderProgram(GpuDevice& device, std::string vertex_source, std::string fragment_source);
    ~ShaderProgram();

    ShaderProgram(const ShaderProgram&) = delete;
    ShaderProgram& operator=(const ShaderProgram&) = delete;

    // Compiles once; later calls return the first result.
    bool Compile();
    [[nodiscard]] bool IsCompiled() const { return m_program_ != 0; }
    void Use();
    void Dispose();

    // -1 when missing. Missing names are logged once.
    int GetUniformLocation(const std::string& name);
    int GetAttributeLocation(const std::string& name);

    void SetUniformMatrix3(const std::string& name, const std::array<float, 9>& matrix);
    void SetUniformVec4(const std::string& name, const std::array<float, 4>& value);
    void SetUniformFloat(const std::string& name, float value);

private:
    GpuDevice& m_device_;
    std::string m_vertex_source_;
    std::string m_fragment_source_;
    uint32_t m_program_ = 0;
    bool m_compile_attempted_ = false;

    std::unordered_map<std::string, int> m_uniform_locations_;
    std::unordered_map<std::string, int> m_attribute_locations_;
};

namespace layout_shaders
{
// Flat-colored 2D triangles: a_position in world units, u_viewMatrix world -> clip space.
extern const char* const kFillVertexShader;
extern const char* const kFillFragmentShader;
}  // namespace layout_shaders
