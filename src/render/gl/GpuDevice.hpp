#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Vertex array plus its vertex and index buffers. All zero means "no buffer".
struct GpuBufferPair {
    uint32_t vertex_array = 0;
    uint32_t vertex_buffer = 0;
    uint32_t index_buffer = 0;

    [[nodiscard]] bool IsValid() const { return vertex_array != 0 && vertex_buffer != 0 && index_buffer != 0; }
    bool operator==(const GpuBufferPair& other) const { return vertex_array == other.vertex_array && vertex_buffer == other.vertex_buffer && index_buffer == other.index_buffer; }
};

// The subset of a GPU API the batched renderer needs. Vertices are tightly packed 2D float
// positions; indices are 32-bit triangle lists.
class GpuDevice
{
public:
    virtual ~GpuDevice() = default;

    // False when the device has nothing to draw into (e.g. no current context).
    [[nodiscard]] virtual bool IsAvailable() const = 0;
    [[nodiscard]] virtual std::string GetDescription() const = 0;

    // Returns an invalid pair on failure.
    virtual GpuBufferPair CreateBufferPair() = 0;
    virtual void DestroyBufferPair(const GpuBufferPair& buffers) = 0;
    virtual bool UploadGeometry(const GpuBufferPair& buffers, const std::vector<float>& vertices, const std::vector<uint32_t>& indices) = 0;

    // Returns 0 and fills error_log on compile or link failure.
    virtual uint32_t CreateProgram(const std::string& vertex_source, const std::string& fragment_source, std::string& error_log) = 0;
    virtual void DeleteProgram(uint32_t program) = 0;
    virtual void UseProgram(uint32_t program) = 0;
    // -1 when the program has no active variable with that name.
    [[nodiscard]] virtual int GetUniformLocation(uint32_t program, const std::string& name) = 0;
    [[nodiscard]] virtual int GetAttribLocation(uint32_t program, const std::string& name) = 0;

    // Column-major 3x3.
    virtual void SetUniformMatrix3(int location, const std::array<float, 9>& matrix) = 0;
    virtual void SetUniformVec4(int location, const std::array<float, 4>& value) = 0;
    virtual void SetUniformFloat(int location, float value) = 0;

    virtual void DrawTriangles(const GpuBufferPair& buffers, int position_attrib, size_t index_count) = 0;

    virtual void SetViewport(int width, int height) = 0;
    virtual void Clear(const std::array<float, 4>& color) = 0;
    // Straight alpha blending (src_alpha, one_minus_src_alpha), depth test off.
    virtual void EnableAlphaBlending() = 0;
};
