#pragma once

#include "render/gl/GpuDevice.hpp"

// GpuDevice over the OpenGL 3.3 core profile. Requires a current GL context on the calling
// thread for every call.
class OpenGLDevice : public GpuDevice
{
public:
    OpenGLDevice() = default;
    ~OpenGLDevice() override = default;

    // True when a context is current and reports at least GL 3.3.
    static bool HasUsableContext();

    [[nodiscard]] bool IsAvailable() const override { return HasUsableContext(); }
    [[nodiscard]] std::string GetDescription() const override;

    GpuBufferPair CreateBufferPair() override;
    void DestroyBufferPair(const GpuBufferPair& buffers) override;
    bool UploadGeometry(const GpuBufferPair& buffers, const std::vector<float>& vertices, const std::vector<uint32_t>& indices) override;

    uint32_t CreateProgram(const std::string& vertex_source, const std::string& fragment_source, std::string& error_log) override;
    void DeleteProgram(uint32_t program) override;
    void UseProgram(uint32_t program) override;
    [[nodiscard]] int GetUniformLocation(uint32_t program, const std::string& name) override;
    [[nodiscard]] int GetAttribLocation(uint32_t program, const std::string& name) override;

    void SetUniformMatrix3(int location, const std::array<float, 9>& matrix) override;
    void SetUniformVec4(int location, const std::array<float, 4>& value) override;
    void SetUniformFloat(int location, float value) override;

    void DrawTriangles(const GpuBufferPair& buffers, int position_attrib, size_t index_count) override;

    void SetViewport(int width, int height) override;
    void Clear(const std::array<float, 4>& color) override;
    void EnableAlphaBlending() override;
};
