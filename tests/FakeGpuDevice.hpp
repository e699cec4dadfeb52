#pragma once

#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "render/gl/GpuDevice.hpp"

// Records every call; hands out increasing buffer ids and program id 1.
class FakeGpuDevice : public GpuDevice
{
public:
    struct DrawCall {
        GpuBufferPair buffers;
        size_t index_count = 0;
    };

    struct State {
        bool available = true;
        bool fail_compile = false;
        bool fail_buffer_creation = false;

        uint32_t next_id = 1;
        std::set<std::tuple<uint32_t, uint32_t, uint32_t>> live_buffers;
        size_t buffers_created = 0;
        size_t buffers_destroyed = 0;
        size_t uploads = 0;
        std::vector<DrawCall> draws;
        size_t clears = 0;
        int viewport_width = 0;
        int viewport_height = 0;
        bool blending_enabled = false;
        bool program_deleted = false;
        std::map<std::string, std::vector<float>> uniforms;
    };

    // state outlives the device so tests can inspect it after the renderer is gone.
    explicit FakeGpuDevice(State& state) : m_state_(state) {}

    [[nodiscard]] bool IsAvailable() const override { return m_state_.available; }
    [[nodiscard]] std::string GetDescription() const override { return "fake device"; }

    GpuBufferPair CreateBufferPair() override
    {
        if (m_state_.fail_buffer_creation) {
            return GpuBufferPair();
        }
        GpuBufferPair buffers;
        buffers.vertex_array = m_state_.next_id++;
        buffers.vertex_buffer = m_state_.next_id++;
        buffers.index_buffer = m_state_.next_id++;
        m_state_.live_buffers.insert(Key(buffers));
        m_state_.buffers_created++;
        return buffers;
    }

    void DestroyBufferPair(const GpuBufferPair& buffers) override
    {
        if (m_state_.live_buffers.erase(Key(buffers)) > 0) {
            m_state_.buffers_destroyed++;
        }
    }

    bool UploadGeometry(const GpuBufferPair& buffers, const std::vector<float>& vertices, const std::vector<uint32_t>& indices) override
    {
        if (m_state_.live_buffers.count(Key(buffers)) == 0 || vertices.empty() || indices.empty()) {
            return false;
        }
        m_state_.uploads++;
        return true;
    }

    uint32_t CreateProgram(const std::string& vertex_source, const std::string& fragment_source, std::string& error_log) override
    {
        if (m_state_.fail_compile || vertex_source.empty() || fragment_source.empty()) {
            error_log = "fake compile failure";
            return 0;
        }
        return 1;
    }

    void DeleteProgram(uint32_t program) override
    {
        if (program == 1) {
            m_state_.program_deleted = true;
        }
    }

    void UseProgram(uint32_t /*program*/) override {}

    int GetUniformLocation(uint32_t /*program*/, const std::string& name) override
    {
        static const std::map<std::string, int> kUniforms = {{"u_viewMatrix", 0}, {"u_color", 1}, {"u_opacity", 2}};
        auto it = kUniforms.find(name);
        return it != kUniforms.end() ? it->second : -1;
    }

    int GetAttribLocation(uint32_t /*program*/, const std::string& name) override { return name == "a_position" ? 0 : -1; }

    void SetUniformMatrix3(int location, const std::array<float, 9>& matrix) override { Record(location, std::vector<float>(matrix.begin(), matrix.end())); }
    void SetUniformVec4(int location, const std::array<float, 4>& value) override { Record(location, std::vector<float>(value.begin(), value.end())); }
    void SetUniformFloat(int location, float value) override { Record(location, {value}); }

    void DrawTriangles(const GpuBufferPair& buffers, int /*position_attrib*/, size_t index_count) override { m_state_.draws.push_back({buffers, index_count}); }

    void SetViewport(int width, int height) override
    {
        m_state_.viewport_width = width;
        m_state_.viewport_height = height;
    }
    void Clear(const std::array<float, 4>& /*color*/) override { m_state_.clears++; }
    void EnableAlphaBlending() override { m_state_.blending_enabled = true; }

private:
    static std::tuple<uint32_t, uint32_t, uint32_t> Key(const GpuBufferPair& buffers)
    {
        return std::make_tuple(buffers.vertex_array, buffers.vertex_buffer, buffers.index_buffer);
    }

    void Record(int location, std::vector<float> values)
    {
        static const char* const kNames[] = {"u_viewMatrix", "u_color", "u_opacity"};
        if (location >= 0 && location < 3) {
            m_state_.uniforms[kNames[location]] = std::move(values);
        }
    }

    State& m_state_;
};
