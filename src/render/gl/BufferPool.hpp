#pragma once

#include <cstddef>
#include <vector>

#include "render/gl/GpuDevice.hpp"

struct BufferPoolStatistics {
    size_t total = 0;
    size_t in_use = 0;
    size_t available = 0;
    size_t created = 0;  // Buffer pairs created since construction
};

// Reusable GPU buffer pairs. Acquire() hands out a free pair or creates one; Release() returns
// it for reuse. Every pair the pool created is destroyed by Dispose().
class BufferPool
{
public:
    explicit BufferPool(GpuDevice& device);
    ~BufferPool();

    BufferPool(const BufferPool&) = delete;
    BufferPool& operator=(const BufferPool&) = delete;

    // Invalid pair when the device could not create one.
    GpuBufferPair Acquire();
    // Returns false for a pair this pool does not have checked out.
    bool Release(const GpuBufferPair& buffers);
    void ReleaseAll();
    void Dispose();

    [[nodiscard]] BufferPoolStatistics GetStatistics() const;

private:
    struct PoolEntry {
        GpuBufferPair buffers;
        bool in_use = false;
    };

    GpuDevice& m_device_;
    std::vector<PoolEntry> m_entries_;
    size_t m_created_ = 0;
};
