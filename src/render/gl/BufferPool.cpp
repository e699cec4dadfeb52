#include "render/gl/BufferPool.hpp"

#include <iostream>

BufferPool::BufferPool(GpuDevice& device) : m_device_(device) {}

BufferPool::~BufferPool()
{
    Dispose();
}

GpuBufferPair BufferPool::Acquire()
{
    for (PoolEntry& entry : m_entries_) {
        if (!entry.in_use) {
            entry.in_use = true;
            return entry.buffers;
        }
    }

    GpuBufferPair const kBuffers = m_device_.CreateBufferPair();
    if (!kBuffers.IsValid()) {
        std::cerr << "BufferPool::Acquire Error: Device failed to create a buffer pair" << std::endl;
        return GpuBufferPair();
    }
    m_entries_.push_back({kBuffers, true});
    m_created_++;
    return kBuffers;
}

bool BufferPool::Release(const GpuBufferPair& buffers)
{
    for (PoolEntry& entry : m_entries_) {
        if (entry.buffers == buffers && entry.in_use) {
            entry.in_use = false;
            return true;
        }
    }
    return false;
}

void BufferPool::ReleaseAll()
{
    for (PoolEntry& entry : m_entries_) {
        entry.in_use = false;
    }
}

void BufferPool::Dispose()
{
    for (const PoolEntry& entry : m_entries_) {
        m_device_.DestroyBufferPair(entry.buffers);
    }
    m_entries_.clear();
}

BufferPoolStatistics BufferPool::GetStatistics() const
{
    BufferPoolStatistics stats;
    stats.total = m_entries_.size();
    for (const PoolEntry& entry : m_entries_) {
        if (entry.in_use) {
            stats.in_use++;
        }
    }
    stats.available = stats.total - stats.in_use;
    stats.created = m_created_;
    return stats;
}
