#include "render/RenderContext.hpp"

#include <algorithm>
#include <iostream>
#include <thread>

namespace
{
// Adaptive thread count selection based on workload size
int GetOptimalThreadCount(int width, int height)
{
    long long const kPixels = static_cast<long long>(width) * height;
    int const kHwThreads = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));

    if (kPixels < 250000) {
        return 1;  // < 500x500
    }
    if (kPixels < 4000000) {
        return std::min(2, kHwThreads);  // < 2000x2000
    }
    return std::min(4, kHwThreads);
}
}  // namespace

RenderContext::RenderContext() = default;

RenderContext::~RenderContext()
{
    Shutdown();
}

BLResult RenderContext::BeginContext()
{
    if (m_thread_count_ > 1) {
        BLContextCreateInfo create_info {};
        create_info.threadCount = static_cast<uint32_t>(m_thread_count_);
        create_info.flags = BL_CONTEXT_CREATE_FLAG_FALLBACK_TO_SYNC;
        return m_bl_context_.begin(m_target_image_, create_info);
    }
    return m_bl_context_.begin(m_target_image_);
}

bool RenderContext::Initialize(int width, int height, int thread_count)
{
    if (width <= 0 || height <= 0) {
        std::cerr << "RenderContext::Initialize Error: Invalid dimensions (" << width << "x" << height << ")." << std::endl;
        return false;
    }
    Shutdown();

    BLResult err = m_target_image_.create(width, height, BL_FORMAT_PRGB32);
    if (err != BL_SUCCESS) {
        std::cerr << "RenderContext::Initialize Error: Failed to create BLImage: " << err << std::endl;
        return false;
    }
    m_image_width_ = width;
    m_image_height_ = height;
    m_thread_count_ = thread_count > 0 ? thread_count : GetOptimalThreadCount(width, height);

    err = BeginContext();
    if (err != BL_SUCCESS) {
        std::cerr << "RenderContext::Initialize Error: Failed to begin BLContext: " << err << std::endl;
        m_target_image_.reset();
        m_image_width_ = 0;
        m_image_height_ = 0;
        return false;
    }

    std::cout << "RenderContext: Initialized " << width << "x" << height << " with " << m_thread_count_ << (m_thread_count_ > 1 ? " threads" : " thread") << std::endl;
    return true;
}

void RenderContext::Shutdown()
{
    if (m_bl_context_.isValid()) {
        m_bl_context_.end();
    }
    m_target_image_.reset();
    m_image_width_ = 0;
    m_image_height_ = 0;
}

void RenderContext::BeginFrame()
{
    if (!m_bl_context_.isValid() || m_target_image_.empty()) {
        std::cerr << "RenderContext::BeginFrame Error: Context not initialized or image empty." << std::endl;
        return;
    }

    m_bl_context_.resetTransform();
    m_bl_context_.setCompOp(BL_COMP_OP_SRC_COPY);  // Ensure overwrite
    m_bl_context_.fillAll(m_clear_color_);
    m_bl_context_.setCompOp(BL_COMP_OP_SRC_OVER);
}

void RenderContext::EndFrame()
{
    if (m_bl_context_.isValid()) {
        m_bl_context_.flush(BL_CONTEXT_FLUSH_SYNC);
    }
}

bool RenderContext::ResizeImage(int new_width, int new_height)
{
    if (new_width <= 0 || new_height <= 0) {
        std::cerr << "RenderContext::ResizeImage Error: Invalid new dimensions (" << new_width << "x" << new_height << ")." << std::endl;
        return false;
    }
    if (new_width == m_image_width_ && new_height == m_image_height_ && !m_target_image_.empty()) {
        return true;
    }

    if (m_bl_context_.isValid()) {
        m_bl_context_.end();  // End context before resizing image
    }

    BLImage new_image;
    BLResult err = new_image.create(new_width, new_height, BL_FORMAT_PRGB32);
    if (err != BL_SUCCESS) {
        std::cerr << "RenderContext::ResizeImage Error: Failed to create new BLImage: " << err << std::endl;
        if (!m_target_image_.empty() && BeginContext() != BL_SUCCESS) {
            m_target_image_.reset();
        }
        return false;
    }

    m_target_image_ = new_image;
    m_image_width_ = new_width;
    m_image_height_ = new_height;

    err = BeginContext();
    if (err != BL_SUCCESS) {
        std::cerr << "RenderContext::ResizeImage Error: Failed to begin BLContext on new image: " << err << std::endl;
        m_target_image_.reset();
        return false;
    }
    return true;
}

void RenderContext::OptimizeForStatic()
{
    m_bl_context_.setCompOp(BL_COMP_OP_SRC_OVER);
    m_bl_context_.setFillRule(BL_FILL_RULE_NON_ZERO);

    BLApproximationOptions precision_options = blDefaultApproximationOptions;
    precision_options.flattenTolerance = 0.1;
    m_bl_context_.setApproximationOptions(precision_options);
}
