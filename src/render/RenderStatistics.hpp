#pragma once

#include <cstddef>

struct RenderStatistics {
    double fps = 0.0;            // Frames per second over the last full second
    double frame_time_ms = 0.0;  // Duration of the most recent Render() call
    size_t elements_rendered = 0;
    size_t elements_culled = 0;  // total_elements - elements_rendered
    size_t total_elements = 0;
    size_t draw_calls = 0;
    size_t triangles = 0;
    size_t frame_count = 0;
};
