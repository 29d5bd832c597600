#pragma once

#include "batch_buffer.hpp"
#include <vector>

namespace vellum::render {

struct QuadParams {
    std::vector<PointF> positions;   // 4 corners, wound consistently
    std::vector<Color> colors;       // one per corner
    std::vector<PointF> tex_coords;  // empty or one per corner
};

struct TriangleParams {
    std::vector<PointF> positions;
    std::vector<Color> colors;
    std::vector<PointF> tex_coords;
};

struct LineParams {
    PointF start;
    PointF end;
    Color color;
    f32 width{1.0f};
};

/**
 * Tessellates primitives into a BatchBuffer.
 *
 * Every add_* checks capacity first and returns false without writing
 * anything when the buffer cannot hold the primitive. Malformed parameters
 * throw ConfigurationError.
 */
class BatchGeometry {
public:
    explicit BatchGeometry(BatchBuffer& buffer) : m_buffer(buffer) {}

    bool add_quad(const QuadParams& params);
    bool add_triangle(const TriangleParams& params);
    bool add_line(const LineParams& params);
    bool add_rect(f32 x, f32 y, f32 width, f32 height, Color color);
    bool add_circle(PointF center, f32 radius, Color color, u32 segments = 32);

private:
    BatchBuffer& m_buffer;
};

[[nodiscard]] gpu::Vertex make_vertex(PointF position, Color color, PointF tex_coord = {});

} // namespace vellum::render
