#include "vellum/render/batch_geometry.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"
#include <cmath>
#include <numbers>

namespace vellum::render {

namespace {

void check_arity(const std::vector<PointF>& positions, const std::vector<Color>& colors,
                 const std::vector<PointF>& tex_coords, usize corners, const char* shape) {
    if (positions.size() != corners || colors.size() != corners ||
        (!tex_coords.empty() && tex_coords.size() != corners)) {
        throw ConfigurationError(format_message(
            "{} needs {} positions and colors, got {} and {}",
            shape, corners, positions.size(), colors.size()));
    }
    // Checked up front so a bad corner never leaves earlier corners staged
    for (const auto& position : positions) {
        if (!std::isfinite(position.x) || !std::isfinite(position.y)) {
            throw ConfigurationError(format_message("{} position must be finite", shape));
        }
    }
}

} // anonymous namespace

gpu::Vertex make_vertex(PointF position, Color color, PointF tex_coord) {
    gpu::Vertex vertex;
    vertex.x = position.x;
    vertex.y = position.y;
    vertex.r = static_cast<f32>(color.r) / 255.0f;
    vertex.g = static_cast<f32>(color.g) / 255.0f;
    vertex.b = static_cast<f32>(color.b) / 255.0f;
    vertex.a = static_cast<f32>(color.a) / 255.0f;
    vertex.u = tex_coord.x;
    vertex.v = tex_coord.y;
    return vertex;
}

bool BatchGeometry::add_quad(const QuadParams& params) {
    check_arity(params.positions, params.colors, params.tex_coords, 4, "Quad");
    if (!m_buffer.has_space(4, 6)) {
        return false;
    }

    auto base = static_cast<u32>(m_buffer.vertex_count());
    for (usize i = 0; i < 4; ++i) {
        PointF uv = params.tex_coords.empty() ? PointF{} : params.tex_coords[i];
        m_buffer.add_vertex(make_vertex(params.positions[i], params.colors[i], uv));
    }
    for (u32 index : {0u, 1u, 2u, 0u, 2u, 3u}) {
        m_buffer.add_index(base + index);
    }
    return true;
}

bool BatchGeometry::add_triangle(const TriangleParams& params) {
    check_arity(params.positions, params.colors, params.tex_coords, 3, "Triangle");
    if (!m_buffer.has_space(3, 3)) {
        return false;
    }

    auto base = static_cast<u32>(m_buffer.vertex_count());
    for (usize i = 0; i < 3; ++i) {
        PointF uv = params.tex_coords.empty() ? PointF{} : params.tex_coords[i];
        m_buffer.add_vertex(make_vertex(params.positions[i], params.colors[i], uv));
    }
    for (u32 i = 0; i < 3; ++i) {
        m_buffer.add_index(base + i);
    }
    return true;
}

bool BatchGeometry::add_line(const LineParams& params) {
    if (!(params.width > 0.0f)) {
        throw ConfigurationError("Line width must be positive");
    }

    // Extrude the segment into a quad along its normal
    PointF delta = params.end - params.start;
    f32 length = std::sqrt(delta.x * delta.x + delta.y * delta.y);
    PointF offset;
    if (length > 0.0f) {
        f32 half = params.width * 0.5f;
        offset = PointF(-delta.y / length * half, delta.x / length * half);
    }

    QuadParams quad;
    quad.positions = {params.start - offset, params.start + offset,
                      params.end + offset, params.end - offset};
    quad.colors.assign(4, params.color);
    return add_quad(quad);
}

bool BatchGeometry::add_rect(f32 x, f32 y, f32 width, f32 height, Color color) {
    QuadParams quad;
    quad.positions = {PointF(x, y), PointF(x + width, y),
                      PointF(x + width, y + height), PointF(x, y + height)};
    quad.colors.assign(4, color);
    quad.tex_coords = {PointF(0, 0), PointF(1, 0), PointF(1, 1), PointF(0, 1)};
    return add_quad(quad);
}

bool BatchGeometry::add_circle(PointF center, f32 radius, Color color, u32 segments) {
    if (!std::isfinite(center.x) || !std::isfinite(center.y)) {
        throw ConfigurationError("Circle center must be finite");
    }
    if (!(radius >= 0.0f) || !std::isfinite(radius)) {
        throw ConfigurationError(format_message("Invalid circle radius {}", radius));
    }
    if (segments < 3) {
        throw ConfigurationError(format_message("A circle needs at least 3 segments, got {}", segments));
    }
    if (!m_buffer.has_space(segments + 1, static_cast<usize>(segments) * 3)) {
        return false;
    }

    auto base = static_cast<u32>(m_buffer.vertex_count());
    m_buffer.add_vertex(make_vertex(center, color, PointF(0.5f, 0.5f)));

    f32 step = 2.0f * std::numbers::pi_v<f32> / static_cast<f32>(segments);
    for (u32 i = 0; i < segments; ++i) {
        f32 angle = step * static_cast<f32>(i);
        f32 cos_a = std::cos(angle);
        f32 sin_a = std::sin(angle);
        PointF position(center.x + cos_a * radius, center.y + sin_a * radius);
        PointF uv(0.5f + cos_a * 0.5f, 0.5f + sin_a * 0.5f);
        m_buffer.add_vertex(make_vertex(position, color, uv));
    }

    for (u32 i = 0; i < segments; ++i) {
        m_buffer.add_index(base);
        m_buffer.add_index(base + 1 + i);
        m_buffer.add_index(base + 1 + (i + 1) % segments);
    }
    return true;
}

} // namespace vellum::render
