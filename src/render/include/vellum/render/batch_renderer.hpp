#pragma once

/**
 * Batch Renderer
 *
 * Groups submitted geometry by render state and issues one draw call per
 * group. Geometry with equal keys is merged by appending vertices and
 * rebasing indices; flush() draws groups in ascending z order.
 */

#include "batch_buffer.hpp"
#include "batch_geometry.hpp"
#include "vellum/gpu/texture_pool.hpp"
#include <memory>
#include <vector>

namespace vellum::render {

struct BatchKey {
    std::shared_ptr<gpu::PooledTexture> texture;  // nullptr draws untextured
    u32 shader{0};
    gpu::BlendMode blend_mode{gpu::BlendMode::Normal};
    i32 z_index{0};

    bool operator==(const BatchKey& other) const = default;
};

struct Renderable {
    BatchKey key;
    std::vector<gpu::Vertex> vertices;
    std::vector<u32> indices;  // relative to this renderable's vertices
};

struct RenderBatch {
    BatchKey key;
    std::vector<gpu::Vertex> vertices;
    std::vector<u32> indices;
};

struct RenderStats {
    usize draw_calls{0};
    usize triangles{0};
    usize vertices{0};
    usize batches{0};
    usize texture_binds{0};
};

class BatchRenderer {
public:
    // Textures owned by pool get a unit from its TextureUnitManager
    BatchRenderer(gpu::GpuContext& context, gpu::TexturePool* pool = nullptr,
                  BatchBufferConfig config = {});

    BatchRenderer(const BatchRenderer&) = delete;
    BatchRenderer& operator=(const BatchRenderer&) = delete;

    // Returns false when the renderable alone exceeds the buffer capacity.
    // Throws ConfigurationError for indices outside its vertex range.
    bool process(const Renderable& renderable);

    // Tessellate a primitive and submit it with the given state
    bool draw_quad(const QuadParams& params, const BatchKey& key = {});
    bool draw_triangle(const TriangleParams& params, const BatchKey& key = {});
    bool draw_line(const LineParams& params, const BatchKey& key = {});
    bool draw_rect(const RectF& rect, Color color, const BatchKey& key = {});
    bool draw_circle(PointF center, f32 radius, Color color, const BatchKey& key = {},
                     u32 segments = 32);

    // Draws every pending batch and clears them; returns this flush's stats
    RenderStats flush(const gpu::ProjectionMatrix& projection);

    [[nodiscard]] const std::vector<RenderBatch>& batches() const { return m_batches; }
    [[nodiscard]] const RenderStats& get_stats() const { return m_stats; }
    void reset_stats() { m_stats = {}; }

    // Drops pending batches without drawing them
    void clear() { m_batches.clear(); }

    void dispose();

private:
    template<typename Tessellate>
    bool submit(const BatchKey& key, Tessellate&& tessellate);

    void bind_texture(const std::shared_ptr<gpu::PooledTexture>& texture);

    gpu::GpuContext& m_context;
    gpu::TexturePool* m_pool;
    BatchBuffer m_buffer;  // tessellation scratch between flushes, upload source during flush
    BatchGeometry m_geometry;
    std::vector<RenderBatch> m_batches;
    RenderStats m_stats;
};

} // namespace vellum::render
