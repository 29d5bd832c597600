/**
 * Batch Renderer implementation
 */

#include "vellum/render/batch_renderer.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"
#include <algorithm>
#include <optional>

namespace vellum::render {

namespace {

Logger& log() {
    return logging::get("batch");
}

} // anonymous namespace

BatchRenderer::BatchRenderer(gpu::GpuContext& context, gpu::TexturePool* pool, BatchBufferConfig config)
    : m_context(context)
    , m_pool(pool)
    , m_buffer(context, config)
    , m_geometry(m_buffer) {}

// ============================================================================
// Submission
// ============================================================================

bool BatchRenderer::process(const Renderable& renderable) {
    const auto& limits = m_buffer.config();
    if (renderable.vertices.size() > limits.max_vertices ||
        renderable.indices.size() > limits.max_indices) {
        log().warn_fmt("Renderable with {} vertices and {} indices exceeds the batch capacity",
                       renderable.vertices.size(), renderable.indices.size());
        return false;
    }
    for (u32 index : renderable.indices) {
        if (index >= renderable.vertices.size()) {
            throw ConfigurationError(format_message(
                "Renderable index {} is outside its {} vertices", index, renderable.vertices.size()));
        }
    }

    // Merge into the first compatible batch that still has room
    auto it = std::find_if(m_batches.begin(), m_batches.end(), [&](const RenderBatch& batch) {
        return batch.key == renderable.key &&
               batch.vertices.size() + renderable.vertices.size() <= limits.max_vertices &&
               batch.indices.size() + renderable.indices.size() <= limits.max_indices;
    });
    if (it == m_batches.end()) {
        m_batches.push_back(RenderBatch{renderable.key, {}, {}});
        it = std::prev(m_batches.end());
    }

    auto base = static_cast<u32>(it->vertices.size());
    it->vertices.insert(it->vertices.end(), renderable.vertices.begin(), renderable.vertices.end());
    it->indices.reserve(it->indices.size() + renderable.indices.size());
    for (u32 index : renderable.indices) {
        it->indices.push_back(base + index);
    }
    return true;
}

template<typename Tessellate>
bool BatchRenderer::submit(const BatchKey& key, Tessellate&& tessellate) {
    m_buffer.clear();
    if (!tessellate(m_geometry)) {
        return false;
    }
    Renderable renderable{key, m_buffer.vertices(), m_buffer.indices()};
    m_buffer.clear();
    return process(renderable);
}

bool BatchRenderer::draw_quad(const QuadParams& params, const BatchKey& key) {
    return submit(key, [&](BatchGeometry& geometry) { return geometry.add_quad(params); });
}

bool BatchRenderer::draw_triangle(const TriangleParams& params, const BatchKey& key) {
    return submit(key, [&](BatchGeometry& geometry) { return geometry.add_triangle(params); });
}

bool BatchRenderer::draw_line(const LineParams& params, const BatchKey& key) {
    return submit(key, [&](BatchGeometry& geometry) { return geometry.add_line(params); });
}

bool BatchRenderer::draw_rect(const RectF& rect, Color color, const BatchKey& key) {
    return submit(key, [&](BatchGeometry& geometry) {
        return geometry.add_rect(rect.x, rect.y, rect.width, rect.height, color);
    });
}

bool BatchRenderer::draw_circle(PointF center, f32 radius, Color color, const BatchKey& key,
                                u32 segments) {
    return submit(key, [&](BatchGeometry& geometry) {
        return geometry.add_circle(center, radius, color, segments);
    });
}

// ============================================================================
// Flush
// ============================================================================

RenderStats BatchRenderer::flush(const gpu::ProjectionMatrix& projection) {
    RenderStats frame;
    if (m_batches.empty()) {
        return frame;
    }
    if (m_buffer.vertex_buffer() == gpu::NULL_HANDLE) {
        log().warn("Flush after dispose ignored");
        m_batches.clear();
        return frame;
    }

    std::stable_sort(m_batches.begin(), m_batches.end(),
        [](const RenderBatch& a, const RenderBatch& b) { return a.key.z_index < b.key.z_index; });

    std::optional<gpu::BlendMode> blend_mode;
    std::optional<u32> program;

    for (const auto& batch : m_batches) {
        if (batch.indices.empty()) {
            continue;
        }
        if (batch.key.texture && batch.key.texture->is_disposed()) {
            log().warn_fmt("Skipping batch bound to disposed texture {}", batch.key.texture->id());
            continue;
        }

        m_buffer.clear();
        for (const auto& vertex : batch.vertices) {
            m_buffer.add_vertex(vertex);
        }
        for (u32 index : batch.indices) {
            m_buffer.add_index(index);
        }
        m_buffer.upload();

        if (blend_mode != batch.key.blend_mode) {
            m_context.set_blend_mode(batch.key.blend_mode);
            blend_mode = batch.key.blend_mode;
        }
        if (program != batch.key.shader) {
            m_context.use_program(batch.key.shader, projection);
            program = batch.key.shader;
        }
        if (batch.key.texture) {
            bind_texture(batch.key.texture);
            ++frame.texture_binds;
        }

        m_context.draw_indexed(m_buffer.vertex_buffer(), m_buffer.index_buffer(),
                               static_cast<u32>(batch.indices.size()));

        ++frame.draw_calls;
        ++frame.batches;
        frame.vertices += batch.vertices.size();
        frame.triangles += batch.indices.size() / 3;
    }

    m_buffer.clear();
    m_batches.clear();

    m_stats.draw_calls += frame.draw_calls;
    m_stats.batches += frame.batches;
    m_stats.vertices += frame.vertices;
    m_stats.triangles += frame.triangles;
    m_stats.texture_binds += frame.texture_binds;

    log().trace_fmt("Flushed {} batches, {} triangles", frame.batches, frame.triangles);
    return frame;
}

void BatchRenderer::bind_texture(const std::shared_ptr<gpu::PooledTexture>& texture) {
    if (texture->texture_unit() >= 0) {
        texture->bind(texture->texture_unit());
        return;
    }

    if (m_pool && m_pool->owns(*texture)) {
        auto& units = m_pool->texture_units();
        if (auto unit = units.allocate_unit()) {
            units.bind_texture(*unit, texture);
            return;
        }
        log().warn_fmt("No texture unit available for {}, using unit 0", texture->id());
    }

    // Transient bind; the texture does not claim unit 0
    m_context.bind_texture(0, texture->handle());
}

void BatchRenderer::dispose() {
    m_batches.clear();
    m_buffer.dispose();
}

} // namespace vellum::render
