#include "vellum/render/batch_buffer.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"
#include <cmath>

namespace vellum::render {

BatchBuffer::BatchBuffer(gpu::GpuContext& context, BatchBufferConfig config)
    : m_context(context), m_config(config) {
    m_vertices.reserve(m_config.max_vertices);
    m_indices.reserve(m_config.max_indices);

    m_vertex_buffer = m_context.create_buffer(gpu::BufferTarget::Vertex);
    m_index_buffer = m_context.create_buffer(gpu::BufferTarget::Index);
    if (m_vertex_buffer == gpu::NULL_HANDLE || m_index_buffer == gpu::NULL_HANDLE) {
        dispose();
        throw ConfigurationError("Failed to create batch vertex/index buffers");
    }
}

BatchBuffer::~BatchBuffer() {
    dispose();
}

void BatchBuffer::add_vertex(const gpu::Vertex& vertex) {
    if (m_vertices.size() >= m_config.max_vertices) {
        throw CapacityError(format_message("Batch buffer vertex capacity ({}) exceeded",
                                           m_config.max_vertices));
    }
    if (!std::isfinite(vertex.x) || !std::isfinite(vertex.y)) {
        throw ConfigurationError("Vertex position must be finite");
    }
    m_vertices.push_back(vertex);
}

void BatchBuffer::add_index(u32 index) {
    if (index >= m_config.max_vertices) {
        throw ConfigurationError(format_message("Index {} is outside [0, {})",
                                                index, m_config.max_vertices));
    }
    if (m_indices.size() >= m_config.max_indices) {
        throw CapacityError(format_message("Batch buffer index capacity ({}) exceeded",
                                           m_config.max_indices));
    }
    m_indices.push_back(index);
}

bool BatchBuffer::has_space(usize vertices, usize indices) const {
    return m_vertices.size() + vertices <= m_config.max_vertices &&
           m_indices.size() + indices <= m_config.max_indices;
}

void BatchBuffer::upload() {
    if (m_vertex_buffer == gpu::NULL_HANDLE) {
        return;
    }
    m_context.upload_buffer(m_vertex_buffer, gpu::BufferTarget::Vertex,
                            m_vertices.data(), m_vertices.size() * sizeof(gpu::Vertex));
    m_context.upload_buffer(m_index_buffer, gpu::BufferTarget::Index,
                            m_indices.data(), m_indices.size() * sizeof(u32));
}

void BatchBuffer::clear() {
    m_vertices.clear();
    m_indices.clear();
}

void BatchBuffer::dispose() {
    if (m_vertex_buffer != gpu::NULL_HANDLE) {
        m_context.delete_buffer(m_vertex_buffer);
        m_vertex_buffer = gpu::NULL_HANDLE;
    }
    if (m_index_buffer != gpu::NULL_HANDLE) {
        m_context.delete_buffer(m_index_buffer);
        m_index_buffer = gpu::NULL_HANDLE;
    }
    clear();
}

} // namespace vellum::render
