#pragma once

#include "vellum/gpu/gpu_context.hpp"
#include <vector>

namespace vellum::render {

struct BatchBufferConfig {
    /// @brief Vertex capacity of one upload
    usize max_vertices{10000};

    /// @brief Index capacity of one upload
    usize max_indices{15000};
};

/**
 * CPU staging storage for one draw call plus the GPU buffers it is
 * uploaded into. Capacity is fixed at construction.
 */
class BatchBuffer {
public:
    // Throws ConfigurationError when the context cannot create the buffers
    BatchBuffer(gpu::GpuContext& context, BatchBufferConfig config = {});
    ~BatchBuffer();

    BatchBuffer(const BatchBuffer&) = delete;
    BatchBuffer& operator=(const BatchBuffer&) = delete;

    // Throws CapacityError when full, ConfigurationError for non-finite data
    void add_vertex(const gpu::Vertex& vertex);

    // Throws ConfigurationError for indices outside [0, max_vertices)
    void add_index(u32 index);

    [[nodiscard]] bool has_space(usize vertices, usize indices) const;

    [[nodiscard]] usize vertex_count() const { return m_vertices.size(); }
    [[nodiscard]] usize index_count() const { return m_indices.size(); }
    [[nodiscard]] const std::vector<gpu::Vertex>& vertices() const { return m_vertices; }
    [[nodiscard]] const std::vector<u32>& indices() const { return m_indices; }
    [[nodiscard]] const BatchBufferConfig& config() const { return m_config; }

    [[nodiscard]] gpu::GpuHandle vertex_buffer() const { return m_vertex_buffer; }
    [[nodiscard]] gpu::GpuHandle index_buffer() const { return m_index_buffer; }

    // Copy the staged data into the GPU buffers
    void upload();
    void clear();
    void dispose();

private:
    gpu::GpuContext& m_context;
    BatchBufferConfig m_config;
    std::vector<gpu::Vertex> m_vertices;
    std::vector<u32> m_indices;
    gpu::GpuHandle m_vertex_buffer{gpu::NULL_HANDLE};
    gpu::GpuHandle m_index_buffer{gpu::NULL_HANDLE};
};

} // namespace vellum::render
