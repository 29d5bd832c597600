#pragma once

#include "gpu_context.hpp"
#include "texture_config.hpp"
#include <string>

namespace vellum::gpu {

/**
 * GPU texture owned by a TexturePool.
 *
 * release() only marks the texture free for reuse; the GPU object lives
 * until the pool disposes it during cleanup.
 */
class PooledTexture {
public:
    PooledTexture(std::string id, GpuContext& context, GpuHandle handle,
                  TextureConfig config, f64 now_ms);

    PooledTexture(const PooledTexture&) = delete;
    PooledTexture& operator=(const PooledTexture&) = delete;

    [[nodiscard]] const std::string& id() const { return m_id; }
    [[nodiscard]] GpuHandle handle() const { return m_handle; }
    [[nodiscard]] const TextureConfig& config() const { return m_config; }
    [[nodiscard]] bool in_use() const { return m_in_use; }
    [[nodiscard]] bool is_disposed() const { return m_disposed; }
    [[nodiscard]] usize memory_usage() const { return m_memory_usage; }
    [[nodiscard]] i32 texture_unit() const { return m_texture_unit; }
    [[nodiscard]] f64 created_at() const { return m_created_at; }
    [[nodiscard]] f64 last_used() const { return m_last_used; }
    [[nodiscard]] u32 use_count() const { return m_use_count; }

    void acquire(f64 now_ms);
    void release(f64 now_ms);

    void bind(i32 unit);
    void unbind();

    // Upload width*height*bytes_per_pixel bytes of pixel data
    void update(const u8* pixels, usize size);

    // Reapply sampler state for a request sharing this texture's pool key
    void reconfigure(const TextureConfig& config);

    void dispose();

private:
    std::string m_id;
    GpuContext& m_context;
    GpuHandle m_handle;
    TextureConfig m_config;
    usize m_memory_usage;
    bool m_in_use{false};
    bool m_disposed{false};
    i32 m_texture_unit{-1};
    f64 m_created_at;
    f64 m_last_used;
    u32 m_use_count{0};
};

} // namespace vellum::gpu
