#include "vellum/gpu/pooled_texture.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"

namespace vellum::gpu {

PooledTexture::PooledTexture(std::string id, GpuContext& context, GpuHandle handle,
                             TextureConfig config, f64 now_ms)
    : m_id(std::move(id))
    , m_context(context)
    , m_handle(handle)
    , m_config(config)
    , m_memory_usage(texture_memory_usage(config))
    , m_created_at(now_ms)
    , m_last_used(now_ms) {}

void PooledTexture::acquire(f64 now_ms) {
    m_in_use = true;
    ++m_use_count;
    m_last_used = now_ms;
}

void PooledTexture::release(f64 now_ms) {
    m_in_use = false;
    m_last_used = now_ms;
}

void PooledTexture::bind(i32 unit) {
    if (m_disposed) {
        return;
    }
    m_context.bind_texture(unit, m_handle);
    m_texture_unit = unit;
}

void PooledTexture::unbind() {
    if (m_texture_unit < 0) {
        return;
    }
    if (!m_disposed) {
        m_context.bind_texture(m_texture_unit, NULL_HANDLE);
    }
    m_texture_unit = -1;
}

void PooledTexture::update(const u8* pixels, usize size) {
    if (m_disposed) {
        throw ConfigurationError("Cannot update disposed texture " + m_id);
    }
    usize expected = static_cast<usize>(bytes_per_pixel(m_config.format)) *
                     m_config.width * m_config.height;
    if (!pixels || size != expected) {
        throw ConfigurationError(format_message(
            "Texture {} expects {} bytes of pixel data, got {}", m_id, expected, size));
    }
    m_context.upload_texture(m_handle, m_config, pixels);
}

void PooledTexture::reconfigure(const TextureConfig& config) {
    if (m_disposed || config == m_config) {
        return;
    }
    m_config = config;
    m_context.apply_sampler(m_handle, m_config);
}

void PooledTexture::dispose() {
    if (m_disposed) {
        return;
    }
    unbind();
    m_context.delete_texture(m_handle);
    m_disposed = true;
    m_in_use = false;
}

} // namespace vellum::gpu
