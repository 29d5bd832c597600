#pragma once

#include "vellum/core/disposable.hpp"
#include "vellum/gpu/texture_pool.hpp"
#include "vellum/network/resource.hpp"
#include <memory>

namespace vellum::resource {

/**
 * Decoded image living in a pooled GPU texture. Disposing hands the
 * texture back to its pool for reuse; the pool decides when the GPU
 * object is destroyed.
 */
class GpuTextureResource : public network::Resource, public Disposable {
public:
    GpuTextureResource(gpu::TexturePool& pool, std::shared_ptr<gpu::PooledTexture> texture)
        : m_pool(&pool), m_texture(std::move(texture)) {}

    ~GpuTextureResource() override;

    [[nodiscard]] network::ResourceType type() const override { return network::ResourceType::Texture; }
    [[nodiscard]] usize byte_size() const override;

    [[nodiscard]] const std::shared_ptr<gpu::PooledTexture>& texture() const { return m_texture; }
    [[nodiscard]] u32 width() const;
    [[nodiscard]] u32 height() const;

    void dispose() override;
    [[nodiscard]] bool is_disposed() const override { return m_disposed; }

private:
    gpu::TexturePool* m_pool;
    std::shared_ptr<gpu::PooledTexture> m_texture;
    bool m_disposed{false};
};

// Copies an RGBA image into a texture taken from the pool.
// Throws CapacityError or ConfigurationError from the pool.
[[nodiscard]] std::shared_ptr<GpuTextureResource> upload_image(gpu::TexturePool& pool,
                                                               const network::ImageResource& image);

} // namespace vellum::resource
