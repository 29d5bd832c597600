#include "vellum/resource/gpu_texture_resource.hpp"
#include "vellum/core/error.hpp"
#include "vellum/core/logger.hpp"

namespace vellum::resource {

GpuTextureResource::~GpuTextureResource() {
    dispose();
}

usize GpuTextureResource::byte_size() const {
    return m_texture ? m_texture->memory_usage() : 0;
}

u32 GpuTextureResource::width() const {
    return m_texture ? m_texture->config().width : 0;
}

u32 GpuTextureResource::height() const {
    return m_texture ? m_texture->config().height : 0;
}

void GpuTextureResource::dispose() {
    if (m_disposed) {
        return;
    }
    m_disposed = true;
    m_pool->release_texture(m_texture);
}

std::shared_ptr<GpuTextureResource> upload_image(gpu::TexturePool& pool,
                                                 const network::ImageResource& image) {
    auto request = gpu::TextureRequest::sized(image.width(), image.height());
    request.format = gpu::TextureFormat::Rgba;
    request.type = gpu::PixelType::UnsignedByte;

    auto texture = pool.get_texture(request);
    try {
        texture->update(image.pixels().data(), image.pixels().size());
    } catch (const ConfigurationError&) {
        pool.release_texture(texture);
        throw;
    }

    logging::get("resource_manager").trace_fmt("Uploaded {}x{} image into texture {}",
                                               image.width(), image.height(), texture->id());
    return std::make_shared<GpuTextureResource>(pool, std::move(texture));
}

} // namespace vellum::resource
