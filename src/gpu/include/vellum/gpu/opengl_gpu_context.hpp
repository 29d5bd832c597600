#pragma once

/**
 * OpenGL GPU Context
 *
 * GpuContext backed by the OpenGL context current on the calling thread.
 * Entry points beyond OpenGL 1.1 are resolved through GLX at creation.
 */

#include "gpu_context.hpp"
#include <memory>

namespace vellum::gpu {

class OpenGLGpuContext : public GpuContext {
public:
    // Returns nullptr when no context is current or entry points are missing
    [[nodiscard]] static std::unique_ptr<OpenGLGpuContext> create();

    ~OpenGLGpuContext() override = default;

    [[nodiscard]] GpuHandle create_texture() override;
    void define_texture(GpuHandle texture, const TextureConfig& config) override;
    void apply_sampler(GpuHandle texture, const TextureConfig& config) override;
    void upload_texture(GpuHandle texture, const TextureConfig& config,
                        const u8* pixels) override;
    void bind_texture(i32 unit, GpuHandle texture) override;
    void delete_texture(GpuHandle texture) override;

    [[nodiscard]] GpuHandle create_buffer(BufferTarget target) override;
    void upload_buffer(GpuHandle buffer, BufferTarget target,
                       const void* data, usize bytes) override;
    void delete_buffer(GpuHandle buffer) override;

    void set_blend_mode(BlendMode mode) override;
    void use_program(u32 program, const ProjectionMatrix& projection) override;
    void draw_indexed(GpuHandle vertex_buffer, GpuHandle index_buffer,
                      u32 index_count) override;

    [[nodiscard]] i32 max_texture_units() const override { return m_max_texture_units; }

private:
    OpenGLGpuContext() = default;

    bool load_functions();

    i32 m_max_texture_units{0};
    bool m_blend_enabled{false};
};

} // namespace vellum::gpu
