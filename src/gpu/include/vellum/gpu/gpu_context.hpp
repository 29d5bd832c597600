#pragma once

#include "texture_config.hpp"
#include "vellum/core/types.hpp"
#include <array>
#include <string_view>

namespace vellum::gpu {

using GpuHandle = u32;

inline constexpr GpuHandle NULL_HANDLE = 0;

enum class BufferTarget : u8 {
    Vertex,
    Index,
};

enum class BlendMode : u8 {
    Normal,
    Add,
    Multiply,
    Screen,
};

[[nodiscard]] std::string_view to_string(BlendMode mode);

// Source and destination factors as OpenGL tokens
struct BlendFunc {
    u32 source;
    u32 destination;

    bool operator==(const BlendFunc& other) const = default;
};

[[nodiscard]] BlendFunc blend_func(BlendMode mode);

// Interleaved vertex layout understood by every context
struct Vertex {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 r{1.0f};
    f32 g{1.0f};
    f32 b{1.0f};
    f32 a{1.0f};
    f32 u{0.0f};
    f32 v{0.0f};
};

static_assert(sizeof(Vertex) == 8 * sizeof(f32), "Vertex must be tightly packed");

// Column-major 3x3 matrix
using ProjectionMatrix = std::array<f32, 9>;

/**
 * GPU capability consumed by the texture pool and batch renderer.
 *
 * Implementations must be called from the thread owning the underlying
 * context. A returned handle of NULL_HANDLE means creation failed.
 */
class GpuContext {
public:
    virtual ~GpuContext() = default;

    // Textures
    [[nodiscard]] virtual GpuHandle create_texture() = 0;
    virtual void define_texture(GpuHandle texture, const TextureConfig& config) = 0;
    virtual void apply_sampler(GpuHandle texture, const TextureConfig& config) = 0;
    virtual void upload_texture(GpuHandle texture, const TextureConfig& config,
                                const u8* pixels) = 0;
    virtual void bind_texture(i32 unit, GpuHandle texture) = 0;
    virtual void delete_texture(GpuHandle texture) = 0;

    // Buffers
    [[nodiscard]] virtual GpuHandle create_buffer(BufferTarget target) = 0;
    virtual void upload_buffer(GpuHandle buffer, BufferTarget target,
                               const void* data, usize bytes) = 0;
    virtual void delete_buffer(GpuHandle buffer) = 0;

    // Draw state
    virtual void set_blend_mode(BlendMode mode) = 0;
    virtual void use_program(u32 program, const ProjectionMatrix& projection) = 0;
    virtual void draw_indexed(GpuHandle vertex_buffer, GpuHandle index_buffer,
                              u32 index_count) = 0;

    // Capabilities
    [[nodiscard]] virtual i32 max_texture_units() const = 0;
};

} // namespace vellum::gpu
