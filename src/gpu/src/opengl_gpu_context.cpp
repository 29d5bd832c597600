/**
 * OpenGL GPU Context Implementation
 */

#include "vellum/gpu/opengl_gpu_context.hpp"
#include "vellum/core/logger.hpp"

#include <GL/gl.h>
#include <GL/glext.h>
#include <GL/glx.h>

#include <cstddef>
#include <cstring>
#include <vector>

namespace {

// Entry points past OpenGL 1.1, loaded at runtime
PFNGLACTIVETEXTUREPROC glActiveTexture_ptr = nullptr;
PFNGLGENERATEMIPMAPPROC glGenerateMipmap_ptr = nullptr;
PFNGLGENBUFFERSPROC glGenBuffers_ptr = nullptr;
PFNGLBINDBUFFERPROC glBindBuffer_ptr = nullptr;
PFNGLBUFFERDATAPROC glBufferData_ptr = nullptr;
PFNGLDELETEBUFFERSPROC glDeleteBuffers_ptr = nullptr;
PFNGLUSEPROGRAMPROC glUseProgram_ptr = nullptr;
PFNGLGETUNIFORMLOCATIONPROC glGetUniformLocation_ptr = nullptr;
PFNGLUNIFORMMATRIX3FVPROC glUniformMatrix3fv_ptr = nullptr;
PFNGLVERTEXATTRIBPOINTERPROC glVertexAttribPointer_ptr = nullptr;
PFNGLENABLEVERTEXATTRIBARRAYPROC glEnableVertexAttribArray_ptr = nullptr;

// Attribute locations the batch shaders are linked with
namespace Attrib {
    constexpr GLuint POSITION = 0;
    constexpr GLuint COLOR = 1;
    constexpr GLuint TEX_COORD = 2;
}

constexpr const char* PROJECTION_UNIFORM = "u_projection";

GLenum buffer_target(vellum::gpu::BufferTarget target) {
    return target == vellum::gpu::BufferTarget::Vertex
        ? GL_ARRAY_BUFFER : GL_ELEMENT_ARRAY_BUFFER;
}

} // anonymous namespace

namespace vellum::gpu {

namespace {

Logger& log() {
    return logging::get("gpu");
}

// Copy of the pixels with rows reversed and/or alpha premultiplied
std::vector<u8> prepare_pixels(const TextureConfig& config, const u8* pixels) {
    usize row_bytes = static_cast<usize>(bytes_per_pixel(config.format)) * config.width;
    std::vector<u8> out(row_bytes * config.height);

    for (u32 row = 0; row < config.height; ++row) {
        u32 source_row = config.flip_y ? config.height - 1 - row : row;
        std::memcpy(out.data() + row * row_bytes, pixels + source_row * row_bytes, row_bytes);
    }

    if (config.premultiply_alpha && config.format == TextureFormat::Rgba) {
        for (usize i = 0; i + 3 < out.size(); i += 4) {
            u32 alpha = out[i + 3];
            out[i] = static_cast<u8>((out[i] * alpha + 127) / 255);
            out[i + 1] = static_cast<u8>((out[i + 1] * alpha + 127) / 255);
            out[i + 2] = static_cast<u8>((out[i + 2] * alpha + 127) / 255);
        }
    }
    return out;
}

} // anonymous namespace

// ============================================================================
// Creation
// ============================================================================

std::unique_ptr<OpenGLGpuContext> OpenGLGpuContext::create() {
    if (!glXGetCurrentContext()) {
        log().error("No current OpenGL context");
        return nullptr;
    }

    std::unique_ptr<OpenGLGpuContext> context(new OpenGLGpuContext());
    if (!context->load_functions()) {
        return nullptr;
    }

    GLint units = 0;
    glGetIntegerv(GL_MAX_TEXTURE_IMAGE_UNITS, &units);
    context->m_max_texture_units = units;
    log().info_fmt("OpenGL context ready, {} texture units", units);
    return context;
}

bool OpenGLGpuContext::load_functions() {
    #define LOAD_GL_FUNCTION(type, name) \
        name##_ptr = reinterpret_cast<type>( \
            glXGetProcAddressARB(reinterpret_cast<const GLubyte*>(#name)))

    LOAD_GL_FUNCTION(PFNGLACTIVETEXTUREPROC, glActiveTexture);
    LOAD_GL_FUNCTION(PFNGLGENERATEMIPMAPPROC, glGenerateMipmap);
    LOAD_GL_FUNCTION(PFNGLGENBUFFERSPROC, glGenBuffers);
    LOAD_GL_FUNCTION(PFNGLBINDBUFFERPROC, glBindBuffer);
    LOAD_GL_FUNCTION(PFNGLBUFFERDATAPROC, glBufferData);
    LOAD_GL_FUNCTION(PFNGLDELETEBUFFERSPROC, glDeleteBuffers);
    LOAD_GL_FUNCTION(PFNGLUSEPROGRAMPROC, glUseProgram);
    LOAD_GL_FUNCTION(PFNGLGETUNIFORMLOCATIONPROC, glGetUniformLocation);
    LOAD_GL_FUNCTION(PFNGLUNIFORMMATRIX3FVPROC, glUniformMatrix3fv);
    LOAD_GL_FUNCTION(PFNGLVERTEXATTRIBPOINTERPROC, glVertexAttribPointer);
    LOAD_GL_FUNCTION(PFNGLENABLEVERTEXATTRIBARRAYPROC, glEnableVertexAttribArray);

    #undef LOAD_GL_FUNCTION

    if (!glActiveTexture_ptr || !glGenBuffers_ptr || !glBindBuffer_ptr ||
        !glBufferData_ptr || !glDeleteBuffers_ptr || !glUseProgram_ptr ||
        !glVertexAttribPointer_ptr || !glEnableVertexAttribArray_ptr) {
        log().error("Failed to load critical OpenGL functions");
        return false;
    }
    return true;
}

// ============================================================================
// Textures
// ============================================================================

GpuHandle OpenGLGpuContext::create_texture() {
    GLuint texture = 0;
    glGenTextures(1, &texture);
    return texture;
}

void OpenGLGpuContext::define_texture(GpuHandle texture, const TextureConfig& config) {
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexImage2D(GL_TEXTURE_2D, 0, static_cast<GLint>(config.format),
                 static_cast<GLsizei>(config.width), static_cast<GLsizei>(config.height), 0,
                 static_cast<GLenum>(config.format), static_cast<GLenum>(config.type), nullptr);
    apply_sampler(texture, config);
}

void OpenGLGpuContext::apply_sampler(GpuHandle texture, const TextureConfig& config) {
    glBindTexture(GL_TEXTURE_2D, texture);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, static_cast<GLint>(config.wrap_s));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, static_cast<GLint>(config.wrap_t));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, static_cast<GLint>(config.min_filter));
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, static_cast<GLint>(config.mag_filter));
}

void OpenGLGpuContext::upload_texture(GpuHandle texture, const TextureConfig& config,
                                      const u8* pixels) {
    if (!pixels) {
        return;
    }

    auto prepared = prepare_pixels(config, pixels);

    glBindTexture(GL_TEXTURE_2D, texture);
    glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
    glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0,
                    static_cast<GLsizei>(config.width), static_cast<GLsizei>(config.height),
                    static_cast<GLenum>(config.format), static_cast<GLenum>(config.type),
                    prepared.data());

    if (config.generate_mipmaps && glGenerateMipmap_ptr) {
        glGenerateMipmap_ptr(GL_TEXTURE_2D);
    }
}

void OpenGLGpuContext::bind_texture(i32 unit, GpuHandle texture) {
    glActiveTexture_ptr(GL_TEXTURE0 + static_cast<GLenum>(unit));
    glBindTexture(GL_TEXTURE_2D, texture);
}

void OpenGLGpuContext::delete_texture(GpuHandle texture) {
    if (texture != NULL_HANDLE) {
        GLuint handle = texture;
        glDeleteTextures(1, &handle);
    }
}

// ============================================================================
// Buffers
// ============================================================================

GpuHandle OpenGLGpuContext::create_buffer(BufferTarget target) {
    (void)target;
    GLuint buffer = 0;
    glGenBuffers_ptr(1, &buffer);
    return buffer;
}

void OpenGLGpuContext::upload_buffer(GpuHandle buffer, BufferTarget target,
                                     const void* data, usize bytes) {
    GLenum gl_target = buffer_target(target);
    glBindBuffer_ptr(gl_target, buffer);
    glBufferData_ptr(gl_target, static_cast<GLsizeiptr>(bytes), data, GL_DYNAMIC_DRAW);
}

void OpenGLGpuContext::delete_buffer(GpuHandle buffer) {
    if (buffer != NULL_HANDLE) {
        GLuint handle = buffer;
        glDeleteBuffers_ptr(1, &handle);
    }
}

// ============================================================================
// Draw state
// ============================================================================

void OpenGLGpuContext::set_blend_mode(BlendMode mode) {
    if (!m_blend_enabled) {
        glEnable(GL_BLEND);
        m_blend_enabled = true;
    }
    auto func = blend_func(mode);
    glBlendFunc(func.source, func.destination);
}

void OpenGLGpuContext::use_program(u32 program, const ProjectionMatrix& projection) {
    glUseProgram_ptr(program);
    if (program == 0 || !glGetUniformLocation_ptr || !glUniformMatrix3fv_ptr) {
        return;
    }
    GLint location = glGetUniformLocation_ptr(program, PROJECTION_UNIFORM);
    if (location >= 0) {
        glUniformMatrix3fv_ptr(location, 1, GL_FALSE, projection.data());
    }
}

void OpenGLGpuContext::draw_indexed(GpuHandle vertex_buffer, GpuHandle index_buffer,
                                    u32 index_count) {
    glBindBuffer_ptr(GL_ARRAY_BUFFER, vertex_buffer);
    glBindBuffer_ptr(GL_ELEMENT_ARRAY_BUFFER, index_buffer);

    constexpr GLsizei stride = sizeof(Vertex);
    glEnableVertexAttribArray_ptr(Attrib::POSITION);
    glVertexAttribPointer_ptr(Attrib::POSITION, 2, GL_FLOAT, GL_FALSE, stride,
                              reinterpret_cast<const void*>(offsetof(Vertex, x)));
    glEnableVertexAttribArray_ptr(Attrib::COLOR);
    glVertexAttribPointer_ptr(Attrib::COLOR, 4, GL_FLOAT, GL_FALSE, stride,
                              reinterpret_cast<const void*>(offsetof(Vertex, r)));
    glEnableVertexAttribArray_ptr(Attrib::TEX_COORD);
    glVertexAttribPointer_ptr(Attrib::TEX_COORD, 2, GL_FLOAT, GL_FALSE, stride,
                              reinterpret_cast<const void*>(offsetof(Vertex, u)));

    glDrawElements(GL_TRIANGLES, static_cast<GLsizei>(index_count), GL_UNSIGNED_INT, nullptr);
}

} // namespace vellum::gpu
