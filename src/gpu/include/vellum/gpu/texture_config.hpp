#pragma once

/**
 * Texture configuration
 *
 * Describes GPU texture storage. Enum values are the OpenGL tokens so a
 * configuration can be handed to the driver without translation.
 */

#include "vellum/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace vellum::gpu {

enum class TextureFormat : u32 {
    Alpha = 0x1906,
    Rgb = 0x1907,
    Rgba = 0x1908,
    Luminance = 0x1909,
    LuminanceAlpha = 0x190A,
};

enum class PixelType : u32 {
    UnsignedByte = 0x1401,
    Float = 0x1406,
};

enum class TextureFilter : u32 {
    Nearest = 0x2600,
    Linear = 0x2601,
    NearestMipmapNearest = 0x2700,
    LinearMipmapNearest = 0x2701,
    NearestMipmapLinear = 0x2702,
    LinearMipmapLinear = 0x2703,
};

enum class TextureWrap : u32 {
    Repeat = 0x2901,
    ClampToEdge = 0x812F,
    MirroredRepeat = 0x8370,
};

[[nodiscard]] std::string_view to_string(TextureFormat format);
[[nodiscard]] std::string_view to_string(PixelType type);

// Bytes per pixel for 8-bit channels
[[nodiscard]] u32 bytes_per_pixel(TextureFormat format);

struct TextureConfig {
    u32 width{256};
    u32 height{256};
    TextureFormat format{TextureFormat::Rgba};
    PixelType type{PixelType::UnsignedByte};
    bool generate_mipmaps{true};
    TextureWrap wrap_s{TextureWrap::ClampToEdge};
    TextureWrap wrap_t{TextureWrap::ClampToEdge};
    TextureFilter min_filter{TextureFilter::LinearMipmapLinear};
    TextureFilter mag_filter{TextureFilter::Linear};
    bool premultiply_alpha{false};
    bool flip_y{true};

    bool operator==(const TextureConfig& other) const = default;
};

// Partial configuration; unset fields take TextureConfig defaults
struct TextureRequest {
    std::optional<u32> width;
    std::optional<u32> height;
    std::optional<TextureFormat> format;
    std::optional<PixelType> type;
    std::optional<bool> generate_mipmaps;
    std::optional<TextureWrap> wrap_s;
    std::optional<TextureWrap> wrap_t;
    std::optional<TextureFilter> min_filter;
    std::optional<TextureFilter> mag_filter;
    std::optional<bool> premultiply_alpha;
    std::optional<bool> flip_y;

    static TextureRequest sized(u32 width, u32 height) {
        TextureRequest request;
        request.width = width;
        request.height = height;
        return request;
    }
};

[[nodiscard]] TextureConfig normalize(const TextureRequest& request);

// bytes_per_pixel * width * height, times 1.33 with mipmaps, rounded up
[[nodiscard]] usize texture_memory_usage(const TextureConfig& config);

enum class SizeCategory : u8 {
    Small = 0,   // max side <= 128
    Medium = 1,  // <= 512
    Large = 2,   // <= 1024
    XLarge = 3,
};

inline constexpr usize SIZE_CATEGORY_COUNT = 4;

[[nodiscard]] SizeCategory size_category(const TextureConfig& config);
[[nodiscard]] std::string_view to_string(SizeCategory category);

// "<w>x<h>_<format>_<type>_mip|nomip"; reuse requires exact equality
[[nodiscard]] std::string pool_key(const TextureConfig& config);

} // namespace vellum::gpu
