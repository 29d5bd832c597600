#include "vellum/gpu/texture_config.hpp"
#include <algorithm>
#include <cmath>

namespace vellum::gpu {

std::string_view to_string(TextureFormat format) {
    switch (format) {
        case TextureFormat::Alpha: return "ALPHA";
        case TextureFormat::Rgb: return "RGB";
        case TextureFormat::Rgba: return "RGBA";
        case TextureFormat::Luminance: return "LUMINANCE";
        case TextureFormat::LuminanceAlpha: return "LUMINANCE_ALPHA";
    }
    return "UNKNOWN";
}

std::string_view to_string(PixelType type) {
    switch (type) {
        case PixelType::UnsignedByte: return "UNSIGNED_BYTE";
        case PixelType::Float: return "FLOAT";
    }
    return "UNKNOWN";
}

u32 bytes_per_pixel(TextureFormat format) {
    switch (format) {
        case TextureFormat::Rgba: return 4;
        case TextureFormat::Rgb: return 3;
        case TextureFormat::LuminanceAlpha: return 2;
        case TextureFormat::Alpha:
        case TextureFormat::Luminance: return 1;
    }
    return 4;
}

TextureConfig normalize(const TextureRequest& request) {
    TextureConfig config;
    config.width = request.width.value_or(config.width);
    config.height = request.height.value_or(config.height);
    config.format = request.format.value_or(config.format);
    config.type = request.type.value_or(config.type);
    config.generate_mipmaps = request.generate_mipmaps.value_or(config.generate_mipmaps);
    config.wrap_s = request.wrap_s.value_or(config.wrap_s);
    config.wrap_t = request.wrap_t.value_or(config.wrap_t);
    config.min_filter = request.min_filter.value_or(config.min_filter);
    config.mag_filter = request.mag_filter.value_or(config.mag_filter);
    config.premultiply_alpha = request.premultiply_alpha.value_or(config.premultiply_alpha);
    config.flip_y = request.flip_y.value_or(config.flip_y);
    return config;
}

usize texture_memory_usage(const TextureConfig& config) {
    f64 bytes = static_cast<f64>(bytes_per_pixel(config.format)) *
                static_cast<f64>(config.width) * static_cast<f64>(config.height);
    if (config.generate_mipmaps) {
        bytes *= 1.33;
    }
    return static_cast<usize>(std::ceil(bytes));
}

SizeCategory size_category(const TextureConfig& config) {
    u32 side = std::max(config.width, config.height);
    if (side <= 128) return SizeCategory::Small;
    if (side <= 512) return SizeCategory::Medium;
    if (side <= 1024) return SizeCategory::Large;
    return SizeCategory::XLarge;
}

std::string_view to_string(SizeCategory category) {
    switch (category) {
        case SizeCategory::Small: return "small";
        case SizeCategory::Medium: return "medium";
        case SizeCategory::Large: return "large";
        case SizeCategory::XLarge: return "xlarge";
    }
    return "unknown";
}

std::string pool_key(const TextureConfig& config) {
    std::string key = std::to_string(config.width);
    key += "x";
    key += std::to_string(config.height);
    key += "_";
    key += to_string(config.format);
    key += "_";
    key += to_string(config.type);
    key += config.generate_mipmaps ? "_mip" : "_nomip";
    return key;
}

} // namespace vellum::gpu
