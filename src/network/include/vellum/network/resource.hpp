#pragma once

/**
 * Decoded resource payloads
 *
 * Every payload produced by the loader derives from Resource so caches can
 * size it through byte_size() and consumers can recover the concrete type
 * with std::dynamic_pointer_cast.
 */

#include "vellum/core/types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vellum::network {

enum class ResourceType : u8 {
    Texture,
    Font,
    Audio,
    Json,
    Binary,
    Svg,
};

[[nodiscard]] std::string_view to_string(ResourceType type);
[[nodiscard]] std::optional<ResourceType> parse_resource_type(std::string_view name);

class Resource {
public:
    virtual ~Resource() = default;

    [[nodiscard]] virtual ResourceType type() const = 0;
    [[nodiscard]] virtual usize byte_size() const = 0;
};

using ResourcePtr = std::shared_ptr<Resource>;

// ============================================================================
// Built-in payloads
// ============================================================================

// Decoded image, always expanded to 8-bit RGBA
class ImageResource : public Resource {
public:
    ImageResource(u32 width, u32 height, std::vector<u8> pixels)
        : m_width(width), m_height(height), m_pixels(std::move(pixels)) {}

    [[nodiscard]] ResourceType type() const override { return ResourceType::Texture; }
    [[nodiscard]] usize byte_size() const override { return m_pixels.size(); }

    [[nodiscard]] u32 width() const { return m_width; }
    [[nodiscard]] u32 height() const { return m_height; }
    [[nodiscard]] const std::vector<u8>& pixels() const { return m_pixels; }

private:
    u32 m_width;
    u32 m_height;
    std::vector<u8> m_pixels;
};

class FontResource : public Resource {
public:
    FontResource(std::string family, std::string style, u32 glyph_count, std::vector<u8> data)
        : m_family(std::move(family))
        , m_style(std::move(style))
        , m_glyph_count(glyph_count)
        , m_data(std::move(data)) {}

    [[nodiscard]] ResourceType type() const override { return ResourceType::Font; }
    [[nodiscard]] usize byte_size() const override { return m_data.size(); }

    [[nodiscard]] const std::string& family() const { return m_family; }
    [[nodiscard]] const std::string& style() const { return m_style; }
    [[nodiscard]] u32 glyph_count() const { return m_glyph_count; }
    [[nodiscard]] const std::vector<u8>& data() const { return m_data; }

private:
    std::string m_family;
    std::string m_style;
    u32 m_glyph_count;
    std::vector<u8> m_data;
};

// Interleaved float PCM
class AudioResource : public Resource {
public:
    AudioResource(u32 sample_rate, u32 channels, std::vector<f32> samples)
        : m_sample_rate(sample_rate), m_channels(channels), m_samples(std::move(samples)) {}

    [[nodiscard]] ResourceType type() const override { return ResourceType::Audio; }
    [[nodiscard]] usize byte_size() const override { return m_samples.size() * sizeof(f32); }

    [[nodiscard]] u32 sample_rate() const { return m_sample_rate; }
    [[nodiscard]] u32 channels() const { return m_channels; }
    [[nodiscard]] const std::vector<f32>& samples() const { return m_samples; }

    [[nodiscard]] f64 duration_seconds() const {
        if (m_sample_rate == 0 || m_channels == 0) {
            return 0.0;
        }
        return static_cast<f64>(m_samples.size() / m_channels) / m_sample_rate;
    }

private:
    u32 m_sample_rate;
    u32 m_channels;
    std::vector<f32> m_samples;
};

class BinaryResource : public Resource {
public:
    explicit BinaryResource(std::vector<u8> bytes) : m_bytes(std::move(bytes)) {}

    [[nodiscard]] ResourceType type() const override { return ResourceType::Binary; }
    [[nodiscard]] usize byte_size() const override { return m_bytes.size(); }

    [[nodiscard]] const std::vector<u8>& bytes() const { return m_bytes; }

private:
    std::vector<u8> m_bytes;
};

class SvgResource : public Resource {
public:
    explicit SvgResource(std::string markup) : m_markup(std::move(markup)) {}

    [[nodiscard]] ResourceType type() const override { return ResourceType::Svg; }
    [[nodiscard]] usize byte_size() const override { return m_markup.size(); }

    [[nodiscard]] const std::string& markup() const { return m_markup; }

private:
    std::string m_markup;
};

} // namespace vellum::network
