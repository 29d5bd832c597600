#include <gtest/gtest.h>
#include "vellum/gpu/gpu_context.hpp"
#include "vellum/gpu/texture_config.hpp"

using namespace vellum;
using namespace vellum::gpu;

TEST(TextureConfigTest, NormalizeFillsDefaults) {
    TextureConfig config = normalize({});

    EXPECT_EQ(config.width, 256u);
    EXPECT_EQ(config.height, 256u);
    EXPECT_EQ(config.format, TextureFormat::Rgba);
    EXPECT_EQ(config.type, PixelType::UnsignedByte);
    EXPECT_TRUE(config.generate_mipmaps);
    EXPECT_EQ(config.wrap_s, TextureWrap::ClampToEdge);
    EXPECT_EQ(config.wrap_t, TextureWrap::ClampToEdge);
    EXPECT_EQ(config.min_filter, TextureFilter::LinearMipmapLinear);
    EXPECT_EQ(config.mag_filter, TextureFilter::Linear);
    EXPECT_FALSE(config.premultiply_alpha);
    EXPECT_TRUE(config.flip_y);
}

TEST(TextureConfigTest, NormalizeKeepsOverrides) {
    TextureRequest request = TextureRequest::sized(64, 32);
    request.format = TextureFormat::Alpha;
    request.generate_mipmaps = false;

    TextureConfig config = normalize(request);
    EXPECT_EQ(config.width, 64u);
    EXPECT_EQ(config.height, 32u);
    EXPECT_EQ(config.format, TextureFormat::Alpha);
    EXPECT_FALSE(config.generate_mipmaps);
}

TEST(TextureConfigTest, BytesPerPixel) {
    EXPECT_EQ(bytes_per_pixel(TextureFormat::Rgba), 4u);
    EXPECT_EQ(bytes_per_pixel(TextureFormat::Rgb), 3u);
    EXPECT_EQ(bytes_per_pixel(TextureFormat::LuminanceAlpha), 2u);
    EXPECT_EQ(bytes_per_pixel(TextureFormat::Luminance), 1u);
    EXPECT_EQ(bytes_per_pixel(TextureFormat::Alpha), 1u);
}

TEST(TextureConfigTest, MemoryUsageIncludesMipChain) {
    TextureConfig mipmapped = normalize({});
    EXPECT_EQ(texture_memory_usage(mipmapped), 348652u);

    TextureRequest request = TextureRequest::sized(64, 64);
    request.format = TextureFormat::Rgb;
    request.generate_mipmaps = false;
    EXPECT_EQ(texture_memory_usage(normalize(request)), 12288u);
}

TEST(TextureConfigTest, SizeCategoryUsesLongestSide) {
    EXPECT_EQ(size_category(normalize(TextureRequest::sized(128, 16))), SizeCategory::Small);
    EXPECT_EQ(size_category(normalize(TextureRequest::sized(16, 129))), SizeCategory::Medium);
    EXPECT_EQ(size_category(normalize(TextureRequest::sized(512, 512))), SizeCategory::Medium);
    EXPECT_EQ(size_category(normalize(TextureRequest::sized(1024, 2))), SizeCategory::Large);
    EXPECT_EQ(size_category(normalize(TextureRequest::sized(1025, 2))), SizeCategory::XLarge);
}

TEST(TextureConfigTest, PoolKeyIgnoresSamplerState) {
    TextureRequest linear = TextureRequest::sized(256, 256);
    TextureRequest nearest = TextureRequest::sized(256, 256);
    nearest.mag_filter = TextureFilter::Nearest;

    EXPECT_EQ(pool_key(normalize(linear)), "256x256_RGBA_UNSIGNED_BYTE_mip");
    EXPECT_EQ(pool_key(normalize(linear)), pool_key(normalize(nearest)));

    linear.generate_mipmaps = false;
    EXPECT_EQ(pool_key(normalize(linear)), "256x256_RGBA_UNSIGNED_BYTE_nomip");
}

TEST(BlendModeTest, BlendFunctions) {
    EXPECT_EQ(blend_func(BlendMode::Normal), (BlendFunc{0x0302, 0x0303}));
    EXPECT_EQ(blend_func(BlendMode::Add), (BlendFunc{0x0302, 1}));
    EXPECT_EQ(blend_func(BlendMode::Multiply), (BlendFunc{0x0306, 0}));
    EXPECT_EQ(blend_func(BlendMode::Screen), (BlendFunc{0x0307, 1}));
}
