#include "vellum/codecs/image_decoder.hpp"
#include "vellum/core/logger.hpp"
#include <climits>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

namespace vellum::codecs {

ResourceResult<network::ResourcePtr> StbImageDecoder::decode(const network::DecodeInput& input) const {
    if (input.bytes.empty() || input.bytes.size() > static_cast<usize>(INT_MAX)) {
        return make_error(ResourceError::transient("Failed to load texture: " + input.url));
    }

    int width = 0;
    int height = 0;
    int channels = 0;
    stbi_uc* pixels = stbi_load_from_memory(input.bytes.data(), static_cast<int>(input.bytes.size()),
                                            &width, &height, &channels, STBI_rgb_alpha);
    if (!pixels) {
        return make_error(ResourceError::transient(format_message(
            "Failed to load texture: {} ({})", input.url, stbi_failure_reason())));
    }

    usize size = static_cast<usize>(width) * static_cast<usize>(height) * 4;
    std::vector<u8> rgba(pixels, pixels + size);
    stbi_image_free(pixels);

    logging::get("loader").trace_fmt("Decoded {}x{} image ({} source channels) for {}",
                                     width, height, channels, input.id);

    return network::ResourcePtr(std::make_shared<network::ImageResource>(
        static_cast<u32>(width), static_cast<u32>(height), std::move(rgba)));
}

} // namespace vellum::codecs
