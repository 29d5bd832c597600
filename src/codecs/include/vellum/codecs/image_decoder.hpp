#pragma once

#include "vellum/network/decoder.hpp"

namespace vellum::codecs {

// Decodes PNG, JPEG, BMP, TGA, GIF and PNM payloads to 8-bit RGBA via stb_image
class StbImageDecoder : public network::ResourceDecoder {
public:
    [[nodiscard]] ResourceResult<network::ResourcePtr>
        decode(const network::DecodeInput& input) const override;
};

} // namespace vellum::codecs
