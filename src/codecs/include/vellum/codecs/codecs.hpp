#pragma once

#include "font_decoder.hpp"
#include "image_decoder.hpp"
#include "json_decoder.hpp"

namespace vellum::codecs {

// Installs the texture, font and json decoders
void register_default_decoders(network::DecoderRegistry& registry);

} // namespace vellum::codecs
