#include "vellum/codecs/codecs.hpp"

namespace vellum::codecs {

void register_default_decoders(network::DecoderRegistry& registry) {
    registry.register_decoder(network::ResourceType::Texture, std::make_shared<StbImageDecoder>());
    registry.register_decoder(network::ResourceType::Font, std::make_shared<FreeTypeFontDecoder>());
    registry.register_decoder(network::ResourceType::Json, std::make_shared<JsonDecoder>());
}

} // namespace vellum::codecs
