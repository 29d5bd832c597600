#include "vellum/network/decoder.hpp"
#include <algorithm>

namespace vellum::network {

// ============================================================================
// ResourceType
// ============================================================================

std::string_view to_string(ResourceType type) {
    switch (type) {
        case ResourceType::Texture: return "texture";
        case ResourceType::Font: return "font";
        case ResourceType::Audio: return "audio";
        case ResourceType::Json: return "json";
        case ResourceType::Binary: return "binary";
        case ResourceType::Svg: return "svg";
    }
    return "binary";
}

std::optional<ResourceType> parse_resource_type(std::string_view name) {
    for (auto type : {ResourceType::Texture, ResourceType::Font, ResourceType::Audio,
                      ResourceType::Json, ResourceType::Binary, ResourceType::Svg}) {
        if (to_string(type) == name) {
            return type;
        }
    }
    return std::nullopt;
}

// ============================================================================
// Built-in decoders
// ============================================================================

ResourceResult<ResourcePtr> BinaryDecoder::decode(const DecodeInput& input) const {
    return ResourcePtr(std::make_shared<BinaryResource>(input.bytes));
}

ResourceResult<ResourcePtr> SvgDecoder::decode(const DecodeInput& input) const {
    std::string markup(input.bytes.begin(), input.bytes.end());
    if (markup.find("<svg") == std::string::npos) {
        return make_error(ResourceError::transient("SVG payload has no <svg> element: " + input.url));
    }
    return ResourcePtr(std::make_shared<SvgResource>(std::move(markup)));
}

ResourceResult<ResourcePtr> AudioResourceDecoder::decode(const DecodeInput& input) const {
    if (!m_decoder) {
        return make_error(ResourceError::configuration("No audio decoder available"));
    }
    auto decoded = m_decoder->decode_audio(input.bytes);
    if (!decoded) {
        return make_error(decoded.error());
    }
    return ResourcePtr(decoded.value());
}

// ============================================================================
// DecoderRegistry
// ============================================================================

DecoderRegistry DecoderRegistry::with_builtin_decoders() {
    DecoderRegistry registry;
    registry.register_decoder(ResourceType::Binary, std::make_shared<BinaryDecoder>());
    registry.register_decoder(ResourceType::Svg, std::make_shared<SvgDecoder>());
    return registry;
}

void DecoderRegistry::register_decoder(ResourceType type, std::shared_ptr<ResourceDecoder> decoder) {
    m_decoders[static_cast<usize>(type)] = std::move(decoder);
}

void DecoderRegistry::set_audio_decoder(std::shared_ptr<AudioDecoder> decoder) {
    register_decoder(ResourceType::Audio, std::make_shared<AudioResourceDecoder>(std::move(decoder)));
}

void DecoderRegistry::unregister_decoder(ResourceType type) {
    m_decoders[static_cast<usize>(type)].reset();
}

bool DecoderRegistry::has_decoder(ResourceType type) const {
    return m_decoders[static_cast<usize>(type)] != nullptr;
}

ResourceResult<ResourcePtr> DecoderRegistry::decode(ResourceType type,
                                                    const DecodeInput& input) const {
    const auto& decoder = m_decoders[static_cast<usize>(type)];
    if (!decoder) {
        return make_error(ResourceError::configuration(
            "Unsupported resource type: " + std::string(to_string(type))));
    }
    return decoder->decode(input);
}

} // namespace vellum::network
