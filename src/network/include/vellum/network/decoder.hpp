#pragma once

#include "http.hpp"
#include "resource.hpp"
#include "vellum/core/error.hpp"
#include <array>
#include <memory>

namespace vellum::network {

struct DecodeInput {
    const std::string& id;
    const std::string& url;
    const HttpHeaders& headers;
    const std::vector<u8>& bytes;
};

/**
 * Turns fetched bytes into a typed payload. Undecodable bytes are reported
 * as TransientIO errors so the loader retries them like a broken download.
 */
class ResourceDecoder {
public:
    virtual ~ResourceDecoder() = default;

    [[nodiscard]] virtual ResourceResult<ResourcePtr> decode(const DecodeInput& input) const = 0;
};

// Audio decoding is supplied by the host; the loader has no built-in codec
class AudioDecoder {
public:
    virtual ~AudioDecoder() = default;

    [[nodiscard]] virtual ResourceResult<std::shared_ptr<AudioResource>>
        decode_audio(const std::vector<u8>& bytes) const = 0;
};

class BinaryDecoder : public ResourceDecoder {
public:
    [[nodiscard]] ResourceResult<ResourcePtr> decode(const DecodeInput& input) const override;
};

class SvgDecoder : public ResourceDecoder {
public:
    [[nodiscard]] ResourceResult<ResourcePtr> decode(const DecodeInput& input) const override;
};

// Adapts an AudioDecoder to the registry
class AudioResourceDecoder : public ResourceDecoder {
public:
    explicit AudioResourceDecoder(std::shared_ptr<AudioDecoder> decoder)
        : m_decoder(std::move(decoder)) {}

    [[nodiscard]] ResourceResult<ResourcePtr> decode(const DecodeInput& input) const override;

private:
    std::shared_ptr<AudioDecoder> m_decoder;
};

/**
 * One decoder per resource type. A type without a decoder is a
 * configuration error, reported without retrying.
 */
class DecoderRegistry {
public:
    // Registry with the binary and svg decoders installed
    [[nodiscard]] static DecoderRegistry with_builtin_decoders();

    void register_decoder(ResourceType type, std::shared_ptr<ResourceDecoder> decoder);
    void set_audio_decoder(std::shared_ptr<AudioDecoder> decoder);
    void unregister_decoder(ResourceType type);

    [[nodiscard]] bool has_decoder(ResourceType type) const;

    [[nodiscard]] ResourceResult<ResourcePtr> decode(ResourceType type,
                                                     const DecodeInput& input) const;

private:
    static constexpr usize TYPE_COUNT = 6;

    std::array<std::shared_ptr<ResourceDecoder>, TYPE_COUNT> m_decoders{};
};

} // namespace vellum::network
