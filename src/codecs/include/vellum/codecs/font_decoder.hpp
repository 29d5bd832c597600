#pragma once

#include "vellum/network/decoder.hpp"
#include <memory>

namespace vellum::codecs {

/**
 * Validates font payloads with FreeType and records face metadata. The
 * font bytes are kept in the resource so a text renderer can open the
 * face again at any pixel size.
 */
class FreeTypeFontDecoder : public network::ResourceDecoder {
public:
    FreeTypeFontDecoder();
    ~FreeTypeFontDecoder() override;

    FreeTypeFontDecoder(const FreeTypeFontDecoder&) = delete;
    FreeTypeFontDecoder& operator=(const FreeTypeFontDecoder&) = delete;

    [[nodiscard]] bool is_available() const;

    [[nodiscard]] ResourceResult<network::ResourcePtr>
        decode(const network::DecodeInput& input) const override;

private:
    struct Data;
    std::unique_ptr<Data> m_data;
};

} // namespace vellum::codecs
