#pragma once

#include "vellum/network/decoder.hpp"
#include <nlohmann/json.hpp>

namespace vellum::codecs {

class JsonResource : public network::Resource {
public:
    JsonResource(nlohmann::json document, usize source_size)
        : m_document(std::move(document)), m_source_size(source_size) {}

    [[nodiscard]] network::ResourceType type() const override { return network::ResourceType::Json; }

    // Sized by the source text
    [[nodiscard]] usize byte_size() const override { return m_source_size; }

    [[nodiscard]] const nlohmann::json& document() const { return m_document; }

private:
    nlohmann::json m_document;
    usize m_source_size;
};

class JsonDecoder : public network::ResourceDecoder {
public:
    [[nodiscard]] ResourceResult<network::ResourcePtr>
        decode(const network::DecodeInput& input) const override;
};

} // namespace vellum::codecs
