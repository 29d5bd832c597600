#include "vellum/codecs/json_decoder.hpp"

namespace vellum::codecs {

ResourceResult<network::ResourcePtr> JsonDecoder::decode(const network::DecodeInput& input) const {
    auto document = nlohmann::json::parse(input.bytes.begin(), input.bytes.end(), nullptr, false);
    if (document.is_discarded()) {
        return make_error(ResourceError::transient("JSON loading failed: malformed document at " + input.url));
    }
    return network::ResourcePtr(std::make_shared<JsonResource>(std::move(document), input.bytes.size()));
}

} // namespace vellum::codecs
