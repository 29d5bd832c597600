/**
 * FreeType font decoder
 */

#include "vellum/codecs/font_decoder.hpp"
#include "vellum/core/logger.hpp"

#include <ft2build.h>
#include FT_FREETYPE_H

namespace vellum::codecs {

struct FreeTypeFontDecoder::Data {
    FT_Library library{nullptr};
};

FreeTypeFontDecoder::FreeTypeFontDecoder() : m_data(std::make_unique<Data>()) {
    if (FT_Init_FreeType(&m_data->library) != 0) {
        m_data->library = nullptr;
        logging::get("loader").error("Failed to initialize FreeType");
    }
}

FreeTypeFontDecoder::~FreeTypeFontDecoder() {
    if (m_data && m_data->library) {
        FT_Done_FreeType(m_data->library);
    }
}

bool FreeTypeFontDecoder::is_available() const {
    return m_data->library != nullptr;
}

ResourceResult<network::ResourcePtr> FreeTypeFontDecoder::decode(const network::DecodeInput& input) const {
    if (!m_data->library) {
        return make_error(ResourceError::configuration("FreeType is not available"));
    }

    FT_Face face = nullptr;
    FT_Error error = FT_New_Memory_Face(m_data->library,
                                        reinterpret_cast<const FT_Byte*>(input.bytes.data()),
                                        static_cast<FT_Long>(input.bytes.size()), 0, &face);
    if (error != 0 || !face) {
        return make_error(ResourceError::transient(format_message(
            "Font loading failed: {} (FreeType error {})", input.url, error)));
    }

    std::string family = face->family_name ? face->family_name : input.id;
    std::string style = face->style_name ? face->style_name : "Regular";
    u32 glyphs = static_cast<u32>(face->num_glyphs);
    FT_Done_Face(face);

    return network::ResourcePtr(std::make_shared<network::FontResource>(
        std::move(family), std::move(style), glyphs, input.bytes));
}

} // namespace vellum::codecs
