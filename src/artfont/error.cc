//
// Created by igor on 14/01/2026.
//

#include <artfont/error.hh>

namespace artfont {
    std::string_view to_string(error_code code) {
        switch (code) {
            case error_code::parse_error:
                return "parse_error";
            case error_code::invalid_dimensions:
                return "invalid_dimensions";
            case error_code::invalid_glyph_key:
                return "invalid_glyph_key";
            case error_code::glyph_height_mismatch:
                return "glyph_height_mismatch";
            case error_code::empty_font:
                return "empty_font";
            case error_code::missing_text:
                return "missing_text";
        }
        return "unknown";
    }

    art_error::art_error(error_code code, const std::string& message)
        : std::runtime_error(message),
          m_code(code) {
    }

    font_error::font_error(error_code code, const std::string& message,
                           std::optional<char32_t> character)
        : art_error(code, message),
          m_character(character) {
    }
}
