/**
 * @file font_loader.hh
 * @brief Loading and saving block-art fonts as JSON documents.
 *
 * @section loader_format Document Format
 *
 * @code{.json}
 * {
 *   "name": "Tiny",
 *   "width": 3,
 *   "height": 3,
 *   "spacing": 1,
 *   "glyphs": {
 *     "A": ["###", "# #", "# #"],
 *     "\\t": ["   ", "   ", "   "]
 *   }
 * }
 * @endcode
 *
 * | Field | Type | Required | Meaning |
 * |-------|------|----------|---------|
 * | width | integer > 0 | yes | Minimal columns per glyph cell |
 * | height | integer > 0 | yes | Rows per glyph |
 * | spacing | integer >= 0 | no (0) | Blank columns between glyphs |
 * | glyphs | object | yes | Character -> array of `height` rows |
 * | name | string | no | Display name |
 *
 * Glyph keys hold exactly one character. A key may also be one of the
 * escapes `\n`, `\t`, `\r`, `\0`, `\\`, `\"`, `\'` or `\u{HEX}`, which
 * is how save() writes control characters, backslash and quote. Inside
 * JSON text the backslash itself is escaped, so a tab key is written
 * as "\\t".
 *
 * @section loader_errors Errors
 *
 * Every failure throws font_error:
 *
 * | error_code | Cause |
 * |------------|-------|
 * | parse_error | Not JSON, or a field has the wrong type |
 * | invalid_dimensions | width/height missing or not positive |
 * | invalid_glyph_key | Key is not one character or a known escape |
 * | glyph_height_mismatch | Row count differs from height |
 * | empty_font | No glyphs |
 *
 * @section loader_usage Usage
 *
 * @code{.cpp}
 * auto font = font_loader::load_file("fonts/tiny.json");
 * std::cout << render_with_font("ABBA", font) << "\n";
 *
 * font_loader::save(font, "fonts/tiny-copy.json");
 * @endcode
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <artfont/font.hh>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <string>
#include <string_view>

namespace artfont {
    /**
     * @brief Converts between JSON font documents and font objects.
     *
     * All methods are static and free of side effects except for the
     * file based functions, which only read or write the given path.
     */
    struct ARTFONT_EXPORT font_loader {
        /**
         * @brief Build a font from an already parsed document.
         *
         * @param doc JSON document in the format described above
         * @return Validated font
         * @throws font_error on any validation failure
         */
        static font load_document(const nlohmann::json& doc);

        /**
         * @brief Parse JSON text and build a font from it.
         *
         * @param json_text UTF-8 JSON text
         * @throws font_error with error_code::parse_error if the text is not
         *         valid JSON, otherwise as load_document()
         */
        static font load_string(std::string_view json_text);

        /**
         * @brief Read a JSON font file and build a font from it.
         *
         * @param path Path to the font file
         * @throws font_error with error_code::parse_error if the file cannot
         *         be read or parsed
         */
        static font load_file(const std::filesystem::path& path);

        /**
         * @brief Serialize a font into a document that load_document() accepts.
         */
        static nlohmann::json to_document(const font& f);

        /**
         * @brief Write a font to a JSON file that load_file() accepts.
         *
         * @throws std::runtime_error if the file cannot be written
         */
        static void save(const font& f, const std::filesystem::path& path);

        /**
         * @brief Decode a glyph map key into its character.
         *
         * @param key Raw key from the "glyphs" object
         * @throws font_error with error_code::invalid_glyph_key
         */
        static char32_t parse_glyph_key(std::string_view key);

        /**
         * @brief Glyph map key for a character, escaped where needed.
         */
        static std::string glyph_key(char32_t ch);
    };
} // namespace artfont
