/**
 * @file error.hh
 * @brief Error codes and exception types raised by artfont.
 *
 * Font loading and configuration building report failures by throwing.
 * Every exception derives from art_error, which carries an error_code
 * so callers can react to the reason without parsing messages.
 *
 * @code{.cpp}
 * try {
 *     auto font = font_loader::load_file("big.json");
 * } catch (const font_error& e) {
 *     if (e.code() == error_code::glyph_height_mismatch) {
 *         std::cerr << "bad glyph U+" << std::hex
 *                   << static_cast<std::uint32_t>(*e.character()) << "\n";
 *     }
 * }
 * @endcode
 *
 * Rendering itself never throws for content reasons: characters missing
 * from a font are rendered as blank cells.
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace artfont {
    /**
     * @brief Reason of a failure.
     */
    enum class error_code {
        parse_error,           ///< Document malformed or of the wrong shape
        invalid_dimensions,    ///< width/height missing or not positive
        invalid_glyph_key,     ///< Glyph key is not exactly one character
        glyph_height_mismatch, ///< Glyph row count differs from font height
        empty_font,            ///< Glyph map has no entries
        missing_text           ///< art_builder::build() called without text
    };

    /**
     * @brief Stable lowercase name of an error code (e.g. "empty_font").
     */
    ARTFONT_EXPORT std::string_view to_string(error_code code);

    /**
     * @brief Base exception of the library.
     */
    class ARTFONT_EXPORT art_error : public std::runtime_error {
    public:
        art_error(error_code code, const std::string& message);

        [[nodiscard]] error_code code() const noexcept { return m_code; }

    private:
        error_code m_code;
    };

    /**
     * @brief Font loading failure.
     *
     * For invalid_glyph_key and glyph_height_mismatch the offending
     * character is available through character(). An invalid key that
     * could not be decoded to a single character leaves it empty; the
     * raw key is part of the message.
     */
    class ARTFONT_EXPORT font_error : public art_error {
    public:
        font_error(error_code code, const std::string& message,
                   std::optional<char32_t> character = std::nullopt);

        [[nodiscard]] std::optional<char32_t> character() const noexcept { return m_character; }

    private:
        std::optional<char32_t> m_character;
    };
} // namespace artfont
