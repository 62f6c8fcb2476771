/**
 * @file font.hh
 * @brief Block-art font: fixed-height glyphs made of text rows.
 *
 * A font maps characters to glyphs. A glyph is a list of exactly
 * `height` UTF-8 strings ("rows") that are printed one under the other.
 *
 * @section cell_model Cell Model
 *
 * Every glyph occupies a cell that is at least `width` columns wide.
 * Rows are stored verbatim; when text is composed each row is padded on
 * the right with blanks up to the cell width. A row longer than `width`
 * is never cut, it widens the cell of that glyph instead:
 *
 * @code
 *   width = 4
 *
 *   "##"      -> "##  "      short row, padded
 *   "####"    -> "####"      exact
 *   "#####"   -> "#####"     long row, cell becomes 5 columns
 * @endcode
 *
 * @code
 *   |<- cell ->|<- spacing ->|<- cell ->|
 *   | glyph A  |   blanks    | glyph B  |
 * @endcode
 *
 * @section font_lifetime Lifetime
 *
 * Fonts are produced by font_loader (the embedded fonts go through it
 * as well) and cannot be modified afterwards. A font can be shared by
 * reference between any number of concurrent renders.
 *
 * @see font_loader For loading fonts from JSON
 * @see compose_line For turning text into glyph rows
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace artfont {
    struct font_loader;

    /**
     * @brief Rows of one character, top to bottom, UTF-8 encoded.
     */
    using glyph = std::vector<std::string>;

    /**
     * @brief Immutable block-art font.
     *
     * @code{.cpp}
     * const font& f = default_font();
     *
     * if (const glyph* g = f.glyph_for(U'A')) {
     *     for (const auto& row : *g) {
     *         std::cout << row << "\n";
     *     }
     * }
     * @endcode
     */
    class ARTFONT_EXPORT font {
        friend struct font_loader;

    public:
        /**
         * @brief Look up the glyph of a character.
         *
         * @param ch Unicode codepoint
         * @return Pointer to the glyph, or nullptr if the font has none.
         *         The pointer stays valid for the lifetime of the font.
         */
        [[nodiscard]] const glyph* glyph_for(char32_t ch) const;

        [[nodiscard]] bool has_glyph(char32_t ch) const;

        /// Minimal columns per glyph cell
        [[nodiscard]] std::uint32_t width() const { return m_width; }

        /// Rows per glyph
        [[nodiscard]] std::uint32_t height() const { return m_height; }

        /// Default blank columns between adjacent glyphs
        [[nodiscard]] std::uint32_t spacing() const { return m_spacing; }

        /// Display name, empty if the source document has none
        [[nodiscard]] const std::string& name() const { return m_name; }

        [[nodiscard]] std::size_t glyph_count() const { return m_glyphs.size(); }

        /// All glyphs ordered by codepoint
        [[nodiscard]] const std::map<char32_t, glyph>& glyphs() const { return m_glyphs; }

        /**
         * @brief Columns taken by a glyph of this font when composed.
         *
         * The larger of the font width and the widest row of @p g.
         */
        [[nodiscard]] std::size_t cell_width(const glyph& g) const;

    private:
        font(std::uint32_t width, std::uint32_t height, std::uint32_t spacing, std::string name);

        std::uint32_t m_width;
        std::uint32_t m_height;
        std::uint32_t m_spacing;
        std::string m_name;
        std::map<char32_t, glyph> m_glyphs;
    };
} // namespace artfont
