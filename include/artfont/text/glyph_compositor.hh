/**
 * @file glyph_compositor.hh
 * @brief Composition of a single text line into glyph rows.
 *
 * compose_line() walks the codepoints of one line and concatenates the
 * matching glyph rows side by side:
 *
 * @code
 *   font: A -> ["###", "# #"], B -> ["@@ ", "@@@"], spacing 1
 *
 *   compose_line(font, "AB") -> rows  "### @@ "
 *                                     "# # @@@"
 *                               width 7
 * @endcode
 *
 * - Each glyph row is padded on the right to the glyph cell width
 *   (see font::cell_width()).
 * - `spacing` blank columns separate adjacent glyphs; there is none
 *   after the last glyph.
 * - A character without a glyph becomes a blank cell of font width.
 *
 * The result depends only on the arguments, so composing the same line
 * twice yields identical blocks.
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <artfont/font.hh>
#include <artfont/text/types.hh>
#include <cstdint>
#include <optional>
#include <string_view>

namespace artfont {
    /**
     * @brief Render one line of text (no line breaks) into a block.
     *
     * @param f Font to draw with
     * @param line UTF-8 text of a single line
     * @param spacing_override Columns between glyphs; font spacing if empty
     * @return Block of f.height() rows
     */
    ARTFONT_EXPORT composed_block compose_line(const font& f, std::string_view line,
                                               std::optional<std::uint32_t> spacing_override = std::nullopt);
} // namespace artfont
