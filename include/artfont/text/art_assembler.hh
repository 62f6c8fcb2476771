/**
 * @file art_assembler.hh
 * @brief Multi-line block-art assembly with alignment and line spacing.
 *
 * assemble() is the full rendering pipeline behind render() and
 * art_builder:
 *
 * 1. split the text into lines (split_lines()),
 * 2. compose every line with compose_line(),
 * 3. pad every block to the widest block according to the alignment,
 * 4. stack the blocks, separated by `line_spacing` blank rows.
 *
 * @code
 *   font height 2, A -> ["#", "#"], B -> ["@", "@"]
 *
 *   assemble(font, "A\nB", text_align::left, 1)
 *
 *   "#"
 *   "#"
 *   " "      <- separator row
 *   "@"
 *   "@"
 * @endcode
 *
 * Every row of the result has the same display width. Rows are joined
 * with '\n' and the result has no trailing line break.
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
#include <string>
#include <string_view>
#include <vector>

namespace artfont {
    /**
     * @brief Split text at line breaks.
     *
     * Splits at '\n' and drops a '\r' that ends a line. A line break at
     * the very end does not open another line, and empty text has no
     * lines. Empty lines in between are kept.
     *
     * @return Views into @p text
     */
    ARTFONT_EXPORT std::vector<std::string_view> split_lines(std::string_view text);

    /**
     * @brief Pad a block on both sides up to @p target_width columns.
     *
     * Blocks already @p target_width wide (or wider) are left as is.
     */
    ARTFONT_EXPORT void align_block(composed_block& block, std::size_t target_width, text_align align);

    /**
     * @brief Render multi-line text into a single block-art string.
     *
     * @param f Font to draw with
     * @param text UTF-8 text, lines separated by '\n'
     * @param align Horizontal alignment of lines
     * @param line_spacing Blank rows between consecutive lines
     * @param spacing_override Columns between glyphs; font spacing if empty
     * @return Rows joined by '\n'; empty string for empty text
     */
    ARTFONT_EXPORT std::string assemble(const font& f, std::string_view text,
                                        text_align align = text_align::left,
                                        std::uint32_t line_spacing = 0,
                                        std::optional<std::uint32_t> spacing_override = std::nullopt);
} // namespace artfont
