/**
 * @file types.hh
 * @brief Layout types shared by the compositor and the assembler.
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <cstddef>
#include <string>
#include <vector>

namespace artfont {
    /**
     * @brief Horizontal alignment of text lines of different widths.
     *
     * Lines narrower than the widest one are padded with blanks:
     *
     * @code
     *   left:    "AB    "     padding after
     *   center:  "  AB  "     deficit / 2 before, the rest after
     *   right:   "    AB"     padding before
     * @endcode
     */
    enum class text_align {
        left,   ///< Pad on the right (default)
        center, ///< Split padding, odd column goes to the right
        right   ///< Pad on the left
    };

    /**
     * @brief One input line rendered into glyph rows.
     *
     * Holds exactly font height rows. Every row is @ref width display
     * columns wide; an empty line has empty rows and width 0.
     */
    struct ARTFONT_EXPORT composed_block {
        std::vector<std::string> rows; ///< UTF-8 rows, top to bottom
        std::size_t width = 0;         ///< Display columns of every row
    };
} // namespace artfont
