/**
 * @file embedded_fonts.hh
 * @brief Fonts compiled into the library.
 *
 * | Function | Name | Cell | Spacing | Look |
 * |----------|------|------|---------|------|
 * | default_font() | Block | 5x5 | 1 | Full blocks |
 * | ansi_compact_font() | ANSI Compact | 5x3 | 1 | Half blocks |
 * | mini_font() | Mini | 2x2 | 0 | Quadrant blocks |
 *
 * All three cover A-Z, a-z (drawn as capitals), 0-9, space and common
 * punctuation. Each font is loaded through font_loader the first time
 * it is requested and then lives until the process exits; the returned
 * references are safe to share between threads.
 *
 * @author Igor
 * @date 15/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <artfont/font.hh>

namespace artfont {
    /// Font used when no other font is given
    ARTFONT_EXPORT const font& default_font();

    /// Three-row font drawn with half blocks
    ARTFONT_EXPORT const font& ansi_compact_font();

    /// Two-row font drawn with quadrant blocks
    ARTFONT_EXPORT const font& mini_font();
} // namespace artfont
