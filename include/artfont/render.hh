/**
 * @file render.hh
 * @brief One-call rendering helpers.
 *
 * These helpers render with left alignment, the font's own spacing and
 * no extra rows between lines. Use art_builder for anything else.
 *
 * @code{.cpp}
 * std::cout << render("Hello") << "\n";
 * std::cout << render_mini("Hello\nWorld") << "\n";
 *
 * auto custom = font_loader::load_file("fonts/tiny.json");
 * std::cout << render_with_font("Hi", custom) << "\n";
 * @endcode
 *
 * @author Igor
 * @date 15/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <artfont/font.hh>
#include <string>
#include <string_view>

namespace artfont {
    /// Render with default_font()
    ARTFONT_EXPORT std::string render(std::string_view text);

    /// Render with a caller supplied font
    ARTFONT_EXPORT std::string render_with_font(std::string_view text, const font& f);

    /// Render with ansi_compact_font()
    ARTFONT_EXPORT std::string render_ansi_compact(std::string_view text);

    /// Render with mini_font()
    ARTFONT_EXPORT std::string render_mini(std::string_view text);
} // namespace artfont
