/**
 * @file art_builder.hh
 * @brief Fluent configuration of a block-art render.
 *
 * @code{.cpp}
 * std::string banner = art_builder()
 *     .text("Hello\nWorld")
 *     .font(ansi_compact_font())
 *     .spacing(2)
 *     .line_spacing(1)
 *     .align_center()
 *     .build();
 * @endcode
 *
 * Setters overwrite the previous value, so calling one twice keeps the
 * last value. build() renders, then resets the builder: the next setter
 * call starts a fresh configuration.
 *
 * | Setting | Default |
 * |---------|---------|
 * | text | none, build() throws without it |
 * | font | default_font() |
 * | spacing | font spacing |
 * | alignment | text_align::left |
 * | line spacing | 0 |
 *
 * @author Igor
 * @date 15/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <artfont/font.hh>
#include <artfont/text/types.hh>
#include <cstdint>
#include <optional>
#include <string>

namespace artfont {
    /**
     * @brief Accumulates render settings and produces the final string.
     *
     * The builder only borrows the font passed to font(); it must stay
     * alive until build() returns.
     */
    class ARTFONT_EXPORT art_builder {
    public:
        art_builder() = default;

        /// Text to render, lines separated by '\n'
        art_builder& text(std::string value);

        /// Blank columns between glyphs, replacing the font spacing
        art_builder& spacing(std::uint32_t columns);

        /// Blank rows between rendered lines
        art_builder& line_spacing(std::uint32_t rows);

        art_builder& align(text_align alignment);
        art_builder& align_left();
        art_builder& align_center();
        art_builder& align_right();

        /// Font to render with (borrowed)
        art_builder& font(const artfont::font& f);

        /**
         * @brief Render the configured text and reset the builder.
         *
         * @return Block-art rows joined by '\n'
         * @throws art_error with error_code::missing_text if text() was
         *         never called
         */
        [[nodiscard]] std::string build();

    private:
        std::optional<std::string> m_text;
        const artfont::font* m_font = nullptr;
        std::optional<std::uint32_t> m_spacing;
        std::uint32_t m_line_spacing = 0;
        text_align m_align = text_align::left;
    };
} // namespace artfont
