//
// Created by igor on 15/01/2026.
//

#include <artfont/art_builder.hh>
#include <artfont/embedded_fonts.hh>
#include <artfont/error.hh>
#include <artfont/text/art_assembler.hh>
#include <utility>

namespace artfont {
    art_builder& art_builder::text(std::string value) {
        m_text = std::move(value);
        return *this;
    }

    art_builder& art_builder::spacing(std::uint32_t columns) {
        m_spacing = columns;
        return *this;
    }

    art_builder& art_builder::line_spacing(std::uint32_t rows) {
        m_line_spacing = rows;
        return *this;
    }

    art_builder& art_builder::align(text_align alignment) {
        m_align = alignment;
        return *this;
    }

    art_builder& art_builder::align_left() {
        return align(text_align::left);
    }

    art_builder& art_builder::align_center() {
        return align(text_align::center);
    }

    art_builder& art_builder::align_right() {
        return align(text_align::right);
    }

    art_builder& art_builder::font(const artfont::font& f) {
        m_font = &f;
        return *this;
    }

    std::string art_builder::build() {
        art_builder config = std::exchange(*this, art_builder());
        if (!config.m_text) {
            throw art_error(error_code::missing_text, "art_builder::build() called without text");
        }

        const artfont::font& f = config.m_font ? *config.m_font : default_font();
        return assemble(f, *config.m_text, config.m_align, config.m_line_spacing, config.m_spacing);
    }
}
