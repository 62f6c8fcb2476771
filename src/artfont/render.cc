//
// Created by igor on 15/01/2026.
//

#include <artfont/render.hh>
#include <artfont/embedded_fonts.hh>
#include <artfont/text/art_assembler.hh>

namespace artfont {
    std::string render(std::string_view text) {
        return render_with_font(text, default_font());
    }

    std::string render_with_font(std::string_view text, const font& f) {
        return assemble(f, text, text_align::left, 0, std::nullopt);
    }

    std::string render_ansi_compact(std::string_view text) {
        return render_with_font(text, ansi_compact_font());
    }

    std::string render_mini(std::string_view text) {
        return render_with_font(text, mini_font());
    }
}
