//
// Created by igor on 14/01/2026.
//

#include <artfont/text/glyph_compositor.hh>
#include <artfont/text/utf8.hh>
#include <failsafe/failsafe.hh>

namespace artfont {

composed_block compose_line(const font& f, std::string_view line,
                            std::optional<std::uint32_t> spacing_override) {
    const std::size_t height = f.height();
    const std::size_t spacing = spacing_override.value_or(f.spacing());

    composed_block block;
    block.rows.assign(height, std::string());

    bool first = true;
    for (char32_t codepoint : utf8_view(line)) {
        if (!first) {
            for (auto& row : block.rows) {
                row.append(spacing, ' ');
            }
            block.width += spacing;
        }
        first = false;

        const glyph* g = f.glyph_for(codepoint);
        if (g == nullptr) {
            // Unknown character: blank cell
            for (auto& row : block.rows) {
                row.append(f.width(), ' ');
            }
            block.width += f.width();
            continue;
        }

        ENFORCE(g->size() == height);
        const std::size_t cell = f.cell_width(*g);
        for (std::size_t r = 0; r < height; ++r) {
            const std::string& src = (*g)[r];
            block.rows[r] += src;
            block.rows[r].append(cell - display_width(src), ' ');
        }
        block.width += cell;
    }

    return block;
}

} // namespace artfont
