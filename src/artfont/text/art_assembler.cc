//
// Created by igor on 14/01/2026.
//

#include <artfont/text/art_assembler.hh>
#include <artfont/text/glyph_compositor.hh>
#include <algorithm>

namespace artfont {

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;

    while (!text.empty()) {
        const auto pos = text.find('\n');
        std::string_view line = text.substr(0, pos);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);

        if (pos == std::string_view::npos) {
            break;
        }
        text.remove_prefix(pos + 1);
    }

    return lines;
}

void align_block(composed_block& block, std::size_t target_width, text_align align) {
    if (block.width >= target_width) {
        return;
    }

    const std::size_t deficit = target_width - block.width;
    std::size_t leading = 0;
    switch (align) {
        case text_align::left:
            leading = 0;
            break;
        case text_align::center:
            leading = deficit / 2;
            break;
        case text_align::right:
            leading = deficit;
            break;
    }
    const std::size_t trailing = deficit - leading;

    for (auto& row : block.rows) {
        row.insert(0, leading, ' ');
        row.append(trailing, ' ');
    }
    block.width = target_width;
}

std::string assemble(const font& f, std::string_view text, text_align align,
                     std::uint32_t line_spacing, std::optional<std::uint32_t> spacing_override) {
    std::vector<composed_block> blocks;
    std::size_t max_width = 0;

    for (auto line : split_lines(text)) {
        blocks.push_back(compose_line(f, line, spacing_override));
        max_width = std::max(max_width, blocks.back().width);
    }

    std::string result;
    const std::string separator(max_width, ' ');
    bool first_row = true;

    auto emit = [&](const std::string& row) {
        if (!first_row) {
            result += '\n';
        }
        result += row;
        first_row = false;
    };

    for (std::size_t i = 0; i < blocks.size(); ++i) {
        if (i > 0) {
            for (std::uint32_t s = 0; s < line_spacing; ++s) {
                emit(separator);
            }
        }
        align_block(blocks[i], max_width, align);
        for (const auto& row : blocks[i].rows) {
            emit(row);
        }
    }

    return result;
}

} // namespace artfont
