//
// Created by igor on 14/01/2026.
//

#include <artfont/font.hh>
#include <artfont/text/utf8.hh>
#include <algorithm>
#include <utility>

namespace artfont {
    font::font(std::uint32_t width, std::uint32_t height, std::uint32_t spacing, std::string name)
        : m_width(width),
          m_height(height),
          m_spacing(spacing),
          m_name(std::move(name)) {
    }

    const glyph* font::glyph_for(char32_t ch) const {
        auto itr = m_glyphs.find(ch);
        if (itr == m_glyphs.end()) {
            return nullptr;
        }
        return &itr->second;
    }

    bool font::has_glyph(char32_t ch) const {
        return m_glyphs.find(ch) != m_glyphs.end();
    }

    std::size_t font::cell_width(const glyph& g) const {
        std::size_t w = m_width;
        for (const auto& row : g) {
            w = std::max(w, display_width(row));
        }
        return w;
    }
}
