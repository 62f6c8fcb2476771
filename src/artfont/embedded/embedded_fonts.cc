//
// Created by igor on 15/01/2026.
//

#include <artfont/embedded_fonts.hh>
#include <artfont/font_loader.hh>
#include "embedded.hh"

namespace artfont {
    namespace internal {
        font load_embedded(std::string_view document) {
            auto doc = nlohmann::json::parse(document.begin(), document.end());

            auto& glyphs = doc.at("glyphs");
            for (char upper = 'A'; upper <= 'Z'; ++upper) {
                const std::string upper_key(1, upper);
                const std::string lower_key(1, static_cast<char>(upper - 'A' + 'a'));
                if (glyphs.contains(upper_key) && !glyphs.contains(lower_key)) {
                    glyphs[lower_key] = glyphs[upper_key];
                }
            }

            return font_loader::load_document(doc);
        }
    }

    const font& default_font() {
        static const font instance = internal::load_embedded(internal::block_font_document());
        return instance;
    }

    const font& ansi_compact_font() {
        static const font instance = internal::load_embedded(internal::ansi_compact_font_document());
        return instance;
    }

    const font& mini_font() {
        static const font instance = internal::load_embedded(internal::mini_font_document());
        return instance;
    }
}
