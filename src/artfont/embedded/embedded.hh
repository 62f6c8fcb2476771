//
// Created by igor on 15/01/2026.
//
// Internal access to the JSON documents of the bundled fonts
//

#pragma once

#include <artfont/font.hh>
#include <string_view>

namespace artfont::internal {

    std::string_view block_font_document();
    std::string_view ansi_compact_font_document();
    std::string_view mini_font_document();

    /// Load a bundled document, filling missing a-z glyphs from A-Z
    font load_embedded(std::string_view document);

}  // namespace artfont::internal
