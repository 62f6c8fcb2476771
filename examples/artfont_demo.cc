//
// Created by igor on 15/01/2026.
//
// Block-art rendering demonstration using artfont
//
// Renders text with one of the bundled fonts or with a JSON font file,
// optionally writing the font back out as JSON.
//
// Usage: artfont_demo [options] [text]
//   --font <block|compact|mini|file.json>   font to use (default: block)
//   --align <left|center|right>             line alignment (default: left)
//   --spacing <n>                           columns between glyphs
//   --line-spacing <n>                      blank rows between lines
//   --save <file.json>                      write the selected font as JSON
//
// A literal "\n" in the text starts a new line.
//

#include <artfont/art_builder.hh>
#include <artfont/embedded_fonts.hh>
#include <artfont/error.hh>
#include <artfont/font_loader.hh>
#include <cstdint>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

using namespace artfont;

namespace {
    void usage(const char* prog) {
        std::cerr << "Usage: " << prog << " [options] [text]\n";
        std::cerr << "  --font <block|compact|mini|file.json>\n";
        std::cerr << "  --align <left|center|right>\n";
        std::cerr << "  --spacing <n>\n";
        std::cerr << "  --line-spacing <n>\n";
        std::cerr << "  --save <file.json>\n";
    }

    std::optional<std::uint32_t> parse_count(const std::string& s) {
        try {
            std::size_t used = 0;
            const unsigned long value = std::stoul(s, &used);
            if (used != s.size() || value > std::numeric_limits<std::uint32_t>::max()) {
                return std::nullopt;
            }
            return static_cast<std::uint32_t>(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    std::string unescape_newlines(const std::string& text) {
        std::string out;
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\\' && i + 1 < text.size() && text[i + 1] == 'n') {
                out += '\n';
                ++i;
            } else {
                out += text[i];
            }
        }
        return out;
    }
}

int main(int argc, char* argv[]) {
    std::string font_name = "block";
    std::string save_path;
    std::string text = "Hello\\nWorld!";
    art_builder builder;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            usage(argv[0]);
            return 0;
        }
        if (arg == "--font" && has_value) {
            font_name = argv[++i];
        } else if (arg == "--save" && has_value) {
            save_path = argv[++i];
        } else if (arg == "--align" && has_value) {
            const std::string value = argv[++i];
            if (value == "left") {
                builder.align_left();
            } else if (value == "center") {
                builder.align_center();
            } else if (value == "right") {
                builder.align_right();
            } else {
                std::cerr << "Unknown alignment: " << value << '\n';
                return 1;
            }
        } else if ((arg == "--spacing" || arg == "--line-spacing") && has_value) {
            auto value = parse_count(argv[++i]);
            if (!value) {
                std::cerr << "Invalid value for " << arg << ": " << argv[i] << '\n';
                return 1;
            }
            if (arg == "--spacing") {
                builder.spacing(*value);
            } else {
                builder.line_spacing(*value);
            }
        } else if (arg.rfind("--", 0) == 0) {
            usage(argv[0]);
            return 1;
        } else {
            text = arg;
        }
    }

    try {
        std::optional<font> loaded;
        const font* selected = nullptr;

        if (font_name == "block") {
            selected = &default_font();
        } else if (font_name == "compact") {
            selected = &ansi_compact_font();
        } else if (font_name == "mini") {
            selected = &mini_font();
        } else {
            loaded = font_loader::load_file(font_name);
            selected = &*loaded;
        }

        std::cout << builder.text(unescape_newlines(text)).font(*selected).build() << '\n';

        if (!save_path.empty()) {
            font_loader::save(*selected, save_path);
            std::cout << "Wrote " << save_path << " (" << selected->glyph_count() << " glyphs)\n";
        }
    } catch (const font_error& e) {
        std::cerr << "Cannot load font (" << to_string(e.code()) << "): " << e.what() << '\n';
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
