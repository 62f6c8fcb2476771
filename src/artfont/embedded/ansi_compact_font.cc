//
// Created by igor on 15/01/2026.
//
// ANSI compact font, 5x5 bitmaps folded into 3 rows of half blocks.
// Lowercase letters are added from the uppercase glyphs at load time.
//

#include "embedded.hh"

namespace artfont::internal {

std::string_view ansi_compact_font_document() {
    return R"artfont(
{
  "name": "ANSI Compact",
  "width": 5,
  "height": 3,
  "spacing": 1,
  "glyphs": {
    "A": ["▄▀▀▀▄", "█▀▀▀█", "▀   ▀"],
    "B": ["█▀▀▀▄", "█▀▀▀▄", "▀▀▀▀ "],
    "C": ["▄▀▀▀▀", "█    ", " ▀▀▀▀"],
    "D": ["█▀▀▀▄", "█   █", "▀▀▀▀ "],
    "E": ["█▀▀▀▀", "█▀▀▀ ", "▀▀▀▀▀"],
    "F": ["█▀▀▀▀", "█▀▀▀ ", "▀    "],
    "G": ["▄▀▀▀▀", "█  ▀█", " ▀▀▀▀"],
    "H": ["█   █", "█▀▀▀█", "▀   ▀"],
    "I": ["▀▀█▀▀", "  █  ", "▀▀▀▀▀"],
    "J": ["▀▀▀▀█", "▄   █", " ▀▀▀ "],
    "K": ["█  ▄▀", "█▀▀▄ ", "▀   ▀"],
    "L": ["█    ", "█    ", "▀▀▀▀▀"],
    "M": ["█▄ ▄█", "█ ▀ █", "▀   ▀"],
    "N": ["█▄  █", "█ ▀▄█", "▀   ▀"],
    "O": ["▄▀▀▀▄", "█   █", " ▀▀▀ "],
    "P": ["█▀▀▀▄", "█▀▀▀ ", "▀    "],
    "Q": ["▄▀▀▀▄", "█ ▀▄▀", " ▀▀ ▀"],
    "R": ["█▀▀▀▄", "█▀▀█ ", "▀   ▀"],
    "S": ["▄▀▀▀▀", " ▀▀▀▄", "▀▀▀▀ "],
    "T": ["▀▀█▀▀", "  █  ", "  ▀  "],
    "U": ["█   █", "█   █", " ▀▀▀ "],
    "V": ["█   █", "▀▄ ▄▀", "  ▀  "],
    "W": ["█   █", "█▄▀▄█", "▀   ▀"],
    "X": ["▀▄ ▄▀", " ▄▀▄ ", "▀   ▀"],
    "Y": ["▀▄ ▄▀", "  █  ", "  ▀  "],
    "Z": ["▀▀▀█▀", " ▄▀  ", "▀▀▀▀▀"],
    "0": ["▄▀▀█▄", "█▄▀ █", " ▀▀▀ "],
    "1": [" ▄█  ", "  █  ", " ▀▀▀ "],
    "2": ["▄▀▀▀▄", " ▄▀▀ ", "▀▀▀▀▀"],
    "3": ["▀▀▀▀▄", " ▀▀▀▄", "▀▀▀▀ "],
    "4": ["█   █", "▀▀▀▀█", "    ▀"],
    "5": ["█▀▀▀▀", "▀▀▀▀▄", "▀▀▀▀ "],
    "6": ["▄▀▀▀ ", "█▀▀▀▄", " ▀▀▀ "],
    "7": ["▀▀▀▀█", "  ▄▀ ", "  ▀  "],
    "8": ["▄▀▀▀▄", "▄▀▀▀▄", " ▀▀▀ "],
    "9": ["▄▀▀▀▄", " ▀▀▀█", " ▀▀▀ "],
    " ": ["     ", "     ", "     "],
    "!": ["  █  ", "  ▀  ", "  ▀  "],
    "?": ["▄▀▀▀▄", "  ▀▀ ", "  ▀  "],
    ".": ["     ", "     ", "  ▀  "],
    ",": ["     ", "  ▄  ", " ▀   "],
    ":": ["  ▄  ", "  ▄  ", "     "],
    ";": ["  ▄  ", "  ▄  ", " ▀   "],
    "-": ["     ", " ▀▀▀ ", "     "],
    "_": ["     ", "     ", "▀▀▀▀▀"],
    "+": ["  ▄  ", " ▀█▀ ", "     "],
    "=": [" ▄▄▄ ", " ▄▄▄ ", "     "],
    "'": ["  █  ", "     ", "     "],
    "\"": [" █ █ ", "     ", "     "],
    "(": ["  ▄▀ ", "  █  ", "   ▀ "],
    ")": [" ▀▄  ", "  █  ", " ▀   "],
    "[": ["  █▀ ", "  █  ", "  ▀▀ "],
    "]": [" ▀█  ", "  █  ", " ▀▀  "],
    "/": ["   ▄▀", " ▄▀  ", "▀    "],
    "*": ["▄ ▄ ▄", "▄▀█▀▄", "     "],
    "#": ["▄█▄█▄", "▄█▄█▄", " ▀ ▀ "],
    "<": ["  ▄▀ ", " ▀▄  ", "   ▀ "],
    ">": [" ▀▄  ", "  ▄▀ ", " ▀   "]
  }
}
)artfont";
}

} // namespace artfont::internal
