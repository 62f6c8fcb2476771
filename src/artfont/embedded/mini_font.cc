//
// Created by igor on 15/01/2026.
//
// Mini font, 2x2 cells drawn with quadrant blocks.
// Lowercase letters are added from the uppercase glyphs at load time.
//

#include "embedded.hh"

namespace artfont::internal {

std::string_view mini_font_document() {
    return R"artfont(
{
  "name": "Mini",
  "width": 2,
  "height": 2,
  "spacing": 0,
  "glyphs": {
    "A": ["▞▖", "▛▌"],
    "B": ["█▖", "▙▘"],
    "C": ["▞▘", "▚▖"],
    "D": ["▛▖", "▙▘"],
    "E": ["█▘", "▙▖"],
    "F": ["█▘", "▌ "],
    "G": ["▞▘", "▚▌"],
    "H": ["▙▌", "▌▌"],
    "I": ["▜▘", "▟▖"],
    "J": [" ▌", "▚▘"],
    "K": ["▙▘", "▛▖"],
    "L": ["▌ ", "▙▖"],
    "M": ["▙▌", "▛▌"],
    "N": ["▛▖", "▌▌"],
    "O": ["▞▖", "▚▘"],
    "P": ["▛▖", "▛ "],
    "Q": ["▞▖", "▚▌"],
    "R": ["▛▖", "▛▖"],
    "S": ["▞▘", "▄▘"],
    "T": ["▜▘", "▐ "],
    "U": ["▌▌", "▙▌"],
    "V": ["▌▌", "▚▘"],
    "W": ["▙▌", "▜▘"],
    "X": ["▚▘", "▞▖"],
    "Y": ["▌▌", "▐ "],
    "Z": ["▀▌", "▙▖"],
    "0": ["▛▌", "▙▌"],
    "1": ["▟ ", "▟▖"],
    "2": ["▀▖", "▟▖"],
    "3": ["▜▖", "▄▘"],
    "4": ["▌▌", "▀▌"],
    "5": ["█▘", "▄▘"],
    "6": ["▞▘", "█▌"],
    "7": ["▀▌", "▐ "],
    "8": ["█▌", "▙▌"],
    "9": ["█▌", "▄▘"],
    " ": ["  ", "  "],
    "!": ["▐ ", "▗ "],
    "?": ["▀▖", "▗ "],
    ".": ["  ", "▗ "],
    ",": ["  ", "▞ "],
    ":": ["▗ ", "▗ "],
    "-": ["▄▖", "  "],
    "_": ["  ", "▄▖"],
    "+": ["▟▖", "▝ "],
    "=": ["▀▘", "▀▘"],
    "'": ["▐ ", "  "],
    "/": ["▗▘", "▞ "],
    "(": ["▞ ", "▚ "],
    ")": ["▝▖", "▗▘"]
  }
}
)artfont";
}

} // namespace artfont::internal
