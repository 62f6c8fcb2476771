//
// Created by igor on 15/01/2026.
//
// Block font, 5x5 full blocks.
// Lowercase letters are added from the uppercase glyphs at load time.
//

#include "embedded.hh"

namespace artfont::internal {

std::string_view block_font_document() {
    return R"artfont(
{
  "name": "Block",
  "width": 5,
  "height": 5,
  "spacing": 1,
  "glyphs": {
    "A": [" ███ ", "█   █", "█████", "█   █", "█   █"],
    "B": ["████ ", "█   █", "████ ", "█   █", "████ "],
    "C": [" ████", "█    ", "█    ", "█    ", " ████"],
    "D": ["████ ", "█   █", "█   █", "█   █", "████ "],
    "E": ["█████", "█    ", "████ ", "█    ", "█████"],
    "F": ["█████", "█    ", "████ ", "█    ", "█    "],
    "G": [" ████", "█    ", "█  ██", "█   █", " ████"],
    "H": ["█   █", "█   █", "█████", "█   █", "█   █"],
    "I": ["█████", "  █  ", "  █  ", "  █  ", "█████"],
    "J": ["█████", "    █", "    █", "█   █", " ███ "],
    "K": ["█   █", "█  █ ", "███  ", "█  █ ", "█   █"],
    "L": ["█    ", "█    ", "█    ", "█    ", "█████"],
    "M": ["█   █", "██ ██", "█ █ █", "█   █", "█   █"],
    "N": ["█   █", "██  █", "█ █ █", "█  ██", "█   █"],
    "O": [" ███ ", "█   █", "█   █", "█   █", " ███ "],
    "P": ["████ ", "█   █", "████ ", "█    ", "█    "],
    "Q": [" ███ ", "█   █", "█ █ █", "█  █ ", " ██ █"],
    "R": ["████ ", "█   █", "████ ", "█  █ ", "█   █"],
    "S": [" ████", "█    ", " ███ ", "    █", "████ "],
    "T": ["█████", "  █  ", "  █  ", "  █  ", "  █  "],
    "U": ["█   █", "█   █", "█   █", "█   █", " ███ "],
    "V": ["█   █", "█   █", "█   █", " █ █ ", "  █  "],
    "W": ["█   █", "█   █", "█ █ █", "██ ██", "█   █"],
    "X": ["█   █", " █ █ ", "  █  ", " █ █ ", "█   █"],
    "Y": ["█   █", " █ █ ", "  █  ", "  █  ", "  █  "],
    "Z": ["█████", "   █ ", "  █  ", " █   ", "█████"],
    "0": [" ███ ", "█  ██", "█ █ █", "██  █", " ███ "],
    "1": ["  █  ", " ██  ", "  █  ", "  █  ", " ███ "],
    "2": [" ███ ", "█   █", "  ██ ", " █   ", "█████"],
    "3": ["████ ", "    █", " ███ ", "    █", "████ "],
    "4": ["█   █", "█   █", "█████", "    █", "    █"],
    "5": ["█████", "█    ", "████ ", "    █", "████ "],
    "6": [" ███ ", "█    ", "████ ", "█   █", " ███ "],
    "7": ["█████", "    █", "   █ ", "  █  ", "  █  "],
    "8": [" ███ ", "█   █", " ███ ", "█   █", " ███ "],
    "9": [" ███ ", "█   █", " ████", "    █", " ███ "],
    " ": ["     ", "     ", "     ", "     ", "     "],
    "!": ["  █  ", "  █  ", "  █  ", "     ", "  █  "],
    "?": [" ███ ", "█   █", "  ██ ", "     ", "  █  "],
    ".": ["     ", "     ", "     ", "     ", "  █  "],
    ",": ["     ", "     ", "     ", "  █  ", " █   "],
    ":": ["     ", "  █  ", "     ", "  █  ", "     "],
    ";": ["     ", "  █  ", "     ", "  █  ", " █   "],
    "-": ["     ", "     ", " ███ ", "     ", "     "],
    "_": ["     ", "     ", "     ", "     ", "█████"],
    "+": ["     ", "  █  ", " ███ ", "  █  ", "     "],
    "=": ["     ", " ███ ", "     ", " ███ ", "     "],
    "'": ["  █  ", "  █  ", "     ", "     ", "     "],
    "\"": [" █ █ ", " █ █ ", "     ", "     ", "     "],
    "(": ["   █ ", "  █  ", "  █  ", "  █  ", "   █ "],
    ")": [" █   ", "  █  ", "  █  ", "  █  ", " █   "],
    "[": ["  ██ ", "  █  ", "  █  ", "  █  ", "  ██ "],
    "]": [" ██  ", "  █  ", "  █  ", "  █  ", " ██  "],
    "/": ["    █", "   █ ", "  █  ", " █   ", "█    "],
    "*": ["     ", "█ █ █", " ███ ", "█ █ █", "     "],
    "#": [" █ █ ", "█████", " █ █ ", "█████", " █ █ "],
    "<": ["   █ ", "  █  ", " █   ", "  █  ", "   █ "],
    ">": [" █   ", "  █  ", "   █ ", "  █  ", " █   "]
  }
}
)artfont";
}

} // namespace artfont::internal
