//
// Created by igor on 15/01/2026.
//
// Unit tests for the font model
//

#include <doctest/doctest.h>
#include <artfont/font.hh>
#include "test_fonts.hh"
#include <vector>

using namespace artfont;
using namespace artfont::test;

TEST_SUITE("font") {

    TEST_CASE("metrics") {
        auto f = load(square_a_document);
        CHECK(f.width() == 3);
        CHECK(f.height() == 3);
        CHECK(f.spacing() == 1);
        CHECK(f.glyph_count() == 1);
        CHECK(f.name().empty());
    }

    TEST_CASE("glyph_for present character") {
        auto f = load(square_a_document);
        const glyph* g = f.glyph_for('A');
        REQUIRE(g != nullptr);
        const glyph expected{"###", "# #", "###"};
        CHECK(*g == expected);
        CHECK(f.has_glyph('A'));
    }

    TEST_CASE("glyph_for missing character") {
        auto f = load(square_a_document);
        CHECK(f.glyph_for('a') == nullptr);
        CHECK(f.glyph_for('Z') == nullptr);
        CHECK_FALSE(f.has_glyph(0x2588));
    }

    TEST_CASE("cell_width") {
        auto f = load(R"({
            "width": 3,
            "height": 2,
            "glyphs": {
                "i": ["#", "#"],
                "m": ["#####", "# # #"],
                "b": ["███", "█ █"]
            }
        })");

        // Short rows keep the font width
        CHECK(f.cell_width(*f.glyph_for('i')) == 3);
        // Long rows widen the cell
        CHECK(f.cell_width(*f.glyph_for('m')) == 5);
        // Width counts columns, not bytes
        CHECK(f.cell_width(*f.glyph_for('b')) == 3);
    }

    TEST_CASE("copies are independent values") {
        auto f = load(square_a_document);
        font copy = f;
        CHECK(copy.glyphs() == f.glyphs());
        CHECK(copy.glyph_for('A') != f.glyph_for('A'));
        CHECK(*copy.glyph_for('A') == *f.glyph_for('A'));
    }

    TEST_CASE("glyphs are ordered by codepoint") {
        auto f = load(R"({
            "width": 1, "height": 1,
            "glyphs": { "c": ["c"], "a": ["a"], "b": ["b"] }
        })");
        std::vector<char32_t> keys;
        for (const auto& [ch, g] : f.glyphs()) {
            keys.push_back(ch);
        }
        const std::vector<char32_t> expected{'a', 'b', 'c'};
        CHECK(keys == expected);
    }
}
