//
// Created by igor on 15/01/2026.
//
// Unit tests for art_builder
//

#include <doctest/doctest.h>
#include <artfont/art_builder.hh>
#include <artfont/embedded_fonts.hh>
#include <artfont/error.hh>
#include <artfont/render.hh>
#include <artfont/text/art_assembler.hh>
#include "test_fonts.hh"
#include <string>
#include <vector>

using namespace artfont;
using namespace artfont::test;

TEST_SUITE("art_builder") {

    TEST_CASE("build matches assemble") {
        auto art = art_builder().text("Hi").align_center().line_spacing(1).build();
        CHECK(art == assemble(default_font(), "Hi", text_align::center, 1, std::nullopt));
    }

    TEST_CASE("defaults match render") {
        CHECK(art_builder().text("Hello\nWorld").build() == render("Hello\nWorld"));
    }

    TEST_CASE("build without text") {
        art_builder builder;
        builder.align_right().spacing(2);
        try {
            (void)builder.build();
            FAIL("expected art_error");
        } catch (const art_error& e) {
            CHECK(e.code() == error_code::missing_text);
        }
    }

    TEST_CASE("missing text is not a font error") {
        CHECK_THROWS_AS((void)art_builder().build(), art_error);
        bool caught_font_error = false;
        try {
            (void)art_builder().build();
        } catch (const font_error&) {
            caught_font_error = true;
        } catch (const art_error&) {
        }
        CHECK_FALSE(caught_font_error);
    }

    TEST_CASE("last write wins") {
        auto f = load(two_row_document);
        auto art = art_builder()
            .text("A")
            .text("AB\nB")
            .font(f)
            .align_left()
            .align(text_align::right)
            .line_spacing(3)
            .line_spacing(0)
            .build();

        const std::vector<std::string> expected{"#@", "#@", " @", " @"};
        CHECK(rows_of(art) == expected);
    }

    TEST_CASE("explicit font and spacing") {
        auto f = load(square_a_document);
        auto art = art_builder().text("AA").font(f).spacing(0).build();
        CHECK(art == "######\n# ## #\n######");
    }

    TEST_CASE("spacing override keeps other settings") {
        auto f = load(square_a_document);
        auto art = art_builder().text("A\nAA").font(f).spacing(2).align_center().build();
        CHECK(art == assemble(f, "A\nAA", text_align::center, 0, 2));
    }

    TEST_CASE("builder resets after build") {
        auto f = load(two_row_document);
        art_builder builder;

        auto first = builder.text("AB").font(f).spacing(3).align_right().build();
        CHECK(first == "#   @\n#   @");

        // Settings from the first build are gone
        CHECK_THROWS_AS((void)builder.build(), art_error);

        auto second = builder.text("Hi").build();
        CHECK(second == render("Hi"));
    }

    TEST_CASE("empty text renders nothing") {
        CHECK(art_builder().text("").build().empty());
    }

    TEST_CASE("builder with embedded fonts") {
        CHECK(art_builder().text("Go").font(mini_font()).build() == render_mini("Go"));
        CHECK(art_builder().text("Go").font(ansi_compact_font()).build() == render_ansi_compact("Go"));
    }
}
