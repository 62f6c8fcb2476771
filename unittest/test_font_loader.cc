//
// Created by igor on 15/01/2026.
//
// Unit tests for font_loader
//

#include <doctest/doctest.h>
#include <artfont/font_loader.hh>
#include <artfont/error.hh>
#include "test_fonts.hh"
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace artfont;
using namespace artfont::test;

TEST_SUITE("font_loader") {

    TEST_CASE("load valid document") {
        auto f = font_loader::load_string(square_a_document);
        CHECK(f.width() == 3);
        CHECK(f.height() == 3);
        CHECK(f.spacing() == 1);

        const glyph* a = f.glyph_for('A');
        REQUIRE(a != nullptr);
        REQUIRE(a->size() == 3);
        CHECK((*a)[0] == "###");
        CHECK((*a)[1] == "# #");
        CHECK((*a)[2] == "###");
    }

    TEST_CASE("load parsed document") {
        nlohmann::json doc = {
            {"name", "Doc"},
            {"width", 2},
            {"height", 1},
            {"glyphs", {{"x", nlohmann::json::array({"xx"})}}}
        };
        auto f = font_loader::load_document(doc);
        CHECK(f.name() == "Doc");
        CHECK(f.width() == 2);
        CHECK(f.glyph_count() == 1);
    }

    TEST_CASE("spacing defaults to zero") {
        auto f = load(two_row_document);
        CHECK(f.spacing() == 0);
    }

    TEST_CASE("rows are kept verbatim") {
        auto f = load(R"({
            "width": 4, "height": 2,
            "glyphs": { "a": ["#", "######"] }
        })");
        const glyph* g = f.glyph_for('a');
        REQUIRE(g != nullptr);
        CHECK((*g)[0] == "#");
        CHECK((*g)[1] == "######");
    }

    TEST_CASE("glyph height mismatch") {
        const char* doc = R"({
            "width": 3, "height": 3,
            "glyphs": { "A": ["###", "# #"] }
        })";
        CHECK(load_error(doc) == error_code::glyph_height_mismatch);

        try {
            (void)font_loader::load_string(doc);
            FAIL("expected font_error");
        } catch (const font_error& e) {
            REQUIRE(e.character().has_value());
            CHECK(*e.character() == U'A');
            CHECK(std::string(e.what()).find("expected 3") != std::string::npos);
        }
    }

    TEST_CASE("empty glyph map") {
        CHECK(load_error(R"({"width": 3, "height": 3, "glyphs": {}})") == error_code::empty_font);
    }

    TEST_CASE("invalid dimensions") {
        CHECK(load_error(R"({"width": 0, "height": 5, "glyphs": {}})") == error_code::invalid_dimensions);
        CHECK(load_error(R"({"width": 3, "height": 0, "glyphs": {"A": []}})") == error_code::invalid_dimensions);
        CHECK(load_error(R"({"width": -2, "height": 1, "glyphs": {"A": ["#"]}})") == error_code::invalid_dimensions);
        CHECK(load_error(R"({"height": 1, "glyphs": {"A": ["#"]}})") == error_code::invalid_dimensions);
        CHECK(load_error(R"({"width": 1, "glyphs": {"A": ["#"]}})") == error_code::invalid_dimensions);
        CHECK(load_error(R"({"width": 4294967296, "height": 1, "glyphs": {"A": ["#"]}})") ==
              error_code::invalid_dimensions);
    }

    TEST_CASE("invalid glyph keys") {
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"AB": ["#"]}})") == error_code::invalid_glyph_key);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"": ["#"]}})") == error_code::invalid_glyph_key);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"\\q": ["#"]}})") == error_code::invalid_glyph_key);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"\\u{110000}": ["#"]}})") ==
              error_code::invalid_glyph_key);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"\\u{zz}": ["#"]}})") ==
              error_code::invalid_glyph_key);
    }

    TEST_CASE("escaped glyph keys") {
        CHECK(font_loader::parse_glyph_key("A") == U'A');
        CHECK(font_loader::parse_glyph_key("\\") == U'\\');
        CHECK(font_loader::parse_glyph_key("\\n") == U'\n');
        CHECK(font_loader::parse_glyph_key("\\t") == U'\t');
        CHECK(font_loader::parse_glyph_key("\\\\") == U'\\');
        CHECK(font_loader::parse_glyph_key("\\\"") == U'"');
        CHECK(font_loader::parse_glyph_key("\\u{41}") == U'A');
        CHECK(font_loader::parse_glyph_key("\\u{2588}") == char32_t{0x2588});
        CHECK(font_loader::parse_glyph_key("\xE2\x96\x88") == char32_t{0x2588});
        CHECK_THROWS_AS(font_loader::parse_glyph_key("ab"), font_error);
    }

    TEST_CASE("duplicate character through escape") {
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"A": ["#"], "\\u{41}": ["@"]}})") ==
              error_code::invalid_glyph_key);
    }

    TEST_CASE("structural errors") {
        CHECK(load_error("[1, 2, 3]") == error_code::parse_error);
        CHECK(load_error(R"({"width": "3", "height": 3, "glyphs": {"A": ["#","#","#"]}})") == error_code::parse_error);
        CHECK(load_error(R"({"width": 1.5, "height": 1, "glyphs": {"A": ["#"]}})") == error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1, "spacing": -1, "glyphs": {"A": ["#"]}})") ==
              error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1, "name": 7, "glyphs": {"A": ["#"]}})") ==
              error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1})") == error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": ["#"]})") == error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"A": "#"}})") == error_code::parse_error);
        CHECK(load_error(R"({"width": 1, "height": 1, "glyphs": {"A": [1]}})") == error_code::parse_error);
    }

    TEST_CASE("unparsable text keeps parser message") {
        try {
            (void)font_loader::load_string(R"({"width": 3,)");
            FAIL("expected font_error");
        } catch (const font_error& e) {
            CHECK(e.code() == error_code::parse_error);
            CHECK(std::string(e.what()).find("parse_error") != std::string::npos);
            CHECK_FALSE(e.character().has_value());
        }
    }

    TEST_CASE("load file") {
        auto f = font_loader::load_file(testdata_path() / "tiny.json");
        CHECK(f.name() == "Tiny");
        CHECK(f.width() == 3);
        CHECK(f.height() == 3);
        CHECK(f.spacing() == 1);
        CHECK(f.glyph_count() == 4);
        CHECK(f.has_glyph(U'\t'));
    }

    TEST_CASE("load malformed file") {
        const auto path = std::filesystem::temp_directory_path() / "artfont_malformed_test.json";
        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"width": 1, "height": 1, "glyphs": {)";
        }

        std::optional<error_code> code;
        std::string message;
        try {
            (void)font_loader::load_file(path);
        } catch (const font_error& e) {
            code = e.code();
            message = e.what();
        }
        std::filesystem::remove(path);

        CHECK(code == error_code::parse_error);
        CHECK(message.find("artfont_malformed_test.json") != std::string::npos);
        CHECK(message.find("parse_error") != std::string::npos);
    }

    TEST_CASE("load missing file") {
        try {
            (void)font_loader::load_file(testdata_path() / "does-not-exist.json");
            FAIL("expected font_error");
        } catch (const font_error& e) {
            CHECK(e.code() == error_code::parse_error);
            CHECK(std::string(e.what()).find("does-not-exist.json") != std::string::npos);
        }
    }

    TEST_CASE("glyph keys escape special characters") {
        CHECK(font_loader::glyph_key(U'A') == "A");
        CHECK(font_loader::glyph_key(U'\n') == "\\u{000a}");
        CHECK(font_loader::glyph_key(U'\\') == "\\u{005c}");
        CHECK(font_loader::glyph_key(U'"') == "\\u{0022}");
        CHECK(font_loader::glyph_key(0x2588) == "\xE2\x96\x88");
    }

    TEST_CASE("document round trip") {
        auto f = font_loader::load_file(testdata_path() / "tiny.json");
        auto doc = font_loader::to_document(f);

        CHECK(doc["name"].get<std::string>() == "Tiny");
        CHECK(doc["glyphs"].contains("\\u{0009}"));

        auto again = font_loader::load_document(doc);
        CHECK(again.name() == f.name());
        CHECK(again.width() == f.width());
        CHECK(again.height() == f.height());
        CHECK(again.spacing() == f.spacing());
        CHECK(again.glyphs() == f.glyphs());
    }

    TEST_CASE("save and reload") {
        auto f = load(two_row_document);
        const auto path = std::filesystem::temp_directory_path() / "artfont_save_test.json";

        font_loader::save(f, path);
        auto again = font_loader::load_file(path);
        std::filesystem::remove(path);

        CHECK(again.width() == 1);
        CHECK(again.height() == 2);
        CHECK(again.glyphs() == f.glyphs());
    }

    TEST_CASE("error code names") {
        CHECK(to_string(error_code::parse_error) == "parse_error");
        CHECK(to_string(error_code::glyph_height_mismatch) == "glyph_height_mismatch");
        CHECK(to_string(error_code::missing_text) == "missing_text");
    }
}
