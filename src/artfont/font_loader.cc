//
// Created by igor on 14/01/2026.
//

#include <artfont/font_loader.hh>
#include <artfont/error.hh>
#include <artfont/text/utf8.hh>
#include <failsafe/failsafe.hh>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <optional>
#include <sstream>
#include <utility>

namespace artfont {

    namespace {
        constexpr char32_t MAX_CODEPOINT = 0x10FFFF;
        constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

        // Message builder for font_error, which THROW_IF cannot construct with a code and character
        template<typename... Args>
        std::string concat(Args&&... args) {
            std::ostringstream os;
            (os << ... << std::forward<Args>(args));
            return os.str();
        }

        std::string describe(char32_t ch) {
            std::ostringstream os;
            os << "U+" << std::uppercase << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<std::uint32_t>(ch);
            return os.str();
        }

        [[noreturn]] void fail(error_code code, const std::string& message,
                               std::optional<char32_t> ch = std::nullopt) {
            LOG_WARN("Rejected font document (", to_string(code), "): ", message);
            throw font_error(code, message, ch);
        }

        // Reads "width" or "height": present, integral and within 1..UINT32_MAX
        std::uint32_t read_dimension(const nlohmann::json& doc, const char* field) {
            auto itr = doc.find(field);
            if (itr == doc.end() || itr->is_null()) {
                fail(error_code::invalid_dimensions, concat("font ", field, " is missing"));
            }
            if (!itr->is_number_integer()) {
                fail(error_code::parse_error, concat("font ", field, " must be an integer"));
            }
            if (itr->is_number_unsigned()) {
                const auto value = itr->get<std::uint64_t>();
                if (value == 0 || value > std::numeric_limits<std::uint32_t>::max()) {
                    fail(error_code::invalid_dimensions,
                         concat("font ", field, " must be greater than 0 and fit 32 bits, got ", value));
                }
                return static_cast<std::uint32_t>(value);
            }
            const auto value = itr->get<std::int64_t>();
            if (value <= 0 || value > std::numeric_limits<std::uint32_t>::max()) {
                fail(error_code::invalid_dimensions,
                     concat("font ", field, " must be greater than 0, got ", value));
            }
            return static_cast<std::uint32_t>(value);
        }

        std::uint32_t read_spacing(const nlohmann::json& doc) {
            auto itr = doc.find("spacing");
            if (itr == doc.end() || itr->is_null()) {
                return 0;
            }
            if (!itr->is_number_integer()) {
                fail(error_code::parse_error, "font spacing must be an integer");
            }
            if (!itr->is_number_unsigned()) {
                fail(error_code::parse_error,
                     concat("font spacing must not be negative, got ", itr->get<std::int64_t>()));
            }
            const auto value = itr->get<std::uint64_t>();
            if (value > std::numeric_limits<std::uint32_t>::max()) {
                fail(error_code::parse_error, concat("font spacing is too large: ", value));
            }
            return static_cast<std::uint32_t>(value);
        }

        std::string read_name(const nlohmann::json& doc) {
            auto itr = doc.find("name");
            if (itr == doc.end() || itr->is_null()) {
                return {};
            }
            if (!itr->is_string()) {
                fail(error_code::parse_error, "font name must be a string");
            }
            return itr->get<std::string>();
        }

        glyph read_rows(const std::string& key, const nlohmann::json& value) {
            if (!value.is_array()) {
                fail(error_code::parse_error, concat("glyph '", key, "' must be an array of strings"));
            }
            glyph rows;
            rows.reserve(value.size());
            for (const auto& row : value) {
                if (!row.is_string()) {
                    fail(error_code::parse_error, concat("glyph '", key, "' has a row that is not a string"));
                }
                rows.push_back(row.get<std::string>());
            }
            return rows;
        }

        std::optional<char32_t> parse_hex_escape(std::string_view key) {
            // \u{HEX}
            if (key.size() < 5 || key.substr(0, 3) != "\\u{" || key.back() != '}') {
                return std::nullopt;
            }
            const auto hex = key.substr(3, key.size() - 4);
            if (hex.empty() || hex.size() > 6) {
                return std::nullopt;
            }
            char32_t cp = 0;
            for (char c : hex) {
                int digit;
                if (c >= '0' && c <= '9') digit = c - '0';
                else if (c >= 'a' && c <= 'f') digit = 10 + (c - 'a');
                else if (c >= 'A' && c <= 'F') digit = 10 + (c - 'A');
                else return std::nullopt;
                cp = (cp << 4) | static_cast<char32_t>(digit);
            }
            if (cp > MAX_CODEPOINT || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return std::nullopt;
            }
            return cp;
        }

        std::optional<char32_t> parse_escape(std::string_view key) {
            if (key.size() == 2) {
                switch (key[1]) {
                    case 'n': return U'\n';
                    case 't': return U'\t';
                    case 'r': return U'\r';
                    case '0': return U'\0';
                    case '\\': return U'\\';
                    case '"': return U'"';
                    case '\'': return U'\'';
                    default: return std::nullopt;
                }
            }
            return parse_hex_escape(key);
        }

        [[noreturn]] void parse_failure(const std::string& origin, const nlohmann::json::parse_error& e) {
            fail(error_code::parse_error, concat("cannot parse ", origin, ": ", e.what()));
        }
    } // anonymous namespace

    char32_t font_loader::parse_glyph_key(std::string_view key) {
        if (key.empty()) {
            fail(error_code::invalid_glyph_key, "glyph key is empty");
        }

        const auto [cp, bytes] = utf8_decode_one(key);
        if (static_cast<std::size_t>(bytes) == key.size()) {
            if (cp == REPLACEMENT_CHAR && key != "\xEF\xBF\xBD") {
                fail(error_code::invalid_glyph_key, "glyph key is not valid UTF-8");
            }
            return cp;
        }

        if (key.front() == '\\') {
            if (auto escaped = parse_escape(key)) {
                return *escaped;
            }
            fail(error_code::invalid_glyph_key, concat("unknown escape sequence in glyph key '", key, "'"));
        }

        fail(error_code::invalid_glyph_key,
             concat("glyph key '", key, "' must be exactly one character, got ", utf8_length(key)));
    }

    std::string font_loader::glyph_key(char32_t ch) {
        if (ch < 0x20 || ch == 0x7F || ch == U'\\' || ch == U'"') {
            std::ostringstream os;
            os << "\\u{" << std::hex << std::setw(4) << std::setfill('0')
               << static_cast<std::uint32_t>(ch) << "}";
            return os.str();
        }
        return utf8_encode(ch);
    }

    font font_loader::load_document(const nlohmann::json& doc) {
        if (!doc.is_object()) {
            fail(error_code::parse_error, "font document must be a JSON object");
        }

        const auto width = read_dimension(doc, "width");
        const auto height = read_dimension(doc, "height");
        const auto spacing = read_spacing(doc);

        auto glyphs_itr = doc.find("glyphs");
        if (glyphs_itr == doc.end() || !glyphs_itr->is_object()) {
            fail(error_code::parse_error, "font glyphs must be a JSON object");
        }
        if (glyphs_itr->empty()) {
            fail(error_code::empty_font, "font has no glyphs");
        }

        font result(width, height, spacing, read_name(doc));

        for (const auto& [key, value] : glyphs_itr->items()) {
            const char32_t ch = parse_glyph_key(key);
            auto rows = read_rows(key, value);

            if (rows.size() != height) {
                fail(error_code::glyph_height_mismatch,
                     concat("glyph '", key, "' (", describe(ch), ") has ", rows.size(),
                            " rows, expected ", height),
                     ch);
            }

            auto [pos, inserted] = result.m_glyphs.emplace(ch, std::move(rows));
            if (!inserted) {
                fail(error_code::invalid_glyph_key,
                     concat("glyph key '", key, "' defines ", describe(ch), " a second time"),
                     ch);
            }
        }

        LOG_DEBUG("Loaded font '", result.m_name, "' ", width, "x", height,
                  " spacing ", spacing, " with ", result.m_glyphs.size(), " glyphs");
        return result;
    }

    font font_loader::load_string(std::string_view json_text) {
        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(json_text.begin(), json_text.end());
        } catch (const nlohmann::json::parse_error& e) {
            parse_failure("font document", e);
        }
        return load_document(doc);
    }

    font font_loader::load_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            fail(error_code::parse_error, concat("cannot open font file ", path.string()));
        }

        const std::string text{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        if (file.bad()) {
            fail(error_code::parse_error, concat("cannot read font file ", path.string()));
        }

        nlohmann::json doc;
        try {
            doc = nlohmann::json::parse(text);
        } catch (const nlohmann::json::parse_error& e) {
            parse_failure(path.string(), e);
        }
        return load_document(doc);
    }

    nlohmann::json font_loader::to_document(const font& f) {
        nlohmann::json doc = nlohmann::json::object();
        if (!f.name().empty()) {
            doc["name"] = f.name();
        }
        doc["width"] = f.width();
        doc["height"] = f.height();
        doc["spacing"] = f.spacing();

        nlohmann::json glyphs = nlohmann::json::object();
        for (const auto& [ch, rows] : f.glyphs()) {
            glyphs[glyph_key(ch)] = rows;
        }
        doc["glyphs"] = std::move(glyphs);
        return doc;
    }

    void font_loader::save(const font& f, const std::filesystem::path& path) {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        THROW_IF(!out, std::runtime_error, "Cannot open font file for writing:", path.string());

        out << to_document(f).dump(2) << "\n";
        THROW_IF(!out, std::runtime_error, "Failed to write font file:", path.string());
    }
}
