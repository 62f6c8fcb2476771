/**
 * @file utf8.hh
 * @brief UTF-8 helpers used for glyph lookup and column counting.
 *
 * Glyph rows and input text are UTF-8. Block-art fonts draw with
 * multi-byte characters such as U+2588 (full block) or U+2580 (upper
 * half block), so every width in artfont is measured in codepoints,
 * one display column per codepoint.
 *
 * @code{.cpp}
 * std::string row = "\xE2\x96\x88\xE2\x96\x88 ";  // two full blocks and a space
 * row.size();            // 7 bytes
 * display_width(row);    // 3 columns
 *
 * for (char32_t cp : utf8_view("Hi!")) {
 *     // 'H', 'i', '!'
 * }
 * @endcode
 *
 * Malformed sequences decode to U+FFFD and are counted as one column,
 * so a broken row never stalls iteration.
 *
 * @author Igor
 * @date 14/01/2026
 */

#pragma once

#include <artfont/export.h>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

namespace artfont {
    /**
     * @brief Codepoint decoded from the front of a string.
     */
    struct ARTFONT_EXPORT utf8_decode_result {
        char32_t codepoint;  ///< Decoded value, U+FFFD on error
        int bytes_consumed;  ///< 1-4, or 0 for empty input
    };

    /**
     * @brief Decode the first codepoint of @p str.
     *
     * Returns {U+FFFD, 0} on empty input. Invalid, overlong and surrogate
     * sequences yield U+FFFD and consume at least one byte.
     */
    ARTFONT_EXPORT utf8_decode_result utf8_decode_one(std::string_view str);

    /**
     * @brief Number of codepoints in @p str.
     */
    ARTFONT_EXPORT std::size_t utf8_length(std::string_view str);

    /**
     * @brief Display width of a glyph row or text line, in columns.
     *
     * One column per codepoint. Same value as utf8_length(), named for
     * the layout code that uses it.
     */
    inline std::size_t display_width(std::string_view str) {
        return utf8_length(str);
    }

    /**
     * @brief Append the UTF-8 encoding of @p cp to @p out.
     *
     * Codepoints above U+10FFFF and surrogates are written as U+FFFD.
     */
    ARTFONT_EXPORT void utf8_append(std::string& out, char32_t cp);

    /**
     * @brief UTF-8 encoding of a single codepoint.
     */
    ARTFONT_EXPORT std::string utf8_encode(char32_t cp);

    /**
     * @brief Forward iterator over the codepoints of a UTF-8 string.
     *
     * A default constructed iterator is the end sentinel.
     */
    class ARTFONT_EXPORT utf8_iterator {
    public:
        using value_type = char32_t;
        using difference_type = std::ptrdiff_t;
        using pointer = const char32_t*;
        using reference = char32_t;
        using iterator_category = std::forward_iterator_tag;

        utf8_iterator() = default;

        /// @note @p str must outlive the iterator
        explicit utf8_iterator(std::string_view str);

        char32_t operator*() const { return m_current; }

        utf8_iterator& operator++();
        utf8_iterator operator++(int);

        bool operator==(const utf8_iterator& other) const;
        bool operator!=(const utf8_iterator& other) const { return !(*this == other); }

    private:
        std::string_view m_rest;
        char32_t m_current = 0;
        bool m_done = true;

        void advance();
    };

    /**
     * @brief Range adaptor for range-based for over codepoints.
     */
    class ARTFONT_EXPORT utf8_view {
    public:
        explicit utf8_view(std::string_view str)
            : m_str(str) {
        }

        [[nodiscard]] utf8_iterator begin() const { return utf8_iterator(m_str); }
        [[nodiscard]] utf8_iterator end() const { return utf8_iterator(); }

    private:
        std::string_view m_str;
    };
} // namespace artfont
