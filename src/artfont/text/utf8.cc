//
// Created by igor on 14/01/2026.
//

#include <artfont/text/utf8.hh>

namespace artfont {

namespace {

constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;
constexpr char32_t MAX_CODEPOINT = 0x10FFFF;

constexpr bool is_continuation(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

constexpr bool is_surrogate(char32_t cp) {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

// Length of the sequence announced by a lead byte, 0 if the byte cannot start one
constexpr int sequence_length(unsigned char lead) {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// Smallest codepoint that needs a sequence of the given length
constexpr char32_t min_codepoint(int length) {
    switch (length) {
        case 2: return 0x80;
        case 3: return 0x800;
        case 4: return 0x10000;
        default: return 0;
    }
}

} // anonymous namespace

utf8_decode_result utf8_decode_one(std::string_view str) {
    if (str.empty()) {
        return {REPLACEMENT_CHAR, 0};
    }

    const auto* bytes = reinterpret_cast<const unsigned char*>(str.data());
    const unsigned char lead = bytes[0];
    const int length = sequence_length(lead);

    if (length == 1) {
        return {static_cast<char32_t>(lead), 1};
    }
    if (length == 0 || str.size() < static_cast<std::size_t>(length)) {
        return {REPLACEMENT_CHAR, 1};
    }

    // Payload bits of the lead byte: 5, 4 or 3 bits for 2, 3, 4 byte sequences
    char32_t cp = static_cast<char32_t>(lead & (0x7F >> length));
    for (int i = 1; i < length; ++i) {
        if (!is_continuation(bytes[i])) {
            return {REPLACEMENT_CHAR, 1};
        }
        cp = (cp << 6) | static_cast<char32_t>(bytes[i] & 0x3F);
    }

    if (cp < min_codepoint(length) || cp > MAX_CODEPOINT || is_surrogate(cp)) {
        return {REPLACEMENT_CHAR, length};
    }
    return {cp, length};
}

std::size_t utf8_length(std::string_view str) {
    std::size_t count = 0;
    while (!str.empty()) {
        const auto [cp, bytes] = utf8_decode_one(str);
        if (bytes == 0) break;
        str.remove_prefix(static_cast<std::size_t>(bytes));
        ++count;
    }
    return count;
}

void utf8_append(std::string& out, char32_t cp) {
    if (cp > MAX_CODEPOINT || is_surrogate(cp)) {
        cp = REPLACEMENT_CHAR;
    }

    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf8_encode(char32_t cp) {
    std::string out;
    utf8_append(out, cp);
    return out;
}

utf8_iterator::utf8_iterator(std::string_view str)
    : m_rest(str),
      m_done(false) {
    advance();
}

void utf8_iterator::advance() {
    const auto [cp, bytes] = utf8_decode_one(m_rest);
    if (bytes == 0) {
        m_done = true;
        m_current = 0;
        return;
    }
    m_current = cp;
    m_rest.remove_prefix(static_cast<std::size_t>(bytes));
}

utf8_iterator& utf8_iterator::operator++() {
    advance();
    return *this;
}

utf8_iterator utf8_iterator::operator++(int) {
    utf8_iterator tmp = *this;
    ++(*this);
    return tmp;
}

bool utf8_iterator::operator==(const utf8_iterator& other) const {
    if (m_done || other.m_done) {
        return m_done == other.m_done;
    }
    return m_rest.data() == other.m_rest.data() &&
           m_rest.size() == other.m_rest.size();
}

} // namespace artfont
