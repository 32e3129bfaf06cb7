#include "libkeyscore/unicode.hpp"

#include <cstdint>
#include <stdexcept>

namespace libkeyscore {

namespace {
[[nodiscard]] std::uint32_t continuation(std::string_view text, std::size_t pos) {
    if (pos >= text.size()) {
        throw std::invalid_argument("truncated UTF-8 sequence");
    }
    const auto byte = static_cast<unsigned char>(text[pos]);
    if ((byte & 0xC0u) != 0x80u) {
        throw std::invalid_argument("invalid UTF-8 continuation byte");
    }
    return byte & 0x3Fu;
}
}  // namespace

std::u32string decode_utf8(std::string_view text) {
    std::u32string decoded;
    decoded.reserve(text.size());
    std::size_t pos = 0;
    while (pos < text.size()) {
        const auto lead = static_cast<unsigned char>(text[pos]);
        std::uint32_t code_point = 0;
        if (lead < 0x80u) {
            code_point = lead;
            pos += 1;
        } else if ((lead & 0xE0u) == 0xC0u) {
            code_point = ((lead & 0x1Fu) << 6) | continuation(text, pos + 1);
            if (code_point < 0x80u) {
                throw std::invalid_argument("overlong UTF-8 sequence");
            }
            pos += 2;
        } else if ((lead & 0xF0u) == 0xE0u) {
            code_point = ((lead & 0x0Fu) << 12) | (continuation(text, pos + 1) << 6) | continuation(text, pos + 2);
            if (code_point < 0x800u || (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
                throw std::invalid_argument("invalid UTF-8 code point");
            }
            pos += 3;
        } else if ((lead & 0xF8u) == 0xF0u) {
            code_point = ((lead & 0x07u) << 18) | (continuation(text, pos + 1) << 12) |
                         (continuation(text, pos + 2) << 6) | continuation(text, pos + 3);
            if (code_point < 0x10000u || code_point > 0x10FFFFu) {
                throw std::invalid_argument("invalid UTF-8 code point");
            }
            pos += 4;
        } else {
            throw std::invalid_argument("invalid UTF-8 lead byte");
        }
        decoded.push_back(static_cast<char32_t>(code_point));
    }
    return decoded;
}

std::string encode_utf8(char32_t symbol) {
    const auto cp = static_cast<std::uint32_t>(symbol);
    std::string encoded;
    if (cp < 0x80u) {
        encoded.push_back(static_cast<char>(cp));
    } else if (cp < 0x800u) {
        encoded.push_back(static_cast<char>(0xC0u | (cp >> 6)));
        encoded.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp < 0x10000u) {
        encoded.push_back(static_cast<char>(0xE0u | (cp >> 12)));
        encoded.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        encoded.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else if (cp <= 0x10FFFFu) {
        encoded.push_back(static_cast<char>(0xF0u | (cp >> 18)));
        encoded.push_back(static_cast<char>(0x80u | ((cp >> 12) & 0x3Fu)));
        encoded.push_back(static_cast<char>(0x80u | ((cp >> 6) & 0x3Fu)));
        encoded.push_back(static_cast<char>(0x80u | (cp & 0x3Fu)));
    } else {
        throw std::invalid_argument("code point out of range: " + std::to_string(cp));
    }
    return encoded;
}

std::string encode_utf8(std::u32string_view symbols) {
    std::string encoded;
    encoded.reserve(symbols.size());
    for (char32_t symbol : symbols) {
        encoded += encode_utf8(symbol);
    }
    return encoded;
}

bool is_whitespace(char32_t symbol) noexcept {
    switch (symbol) {
        case U'\t':
        case U'\n':
        case U'\v':
        case U'\f':
        case U'\r':
        case U' ':
        case U'\u0085':
        case U'\u00A0':
        case U'\u1680':
        case U'\u2028':
        case U'\u2029':
        case U'\u202F':
        case U'\u205F':
        case U'\u3000':
            return true;
        default:
            return symbol >= U'\u2000' && symbol <= U'\u200A';
    }
}

std::string display_symbol(char32_t symbol) {
    switch (symbol) {
        case U'\n':
            return "\\n";
        case U'\t':
            return "\\t";
        case U'\r':
            return "\\r";
        case U' ':
            return "\u2423";
        default:
            return encode_utf8(symbol);
    }
}

}  // namespace libkeyscore
