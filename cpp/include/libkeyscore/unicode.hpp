#pragma once

#include <string>
#include <string_view>

namespace libkeyscore {

inline constexpr char32_t kLineBreak = U'\n';

[[nodiscard]] std::u32string decode_utf8(std::string_view text);

[[nodiscard]] std::string encode_utf8(char32_t symbol);

[[nodiscard]] std::string encode_utf8(std::u32string_view symbols);

[[nodiscard]] bool is_whitespace(char32_t symbol) noexcept;

// Printable form used in reports: control characters are escaped.
[[nodiscard]] std::string display_symbol(char32_t symbol);

}  // namespace libkeyscore
