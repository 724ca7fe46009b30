#pragma once

// UTF-16 escape decoding and UTF-8 encoding helpers shared by the parser
// and serializer.
// Internal header, not installed.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace leptjson_cpp::text {

inline constexpr std::uint32_t high_surrogate_first = 0xD800;
inline constexpr std::uint32_t high_surrogate_last = 0xDBFF;
inline constexpr std::uint32_t low_surrogate_first = 0xDC00;
inline constexpr std::uint32_t low_surrogate_last = 0xDFFF;

constexpr auto is_high_surrogate(std::uint32_t u) noexcept -> bool {
    return u >= high_surrogate_first && u <= high_surrogate_last;
}

constexpr auto is_low_surrogate(std::uint32_t u) noexcept -> bool {
    return u >= low_surrogate_first && u <= low_surrogate_last;
}

// Combine a surrogate pair into a code point above the BMP.
constexpr auto merge_surrogates(std::uint32_t high, std::uint32_t low) noexcept -> std::uint32_t {
    return 0x10000 + (high - high_surrogate_first) * 0x400 + (low - low_surrogate_first);
}

constexpr auto hex_digit_value(char c) noexcept -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Decode exactly four hex digits (case-insensitive).
// Returns nullopt if fewer than four characters remain or any is not hex.
constexpr auto decode_hex4(std::string_view s) noexcept -> std::optional<std::uint32_t> {
    if (s.size() < 4) return std::nullopt;
    auto value = std::uint32_t{0};
    for (std::size_t i = 0; i < 4; ++i) {
        auto digit = hex_digit_value(s[i]);
        if (digit < 0) return std::nullopt;
        value = (value << 4) | static_cast<std::uint32_t>(digit);
    }
    return value;
}

// Append the UTF-8 encoding of a code point (<= 0x10FFFF).
inline void append_utf8(std::uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back(static_cast<char>(cp));
    } else if (cp <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0xFF)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0xFF)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0xFF)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Append a "\u00XX" escape for a control byte.
inline void append_control_escape(unsigned char c, std::string& out) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    out += "\\u00";
    out.push_back(hex_chars[c >> 4]);
    out.push_back(hex_chars[c & 0x0F]);
}

}  // namespace leptjson_cpp::text
