/// @file parse.hpp
/// @brief Strict JSON parser: ParseError, ParseOptions, parse(), parse_many().

#pragma once

#include <leptjson-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace leptjson_cpp {

/// Outcome of a parse. Every grammar violation maps to exactly one
/// enumerator; `ok` is the only success value.
enum class ParseError : std::uint8_t {
    ok,
    expect_value,                  ///< Input (or a value slot) is empty.
    invalid_value,                 ///< Malformed literal or number.
    root_not_singular,             ///< Non-whitespace after the root value.
    number_too_big,                ///< Number overflows a double.
    miss_quotation_mark,           ///< String not terminated.
    invalid_string_escape,         ///< Unknown escape character.
    invalid_string_char,           ///< Raw control character inside a string.
    invalid_unicode_hex,           ///< `\u` not followed by four hex digits.
    invalid_unicode_surrogate,     ///< Lone or unpaired UTF-16 surrogate.
    miss_comma_or_square_bracket,  ///< Array element not followed by `,` or `]`.
    miss_key,                      ///< Object member does not start with a string.
    miss_colon,                    ///< Object key not followed by `:`.
    miss_comma_or_curly_bracket,   ///< Object member not followed by `,` or `}`.
    comment_not_closed,            ///< Unterminated `/*` comment.
    max_depth_exceeded,
    max_string_length_exceeded,
    max_array_size_exceeded,
    max_object_size_exceeded,
    max_total_size_exceeded,
    number_range_exceeded,
};

/// Convert a ParseError to its string representation.
constexpr auto to_string_view(ParseError error) noexcept -> std::string_view {
    switch (error) {
        case ParseError::ok:                           return "ok";
        case ParseError::expect_value:                 return "expect_value";
        case ParseError::invalid_value:                return "invalid_value";
        case ParseError::root_not_singular:            return "root_not_singular";
        case ParseError::number_too_big:               return "number_too_big";
        case ParseError::miss_quotation_mark:          return "miss_quotation_mark";
        case ParseError::invalid_string_escape:        return "invalid_string_escape";
        case ParseError::invalid_string_char:          return "invalid_string_char";
        case ParseError::invalid_unicode_hex:          return "invalid_unicode_hex";
        case ParseError::invalid_unicode_surrogate:    return "invalid_unicode_surrogate";
        case ParseError::miss_comma_or_square_bracket: return "miss_comma_or_square_bracket";
        case ParseError::miss_key:                     return "miss_key";
        case ParseError::miss_colon:                   return "miss_colon";
        case ParseError::miss_comma_or_curly_bracket:  return "miss_comma_or_curly_bracket";
        case ParseError::comment_not_closed:           return "comment_not_closed";
        case ParseError::max_depth_exceeded:           return "max_depth_exceeded";
        case ParseError::max_string_length_exceeded:   return "max_string_length_exceeded";
        case ParseError::max_array_size_exceeded:      return "max_array_size_exceeded";
        case ParseError::max_object_size_exceeded:     return "max_object_size_exceeded";
        case ParseError::max_total_size_exceeded:      return "max_total_size_exceeded";
        case ParseError::number_range_exceeded:        return "number_range_exceeded";
    }
    return "unknown";
}

/// Parser configuration: resource limits and lenient extensions.
///
/// The defaults accept any strict RFC 8259 document nested up to 1000
/// levels. Use hardened() for untrusted input.
struct ParseOptions {
    static constexpr auto unlimited = std::numeric_limits<std::size_t>::max();

    std::size_t max_depth{default_max_depth}; ///< Maximum container nesting.
    std::size_t max_string_length{unlimited}; ///< Bytes per decoded string.
    std::size_t max_array_size{unlimited};    ///< Elements per array.
    std::size_t max_object_size{unlimited};   ///< Members per object.
    std::size_t max_total_size{unlimited};    ///< Bytes of input text.
    double max_number_magnitude{std::numeric_limits<double>::infinity()};

    bool allow_comments{false};        ///< Accept `//` and `/* */` as whitespace.
    bool allow_trailing_commas{false}; ///< Accept `,` before `]` or `}`.

    /// Limits suited to untrusted input: 8 KiB strings, 10 000 entries per
    /// container, 1 MiB documents, magnitudes up to 1e308.
    static constexpr auto hardened() noexcept -> ParseOptions {
        return ParseOptions{
            .max_depth = default_max_depth,
            .max_string_length = 8192,
            .max_array_size = 10000,
            .max_object_size = 10000,
            .max_total_size = 1048576,
            .max_number_magnitude = 1e308,
        };
    }
};

/// Position of a parse failure. Line and column are 1-based; column counts
/// bytes.
struct SourceLocation {
    std::size_t offset{0};
    std::size_t line{1};
    std::size_t column{1};

    auto operator==(const SourceLocation&) const -> bool = default;
};

/// Result of parse(). On failure `value` is Null.
struct ParseResult {
    Value value;
    ParseError error{ParseError::ok};
    SourceLocation location;

    explicit operator bool() const noexcept { return error == ParseError::ok; }
};

/// Parse a complete JSON text.
///
/// Never throws for malformed input; the failure is reported through
/// ParseResult::error and no partial value is returned.
///
/// @code
/// auto result = parse(R"({"a":[1,2]})");
/// if (!result) std::puts(describe(result, text).c_str());
/// @endcode
auto parse(std::string_view text, const ParseOptions& options = {}) -> ParseResult;

/// Parse many independent documents concurrently.
/// Results are returned in input order.
auto parse_many(std::span<const std::string_view> texts,
                const ParseOptions& options = {}) -> std::vector<ParseResult>;

/// Render a failed result as "<error> at line L, column C" followed by the
/// offending source line and a caret marker. Returns "ok" on success.
auto describe(const ParseResult& result, std::string_view text) -> std::string;

}  // namespace leptjson_cpp
