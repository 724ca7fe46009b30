#include <leptjson-cpp/parse.hpp>

#include "text/unicode.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace leptjson_cpp {

namespace {

constexpr auto is_digit(char c) noexcept -> bool { return c >= '0' && c <= '9'; }
constexpr auto is_digit_1to9(char c) noexcept -> bool { return c >= '1' && c <= '9'; }

// Sign of the decimal exponent of a strict JSON number literal whose
// mantissa is non-zero: positive means the magnitude is >= 1.
// Used only to tell overflow from underflow after from_chars reports
// result_out_of_range.
auto decimal_magnitude(std::string_view literal) -> std::int64_t {
    auto i = std::size_t{0};
    if (i < literal.size() && literal[i] == '-') ++i;

    auto int_digits = std::int64_t{0};
    auto leading = std::int64_t{-1};  // decimal position of first non-zero digit
    for (; i < literal.size() && is_digit(literal[i]); ++i) {
        if (leading < 0 && literal[i] != '0') leading = int_digits;
        ++int_digits;
    }
    auto magnitude = std::int64_t{0};
    if (leading >= 0) {
        magnitude = int_digits - leading;
    }
    if (i < literal.size() && literal[i] == '.') {
        ++i;
        auto frac_pos = std::int64_t{0};
        for (; i < literal.size() && is_digit(literal[i]); ++i) {
            if (leading < 0 && literal[i] != '0') {
                leading = 0;
                magnitude = -frac_pos;
            }
            ++frac_pos;
        }
    }
    if (i < literal.size() && (literal[i] == 'e' || literal[i] == 'E')) {
        ++i;
        auto negative = false;
        if (i < literal.size() && (literal[i] == '+' || literal[i] == '-')) {
            negative = literal[i] == '-';
            ++i;
        }
        auto exponent = std::int64_t{0};
        for (; i < literal.size() && is_digit(literal[i]); ++i) {
            if (exponent < 100000000) exponent = exponent * 10 + (literal[i] - '0');
        }
        magnitude += negative ? -exponent : exponent;
    }
    return magnitude;
}

// Recursive-descent parser over a complete, in-memory text.
// Every parse_* method leaves `pos_` at the failure point on error.
class Parser {
public:
    Parser(std::string_view text, const ParseOptions& options)
        : text_{text}, options_{options} {}

    auto pos() const -> std::size_t { return pos_; }

    auto run(Value& out) -> ParseError {
        if (text_.size() > options_.max_total_size) {
            return ParseError::max_total_size_exceeded;
        }
        if (auto err = skip_whitespace(); err != ParseError::ok) return err;
        if (auto err = parse_value(out); err != ParseError::ok) return err;
        if (auto err = skip_whitespace(); err != ParseError::ok) return err;
        if (!at_end()) return ParseError::root_not_singular;
        return ParseError::ok;
    }

private:
    // Increments the nesting depth for the lifetime of a container parse.
    class DepthGuard {
    public:
        explicit DepthGuard(std::size_t& depth) : depth_{depth} { ++depth_; }
        ~DepthGuard() { --depth_; }

        DepthGuard(const DepthGuard&) = delete;
        auto operator=(const DepthGuard&) -> DepthGuard& = delete;

    private:
        std::size_t& depth_;
    };

    auto at_end() const -> bool { return pos_ >= text_.size(); }
    auto peek() const -> char { return at_end() ? '\0' : text_[pos_]; }

    auto skip_whitespace() -> ParseError {
        while (!at_end()) {
            auto c = text_[pos_];
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                ++pos_;
            } else if (c == '/' && options_.allow_comments) {
                if (auto err = skip_comment(); err != ParseError::ok) return err;
            } else {
                break;
            }
        }
        return ParseError::ok;
    }

    auto skip_comment() -> ParseError {
        auto next = pos_ + 1 < text_.size() ? text_[pos_ + 1] : '\0';
        if (next == '/') {
            auto eol = text_.find('\n', pos_ + 2);
            pos_ = eol == std::string_view::npos ? text_.size() : eol + 1;
            return ParseError::ok;
        }
        if (next == '*') {
            auto close = text_.find("*/", pos_ + 2);
            if (close == std::string_view::npos) return ParseError::comment_not_closed;
            pos_ = close + 2;
            return ParseError::ok;
        }
        return ParseError::invalid_value;
    }

    auto parse_value(Value& out) -> ParseError {
        switch (peek()) {
            case 'n':  return parse_literal(out, "null", Value{});
            case 't':  return parse_literal(out, "true", Value{true});
            case 'f':  return parse_literal(out, "false", Value{false});
            case '"':  return parse_string(out);
            case '[':  return parse_array(out);
            case '{':  return parse_object(out);
            case '\0':
                if (at_end()) return ParseError::expect_value;
                return ParseError::invalid_value;
            default:
                if (peek() == '-' || is_digit(peek())) return parse_number(out);
                return ParseError::invalid_value;
        }
    }

    auto parse_literal(Value& out, std::string_view literal, Value v) -> ParseError {
        if (text_.substr(pos_, literal.size()) != literal) return ParseError::invalid_value;
        pos_ += literal.size();
        out = std::move(v);
        return ParseError::ok;
    }

    auto parse_number(Value& out) -> ParseError {
        const auto start = pos_;
        if (peek() == '-') ++pos_;

        if (peek() == '0') {
            ++pos_;
            auto c = peek();
            if (is_digit(c) || c == 'x' || c == 'X') return ParseError::invalid_value;
        } else if (is_digit_1to9(peek())) {
            while (is_digit(peek())) ++pos_;
        } else {
            return ParseError::invalid_value;
        }

        if (peek() == '.') {
            ++pos_;
            if (!is_digit(peek())) return ParseError::invalid_value;
            while (is_digit(peek())) ++pos_;
        }

        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!is_digit(peek())) return ParseError::invalid_value;
            while (is_digit(peek())) ++pos_;
        }

        const auto literal = text_.substr(start, pos_ - start);
        auto number = 0.0;
        auto [ptr, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), number);
        if (ec == std::errc::result_out_of_range) {
            if (decimal_magnitude(literal) > 0) {
                pos_ = start;
                return ParseError::number_too_big;
            }
            // from_chars also reports subnormals as out of range; strtod
            // yields the correctly rounded subnormal, or a signed zero.
            const auto copy = std::string{literal};
            number = std::strtod(copy.c_str(), nullptr);
        } else if (ec != std::errc{} || ptr != literal.data() + literal.size()) {
            pos_ = start;
            return ParseError::invalid_value;
        }
        if (std::isinf(number)) {
            pos_ = start;
            return ParseError::number_too_big;
        }
        if (std::fabs(number) > options_.max_number_magnitude) {
            pos_ = start;
            return ParseError::number_range_exceeded;
        }

        out = number;
        return ParseError::ok;
    }

    auto parse_escape(std::string& out) -> ParseError {
        // pos_ is on the character after the backslash.
        if (at_end()) return ParseError::miss_quotation_mark;
        switch (text_[pos_]) {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/');  break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u':  return parse_unicode_escape(out);
            default:   return ParseError::invalid_string_escape;
        }
        ++pos_;
        return ParseError::ok;
    }

    auto parse_unicode_escape(std::string& out) -> ParseError {
        // pos_ is on the 'u'.
        auto unit = text::decode_hex4(text_.substr(pos_ + 1));
        if (!unit) return ParseError::invalid_unicode_hex;
        pos_ += 5;

        auto cp = *unit;
        if (text::is_low_surrogate(cp)) return ParseError::invalid_unicode_surrogate;
        if (text::is_high_surrogate(cp)) {
            if (peek() != '\\' || pos_ + 1 >= text_.size() || text_[pos_ + 1] != 'u') {
                return ParseError::invalid_unicode_surrogate;
            }
            auto low = text::decode_hex4(text_.substr(pos_ + 2));
            if (!low) {
                pos_ += 1;
                return ParseError::invalid_unicode_hex;
            }
            if (!text::is_low_surrogate(*low)) return ParseError::invalid_unicode_surrogate;
            pos_ += 6;
            cp = text::merge_surrogates(cp, *low);
        }
        text::append_utf8(cp, out);
        return ParseError::ok;
    }

    auto parse_string_raw(std::string& out) -> ParseError {
        ++pos_;  // opening quote
        while (true) {
            if (at_end()) return ParseError::miss_quotation_mark;
            auto c = text_[pos_];
            if (c == '"') {
                ++pos_;
                break;
            }
            if (c == '\\') {
                ++pos_;
                if (auto err = parse_escape(out); err != ParseError::ok) return err;
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x20) return ParseError::invalid_string_char;

            // Copy the run of plain bytes in one go.
            auto run_end = pos_ + 1;
            while (run_end < text_.size()) {
                auto r = static_cast<unsigned char>(text_[run_end]);
                if (r == '"' || r == '\\' || r < 0x20) break;
                ++run_end;
            }
            out.append(text_.substr(pos_, run_end - pos_));
            pos_ = run_end;
        }
        if (out.size() > options_.max_string_length) {
            return ParseError::max_string_length_exceeded;
        }
        return ParseError::ok;
    }

    auto parse_string(Value& out) -> ParseError {
        auto s = std::string{};
        if (auto err = parse_string_raw(s); err != ParseError::ok) return err;
        out = std::move(s);
        return ParseError::ok;
    }

    auto parse_array(Value& out) -> ParseError {
        auto guard = DepthGuard{depth_};
        if (depth_ > options_.max_depth) return ParseError::max_depth_exceeded;

        ++pos_;  // '['
        if (auto err = skip_whitespace(); err != ParseError::ok) return err;

        auto elements = Array{};
        if (peek() == ']') {
            ++pos_;
            out = std::move(elements);
            return ParseError::ok;
        }

        while (true) {
            auto element = Value{};
            if (auto err = parse_value(element); err != ParseError::ok) return err;
            if (elements.size() >= options_.max_array_size) {
                return ParseError::max_array_size_exceeded;
            }
            elements.push_back(std::move(element));

            if (auto err = skip_whitespace(); err != ParseError::ok) return err;
            if (peek() == ',') {
                ++pos_;
                if (auto err = skip_whitespace(); err != ParseError::ok) return err;
                if (peek() == ']') {
                    if (!options_.allow_trailing_commas) return ParseError::invalid_value;
                    ++pos_;
                    break;
                }
            } else if (peek() == ']') {
                ++pos_;
                break;
            } else {
                return ParseError::miss_comma_or_square_bracket;
            }
        }

        out = std::move(elements);
        return ParseError::ok;
    }

    auto parse_object(Value& out) -> ParseError {
        auto guard = DepthGuard{depth_};
        if (depth_ > options_.max_depth) return ParseError::max_depth_exceeded;

        ++pos_;  // '{'
        if (auto err = skip_whitespace(); err != ParseError::ok) return err;

        auto members = Object{};
        if (peek() == '}') {
            ++pos_;
            out = std::move(members);
            return ParseError::ok;
        }

        while (true) {
            if (peek() != '"') return ParseError::miss_key;
            auto key = std::string{};
            if (auto err = parse_string_raw(key); err != ParseError::ok) return err;

            if (auto err = skip_whitespace(); err != ParseError::ok) return err;
            if (peek() != ':') return ParseError::miss_colon;
            ++pos_;
            if (auto err = skip_whitespace(); err != ParseError::ok) return err;

            auto value = Value{};
            if (auto err = parse_value(value); err != ParseError::ok) return err;
            if (members.size() >= options_.max_object_size) {
                return ParseError::max_object_size_exceeded;
            }
            members.push_back(Member{std::move(key), std::move(value)});

            if (auto err = skip_whitespace(); err != ParseError::ok) return err;
            if (peek() == ',') {
                ++pos_;
                if (auto err = skip_whitespace(); err != ParseError::ok) return err;
                if (peek() == '}' && options_.allow_trailing_commas) {
                    ++pos_;
                    break;
                }
            } else if (peek() == '}') {
                ++pos_;
                break;
            } else {
                return ParseError::miss_comma_or_curly_bracket;
            }
        }

        out = std::move(members);
        return ParseError::ok;
    }

    std::string_view text_;
    const ParseOptions& options_;
    std::size_t pos_{0};
    std::size_t depth_{0};
};

auto locate(std::string_view text, std::size_t offset) -> SourceLocation {
    offset = std::min(offset, text.size());
    auto location = SourceLocation{.offset = offset, .line = 1, .column = 1};
    auto line_start = std::size_t{0};
    for (std::size_t i = 0; i < offset; ++i) {
        if (text[i] == '\n') {
            ++location.line;
            line_start = i + 1;
        }
    }
    location.column = offset - line_start + 1;
    return location;
}

}  // anonymous namespace

auto parse(std::string_view text, const ParseOptions& options) -> ParseResult {
    auto result = ParseResult{};
    auto parser = Parser{text, options};
    result.error = parser.run(result.value);
    if (result.error != ParseError::ok) {
        result.value.set_null();
        result.location = locate(text, parser.pos());
    }
    return result;
}

auto describe(const ParseResult& result, std::string_view text) -> std::string {
    if (result.error == ParseError::ok) return "ok";

    const auto& loc = result.location;
    auto message = std::string{to_string_view(result.error)};
    message += " at line " + std::to_string(loc.line) + ", column " + std::to_string(loc.column);

    const auto line_start = loc.offset - (loc.column - 1);
    if (line_start <= text.size()) {
        auto line_end = text.find('\n', line_start);
        if (line_end == std::string_view::npos) line_end = text.size();
        auto line = text.substr(line_start, line_end - line_start);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        message += '\n';
        message += line;
        message += '\n';
        message += std::string(loc.column - 1, ' ');
        message += '^';
    }
    return message;
}

}  // namespace leptjson_cpp
