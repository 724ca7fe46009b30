/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901): parsing, formatting, and resolution.

#pragma once

#include <leptjson-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace leptjson_cpp {

/// A parsed JSON Pointer: an ordered list of unescaped reference tokens.
/// The empty pointer refers to the whole document.
///
/// @code
/// auto p = Pointer::parse("/a~1b/0");   // tokens: "a/b", "0"
/// auto q = Pointer{} / "items" / 3;     // "/items/3"
/// @endcode
class Pointer {
public:
    Pointer() = default;
    explicit Pointer(std::vector<std::string> tokens) : tokens_{std::move(tokens)} {}

    /// Parse pointer text. "" is the root; anything else must start with
    /// '/'. `~1` decodes to '/', `~0` to '~'.
    /// @throws Exception (invalid_pointer) on any other use of '~' or a
    ///   missing leading '/'.
    static auto parse(std::string_view text) -> Pointer;

    /// Format with `~0` / `~1` escaping; the inverse of parse().
    auto to_string() const -> std::string;

    auto tokens() const noexcept -> const std::vector<std::string>& { return tokens_; }
    auto size() const noexcept -> std::size_t { return tokens_.size(); }

    /// True for the root pointer.
    auto empty() const noexcept -> bool { return tokens_.empty(); }

    /// The last token. Requires a non-root pointer.
    auto back() const -> const std::string&;

    /// The pointer with its last token removed. Requires a non-root pointer.
    auto parent() const -> Pointer;

    /// Append one reference token.
    auto operator/(std::string_view token) const -> Pointer;
    auto operator/(std::size_t index) const -> Pointer;

    /// True if `other` lies strictly below this pointer.
    auto is_prefix_of(const Pointer& other) const noexcept -> bool;

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> tokens_;
};

/// Escape a single reference token: '~' → "~0", '/' → "~1".
auto escape_token(std::string_view token) -> std::string;

/// Parse an array reference token: base-10, no sign, no leading zero.
/// Returns nullopt for anything else, including "-".
auto parse_array_index(std::string_view token) -> std::optional<std::size_t>;

/// Resolve a pointer against a document.
///
/// Objects are searched for the first member with the token as key;
/// arrays take the token as an index; scalars cannot be descended into.
/// @throws Exception with kind not_found, invalid_index, out_of_range or
///   type_mismatch, naming the failing location.
auto resolve(Value& root, const Pointer& pointer) -> Value&;
auto resolve(const Value& root, const Pointer& pointer) -> const Value&;

/// Like resolve(), but returns nullptr instead of throwing.
auto find(Value& root, const Pointer& pointer) noexcept -> Value*;
auto find(const Value& root, const Pointer& pointer) noexcept -> const Value*;

}  // namespace leptjson_cpp
