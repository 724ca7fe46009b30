/// @file serialize.hpp
/// @brief Value → JSON text.

#pragma once

#include <leptjson-cpp/value.hpp>

#include <cstddef>
#include <iosfwd>
#include <string>

namespace leptjson_cpp {

/// Layout options for stringify().
struct StringifyOptions {
    /// Spaces per nesting level. 0 produces compact output with no
    /// inserted whitespace.
    std::size_t indent{0};
};

/// Serialize a value as compact JSON text.
///
/// Numbers use the shortest decimal form that parses back to the same
/// double; NaN and infinities are written as `null`. Control characters
/// are always escaped. Containers are written in stored order.
auto stringify(const Value& value) -> std::string;

/// Serialize a value, optionally indented.
auto stringify(const Value& value, const StringifyOptions& options) -> std::string;

/// Writes stringify(value).
auto operator<<(std::ostream& os, const Value& value) -> std::ostream&;

}  // namespace leptjson_cpp
