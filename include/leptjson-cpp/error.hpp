/// @file error.hpp
/// @brief Error types for the leptjson-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace leptjson_cpp {

/// Categories of errors raised by pointer, patch and accessor operations.
///
/// Parsing does not use these; it reports a ParseError instead.
enum class ErrorKind : std::uint8_t {
    invalid_pointer,    ///< Pointer text is malformed.
    not_found,          ///< An object has no member with the requested key.
    invalid_index,      ///< An array token is not a valid index.
    out_of_range,       ///< An array index is past the end.
    type_mismatch,      ///< A value has the wrong type for the operation.
    invalid_patch,      ///< A patch document or operation is malformed.
    invalid_move,       ///< A move targets its own location or a descendant.
    test_failed,        ///< A patch test operation found a different value.
    max_depth_exceeded, ///< A recursive walk nested deeper than its limit.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_pointer:    return "invalid_pointer";
        case ErrorKind::not_found:          return "not_found";
        case ErrorKind::invalid_index:      return "invalid_index";
        case ErrorKind::out_of_range:       return "out_of_range";
        case ErrorKind::type_mismatch:      return "type_mismatch";
        case ErrorKind::invalid_patch:      return "invalid_patch";
        case ErrorKind::invalid_move:       return "invalid_move";
        case ErrorKind::test_failed:        return "test_failed";
        case ErrorKind::max_depth_exceeded: return "max_depth_exceeded";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception carrying an Error. Thrown by pointer resolution, typed
/// accessors, and patch application.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error{error.message}, error_{std::move(error)} {}

    Exception(ErrorKind kind, std::string message)
        : Exception{Error{kind, std::move(message)}} {}

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

}  // namespace leptjson_cpp
