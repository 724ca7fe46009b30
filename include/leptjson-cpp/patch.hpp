/// @file patch.hpp
/// @brief JSON Patch (RFC 6902): operations, application, and diff.

#pragma once

#include <leptjson-cpp/error.hpp>
#include <leptjson-cpp/pointer.hpp>
#include <leptjson-cpp/value.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace leptjson_cpp {

/// The six RFC 6902 operation kinds.
enum class OpKind : std::uint8_t {
    add,
    remove,
    replace,
    move,
    copy,
    test,
};

/// Convert an OpKind to its wire name ("add", "remove", ...).
constexpr auto to_string_view(OpKind kind) noexcept -> std::string_view {
    switch (kind) {
        case OpKind::add:     return "add";
        case OpKind::remove:  return "remove";
        case OpKind::replace: return "replace";
        case OpKind::move:    return "move";
        case OpKind::copy:    return "copy";
        case OpKind::test:    return "test";
    }
    return "unknown";
}

/// Parse a wire name into an OpKind.
auto op_kind_from_string(std::string_view name) -> std::optional<OpKind>;

/// A single patch operation.
///
/// `from` is used by move and copy; `value` by add, replace and test.
struct Operation {
    OpKind kind{OpKind::add};
    Pointer path{};
    Pointer from{};
    Value value{};

    auto operator==(const Operation&) const -> bool = default;
};

/// A patch failure: which operation failed, at which path, and why.
class PatchException : public Exception {
public:
    PatchException(ErrorKind kind, std::size_t index, std::string path, const std::string& reason);

    /// Position of the failing operation within the patch.
    auto index() const noexcept -> std::size_t { return index_; }
    /// The failing operation's `path` (or `from` when that was the problem).
    auto path() const noexcept -> const std::string& { return path_; }

private:
    std::size_t index_;
    std::string path_;
};

// -- Wire form ----------------------------------------------------------------

/// Read an RFC 6902 patch document: an array of operation objects.
/// @throws PatchException (invalid_patch) naming the offending operation.
auto parse_patch(const Value& document) -> std::vector<Operation>;

/// Write operations as an RFC 6902 patch document.
auto to_value(std::span<const Operation> ops) -> Value;

// -- Pointer-level mutations --------------------------------------------------

/// RFC 6902 "add": insert-or-replace an object member, insert into an
/// array (`-` appends), or replace the whole document for the root pointer.
/// @throws Exception on a missing parent, bad index, or scalar parent.
void add_at(Value& root, const Pointer& path, Value value);

/// RFC 6902 "remove". Returns the removed value.
/// @throws Exception if the target does not exist or is the root.
auto remove_at(Value& root, const Pointer& path) -> Value;

/// RFC 6902 "replace": the target must already exist.
/// @throws Exception if the target does not exist.
void replace_at(Value& root, const Pointer& path, Value value);

// -- Application --------------------------------------------------------------

/// Apply operations in order, mutating `doc` in place.
///
/// This is NOT atomic: if operation N fails, operations 0..N-1 remain
/// applied and the exception reports index N. Use apply_patch_atomic(), or
/// apply to a copy, when all-or-nothing behaviour is required.
/// @throws PatchException
void apply_patch(Value& doc, std::span<const Operation> ops);

/// Parse `patch` with parse_patch() and apply it in place (not atomic).
void apply_patch(Value& doc, const Value& patch);

/// Apply operations to a copy of `doc` and commit only if all succeed.
/// On failure `doc` is unchanged.
/// @throws PatchException
void apply_patch_atomic(Value& doc, std::span<const Operation> ops);

// -- Generation ---------------------------------------------------------------

/// Generate operations that transform `source` into `target`.
///
/// Arrays are compared by position: shared indices are diffed recursively,
/// surplus source elements are removed from the end, and surplus target
/// elements are appended. An object with duplicate keys on either side is
/// replaced as a whole. This is not a minimal edit script.
/// @throws Exception (max_depth_exceeded) if both trees nest containers
///   deeper than `max_depth` along a shared path.
auto diff(const Value& source, const Value& target,
          std::size_t max_depth = default_max_depth) -> std::vector<Operation>;

}  // namespace leptjson_cpp
