/// @file merge_patch.hpp
/// @brief JSON Merge Patch (RFC 7396): apply and generate.

#pragma once

#include <leptjson-cpp/value.hpp>

namespace leptjson_cpp {

/// Apply an RFC 7396 merge patch and return the merged document.
/// - Non-object patch: replaces the whole document
/// - null member: deletes the key
/// - object member onto an object: merged recursively
/// - anything else: set/replace
///
/// A non-object target under an object patch is treated as `{}`.
///
/// @code
/// auto merged = apply_merge_patch(doc, Value::object({{"a", Null{}}}));
/// @endcode
auto apply_merge_patch(const Value& target, const Value& patch) -> Value;

/// In-place variant of apply_merge_patch().
void merge_patch(Value& target, const Value& patch);

/// Generate a merge patch that turns `source` into `target`.
/// If either side is not an object the patch is `target` itself.
auto create_merge_patch(const Value& source, const Value& target) -> Value;

}  // namespace leptjson_cpp
