/// @file interop.hpp
/// @brief nlohmann/json interoperability for leptjson-cpp.
///
/// Provides ADL serialization (to_json/from_json) for Value, Pointer and
/// patch Operation, plus whole-document export/import.

#pragma once

#include <leptjson-cpp/patch.hpp>
#include <leptjson-cpp/pointer.hpp>
#include <leptjson-cpp/value.hpp>

#include <nlohmann/json.hpp>

namespace leptjson_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);

/// Numbers become floating-point JSON numbers; non-finite numbers become
/// null. Only the first member of a duplicated key is exported.
void to_json(nlohmann::json& j, const Value& v);

/// Integers and unsigned integers are converted to double.
/// @throws Exception (type_mismatch) for binary or discarded values.
void from_json(const nlohmann::json& j, Value& v);

/// A pointer serializes as its escaped string form.
void to_json(nlohmann::json& j, const Pointer& p);
void from_json(const nlohmann::json& j, Pointer& p);

/// An operation serializes as an RFC 6902 operation object.
void to_json(nlohmann::json& j, const Operation& op);
/// @throws PatchException (invalid_patch) for a malformed operation object.
void from_json(const nlohmann::json& j, Operation& op);

// =============================================================================
// Document export / import
// =============================================================================

/// Export a document as a nlohmann::json value.
auto export_json(const Value& v) -> nlohmann::json;

/// Import a nlohmann::json value as a document.
auto import_json(const nlohmann::json& j) -> Value;

}  // namespace leptjson_cpp
