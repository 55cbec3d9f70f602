/// @file json.hpp
/// @brief nlohmann/json interoperability for jsonpatch-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the value model,
/// the RFC 6902 wire codec for operations and patch documents, and
/// convenience entry points that diff and patch nlohmann::json values.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/patch.hpp>
#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <span>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null);
void to_json(nlohmann::json& j, const Value& v);

/// Convert a JSON value into the value model.
/// Throws std::runtime_error for binary or discarded values; use
/// value_from_json() for a non-throwing conversion.
void from_json(const nlohmann::json& j, Value& v);

/// Writes the RFC 6901 pointer text.
void to_json(nlohmann::json& j, const Pointer& p);

/// Writes the wire record of an operation.
void to_json(nlohmann::json& j, const Operation& op);

// =============================================================================
// Non-throwing conversions and the wire codec
// =============================================================================

/// Convert a JSON value into the value model.
/// Fails with ErrorKind::not_encodable for binary or discarded values.
auto value_from_json(const nlohmann::json& j) -> Result<Value>;

/// Parse JSON text. Fails with ErrorKind::invalid_json.
auto parse_json_text(std::string_view text) -> Result<nlohmann::json>;

/// Decode one operation record.
///
/// The record must be an object with a string "op" naming one of the six
/// verbs. add/replace/test need "path" and "value", remove needs "path",
/// move/copy need "from" and "to" ("path" is accepted in place of "to").
///
/// Fails with ErrorKind::malformed_operation for a missing or mistyped
/// field, ErrorKind::unknown_operation for an unknown verb, and
/// ErrorKind::malformed_pointer for bad pointer text.
auto operation_from_json(const nlohmann::json& j) -> Result<Operation>;

/// Decode a patch document (a JSON array of operation records).
/// The first malformed record fails the whole patch.
auto patch_from_json(const nlohmann::json& j) -> Result<std::vector<Operation>>;

/// Encode a sequence of operations as a patch document.
auto patch_to_json(std::span<const Operation> operations) -> nlohmann::json;

// =============================================================================
// JSON Patch on nlohmann::json documents
// =============================================================================

/// Decode `patch`, apply it to `doc`, and encode the result.
/// Decoding failures are reported as Error before anything is applied.
auto apply_json_patch(const nlohmann::json& doc, const nlohmann::json& patch,
                      bool strict = true) -> Result<nlohmann::json, ApplyError>;

/// Compute the patch from `before` to `after` as a patch document.
auto diff_json_patch(const nlohmann::json& before,
                     const nlohmann::json& after) -> Result<nlohmann::json>;

}  // namespace jsonpatch_cpp
