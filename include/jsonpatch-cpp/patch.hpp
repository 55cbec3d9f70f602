/// @file patch.hpp
/// @brief Apply a sequence of JSON Patch operations to a value.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <span>
#include <string>
#include <variant>

namespace jsonpatch_cpp {

/// A `test` operation found a value different from the one it asserted.
struct TestFailed {
    Operation operation;  ///< The failed test operation.
    auto operator==(const TestFailed&) const -> bool = default;
};

/// Why apply() failed: a generic validation error, or a failed assertion.
///
/// Callers typically treat Error as "the patch or input was invalid" and
/// TestFailed as "the document changed under me, retry with fresh data".
using ApplyError = std::variant<Error, TestFailed>;

/// True if the error is a failed `test` assertion.
auto is_test_failure(const ApplyError& error) -> bool;

/// A human-readable description of an apply failure.
auto describe(const ApplyError& error) -> std::string;

/// Apply operations in order to a copy of `base`.
///
/// Each operation sees the effect of every operation before it. `base` is
/// never modified; on failure no partial result is returned.
///
/// In strict mode add fails on an existing object key, and remove/replace
/// fail on a missing key or index. In lenient mode add overwrites, remove of
/// a missing target does nothing, and replace of a missing target adds.
/// move/copy/test always require their source to exist.
///
/// Always call this qualified (jsonpatch_cpp::apply): unqualified calls with
/// std container arguments also find std::apply through ADL.
///
/// @param base The document to patch.
/// @param operations The operations to apply.
/// @param strict Enforce existence preconditions (default true).
auto apply(const Value& base, std::span<const Operation> operations,
           bool strict = true) -> Result<Value, ApplyError>;

}  // namespace jsonpatch_cpp
