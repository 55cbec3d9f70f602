/// @file diff.hpp
/// @brief Compute the JSON Patch that turns one value into another.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/operation.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <vector>

namespace jsonpatch_cpp {

/// Compute a patch that transforms `before` into `after`.
///
/// Applying the result to `before` in strict mode yields a value equal to
/// `after`. Objects are compared key by key in sorted key order, emitting
/// remove/add for keys on one side only. Arrays of equal length are compared
/// index by index; arrays whose length changed are replaced whole. Any other
/// difference becomes a single replace.
///
/// The result is not guaranteed to be minimal: inserting one element at the
/// front of an array replaces the whole array.
///
/// Fails with ErrorKind::diff_failed if either value is not JSON-encodable.
///
/// @code
/// auto ops = diff(Object{{"a", 1}}, Object{{"b", 2}});
/// // [{"op":"remove","path":"/a"}, {"op":"add","path":"/b","value":2}]
/// @endcode
auto diff(const Value& before, const Value& after) -> Result<std::vector<Operation>>;

}  // namespace jsonpatch_cpp
