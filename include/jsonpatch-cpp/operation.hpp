/// @file operation.hpp
/// @brief The six JSON Patch (RFC 6902) operations.

#pragma once

#include <jsonpatch-cpp/pointer.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

namespace jsonpatch_cpp {

/// The verb of a patch operation.
enum class OpKind : std::uint8_t {
    add,      ///< Insert or set a value.
    remove,   ///< Delete a value.
    replace,  ///< Remove then add at the same location.
    move,     ///< Remove from one location and add at another.
    copy,     ///< Add a copy of one location at another.
    test,     ///< Assert that a location holds a value.
};

/// Convert an OpKind to its wire name.
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

/// Look up an OpKind by its wire name.
auto op_kind_from_string(std::string_view name) -> std::optional<OpKind>;

/// Add `value` at `path`.
struct OpAdd {
    Pointer path;
    Value value;
    auto operator==(const OpAdd&) const -> bool = default;
};

/// Remove the value at `path`.
struct OpRemove {
    Pointer path;
    auto operator==(const OpRemove&) const -> bool = default;
};

/// Replace the value at `path` with `value`.
struct OpReplace {
    Pointer path;
    Value value;
    auto operator==(const OpReplace&) const -> bool = default;
};

/// Move the value at `from` to `to`.
struct OpMove {
    Pointer from;
    Pointer to;
    auto operator==(const OpMove&) const -> bool = default;
};

/// Copy the value at `from` to `to`.
struct OpCopy {
    Pointer from;
    Pointer to;
    auto operator==(const OpCopy&) const -> bool = default;
};

/// Assert that the value at `path` equals `value`.
struct OpTest {
    Pointer path;
    Value value;
    auto operator==(const OpTest&) const -> bool = default;
};

/// A single patch operation.
///
/// Operations are immutable once created and compare structurally.
using Operation = std::variant<
    OpAdd,
    OpRemove,
    OpReplace,
    OpMove,
    OpCopy,
    OpTest
>;

/// The verb of an operation.
auto kind_of(const Operation& op) -> OpKind;

/// Re-root an operation under prefix: every pointer it carries gets the
/// prefix segments prepended.
auto rebase(const Operation& op, const Pointer& prefix) -> Operation;

}  // namespace jsonpatch_cpp
