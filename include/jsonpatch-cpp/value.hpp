/// @file value.hpp
/// @brief The JSON value model: Null, Value, Array, Object, and ValueKind.

#pragma once

#include <jsonpatch-cpp/error.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>
#include <map>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace jsonpatch_cpp {

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

struct Value;

/// A JSON array.
using Array = std::vector<Value>;

/// A JSON object. Keys iterate in sorted order, which gives the differ a
/// deterministic walk.
using Object = std::map<std::string, Value, std::less<>>;

/// The kinds of JSON value, as seen by equality and the differ.
enum class ValueKind : std::uint8_t {
    null,      ///< JSON null.
    boolean,   ///< true or false.
    integer,   ///< A signed or unsigned integer.
    floating,  ///< A floating point number.
    string,    ///< A UTF-8 string.
    object,    ///< A string-keyed map of values.
    array,     ///< An ordered sequence of values.
};

/// Convert a ValueKind to its string representation.
constexpr auto to_string_view(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::null:     return "null";
        case ValueKind::boolean:  return "boolean";
        case ValueKind::integer:  return "integer";
        case ValueKind::floating: return "floating";
        case ValueKind::string:   return "string";
        case ValueKind::object:   return "object";
        case ValueKind::array:    return "array";
    }
    return "unknown";
}

/// A JSON value.
///
/// Alternatives: Null, bool, int64_t, uint64_t, double, string, Array,
/// Object. uint64_t only holds values above INT64_MAX; smaller unsigned
/// inputs are stored as int64_t.
///
/// @code
/// auto v = Value{Object{{"name", "Alice"}, {"tags", Array{1, 2, 3}}}};
/// if (const auto* obj = v.get_if<Object>()) { ... }
/// @endcode
struct Value {
    using Storage = std::variant<
        Null,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Array,
        Object
    >;

    Storage data{};

    Value() = default;
    Value(Null) {}
    Value(std::nullptr_t) {}
    Value(bool b) : data{b} {}

    template <std::integral I>
        requires (!std::same_as<I, bool>)
    Value(I i) {
        if constexpr (std::is_signed_v<I>) {
            data = static_cast<std::int64_t>(i);
        } else if (static_cast<std::uint64_t>(i) <=
                   static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            data = static_cast<std::int64_t>(i);
        } else {
            data = static_cast<std::uint64_t>(i);
        }
    }

    template <std::floating_point F>
    Value(F f) : data{static_cast<double>(f)} {}

    Value(const char* s) : data{std::string{s}} {}
    Value(std::string s) : data{std::move(s)} {}
    Value(std::string_view s) : data{std::string{s}} {}
    Value(Array a) : data{std::move(a)} {}
    Value(Object o) : data{std::move(o)} {}

    /// The kind of this value.
    auto kind() const noexcept -> ValueKind;

    auto is_null() const noexcept -> bool { return std::holds_alternative<Null>(data); }
    auto is_object() const noexcept -> bool { return std::holds_alternative<Object>(data); }
    auto is_array() const noexcept -> bool { return std::holds_alternative<Array>(data); }

    /// Pointer to the held alternative, or nullptr on type mismatch.
    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data); }

    /// Deep structural equality.
    ///
    /// Objects are equal iff they have the same keys with equal values; arrays
    /// iff they have the same length and pairwise equal elements. Scalars must
    /// have the same kind and value; int64_t and uint64_t compare numerically,
    /// but a floating point number never equals an integer.
    friend auto operator==(const Value& a, const Value& b) -> bool;
};

/// True if every number in the value is finite.
auto is_encodable(const Value& v) -> bool;

/// Structurally copy a value.
/// Fails with ErrorKind::not_encodable if the value holds NaN or infinity.
auto clone(const Value& v) -> Result<Value>;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const Object& o) { ... },
///     [](const Array& a) { ... },
///     [](const auto&) { ... },
/// }, value.data);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

}  // namespace jsonpatch_cpp
