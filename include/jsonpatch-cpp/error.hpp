/// @file error.hpp
/// @brief Error types and the Result wrapper for the jsonpatch-cpp library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    malformed_pointer,    ///< Pointer text is not valid RFC 6901 syntax.
    path_not_found,       ///< A pointer does not resolve to a value.
    invalid_index,        ///< An array segment is not a valid index.
    index_out_of_bounds,  ///< An array index is outside the allowed range.
    duplicate_key,        ///< Strict add targeted a key that already exists.
    missing_key,          ///< Strict remove targeted a key that does not exist.
    invalid_target,       ///< The parent of a target is not a container.
    invalid_operation,    ///< An operation is invalid in the current context.
    unknown_operation,    ///< An operation record names an unknown verb.
    malformed_operation,  ///< An operation record lacks or mistypes a field.
    not_encodable,        ///< A value cannot be represented as JSON.
    invalid_json,         ///< JSON text could not be parsed.
    diff_failed,          ///< The diff could not be computed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::malformed_pointer:   return "malformed_pointer";
        case ErrorKind::path_not_found:      return "path_not_found";
        case ErrorKind::invalid_index:       return "invalid_index";
        case ErrorKind::index_out_of_bounds: return "index_out_of_bounds";
        case ErrorKind::duplicate_key:       return "duplicate_key";
        case ErrorKind::missing_key:         return "missing_key";
        case ErrorKind::invalid_target:      return "invalid_target";
        case ErrorKind::invalid_operation:   return "invalid_operation";
        case ErrorKind::unknown_operation:   return "unknown_operation";
        case ErrorKind::malformed_operation: return "malformed_operation";
        case ErrorKind::not_encodable:       return "not_encodable";
        case ErrorKind::invalid_json:        return "invalid_json";
        case ErrorKind::diff_failed:         return "diff_failed";
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

/// Either a value of type T or an error of type E.
///
/// Every fallible public function returns a Result instead of throwing.
/// Reading the side that is not held is a programming error and throws
/// std::logic_error.
///
/// @code
/// auto ptr = Pointer::parse("/a/b");
/// if (!ptr) {
///     std::fprintf(stderr, "%s\n", ptr.error().message.c_str());
/// }
/// @endcode
template <typename T, typename E = Error>
class Result {
public:
    Result(T value) : data_{std::in_place_index<0>, std::move(value)} {}
    Result(E error) : data_{std::in_place_index<1>, std::move(error)} {}

    auto has_value() const noexcept -> bool { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    auto value() & -> T& { check_value(); return std::get<0>(data_); }
    auto value() const& -> const T& { check_value(); return std::get<0>(data_); }
    auto value() && -> T&& { check_value(); return std::get<0>(std::move(data_)); }

    auto error() const& -> const E& {
        if (has_value()) throw std::logic_error{"Result holds a value, not an error"};
        return std::get<1>(data_);
    }
    auto error() && -> E&& {
        if (has_value()) throw std::logic_error{"Result holds a value, not an error"};
        return std::get<1>(std::move(data_));
    }

    auto operator*() & -> T& { return value(); }
    auto operator*() const& -> const T& { return value(); }
    auto operator*() && -> T&& { return std::move(*this).value(); }
    auto operator->() -> T* { return &value(); }
    auto operator->() const -> const T* { return &value(); }

private:
    void check_value() const {
        if (!has_value()) throw std::logic_error{"Result holds an error, not a value"};
    }

    std::variant<T, E> data_;
};

}  // namespace jsonpatch_cpp
