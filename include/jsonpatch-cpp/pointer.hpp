/// @file pointer.hpp
/// @brief JSON Pointer (RFC 6901): parsing, serialization, composition,
/// and traversal.

#pragma once

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/value.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp {

/// The array segment meaning "one past the end". Only valid as the last
/// segment of an add target.
inline constexpr std::string_view end_of_array = "-";

/// A parsed JSON Pointer: an ordered sequence of unescaped segments.
///
/// The empty sequence addresses the whole document. Pointers are immutable
/// values; composition returns new pointers.
///
/// @code
/// auto ptr = Pointer::parse("/config/a~1b");   // segments: "config", "a/b"
/// auto child = *ptr / std::size_t{0};          // "/config/a~1b/0"
/// @endcode
class Pointer {
public:
    /// The root pointer.
    Pointer() = default;

    /// Construct from already unescaped segments.
    explicit Pointer(std::vector<std::string> segments)
        : segments_{std::move(segments)} {}

    /// Parse RFC 6901 pointer text.
    /// Fails with ErrorKind::malformed_pointer if non-empty text does not
    /// start with '/', or if '~' is not followed by '0' or '1'.
    static auto parse(std::string_view text) -> Result<Pointer>;

    /// Serialize back to RFC 6901 text. The root pointer is "".
    auto to_string() const -> std::string;

    auto segments() const noexcept -> const std::vector<std::string>& { return segments_; }
    auto size() const noexcept -> std::size_t { return segments_.size(); }
    auto is_root() const noexcept -> bool { return segments_.empty(); }

    /// The last segment. Precondition: !is_root().
    auto back() const -> const std::string& { return segments_.back(); }

    /// All segments but the last.
    /// Fails with ErrorKind::invalid_operation on the root pointer.
    auto parent() const -> Result<Pointer>;

    /// True if every segment of prefix matches the leading segments here.
    auto starts_with(const Pointer& prefix) const -> bool;

    /// Walk a value along this pointer.
    ///
    /// A missing object key, an array index past the end, or a step into a
    /// scalar fails with ErrorKind::path_not_found. An array segment that is
    /// not a canonical index (including "-") fails with
    /// ErrorKind::invalid_index.
    auto traverse(const Value& value) const -> Result<const Value*>;
    auto traverse(Value& value) const -> Result<Value*>;

    /// Append one segment.
    auto operator/(std::string_view segment) const -> Pointer;
    /// Append an array index segment.
    auto operator/(std::size_t index) const -> Pointer;

    auto operator==(const Pointer&) const -> bool = default;

private:
    std::vector<std::string> segments_;
};

/// Concatenate two pointers: every segment of prefix, then every segment of
/// suffix.
auto join(const Pointer& prefix, const Pointer& suffix) -> Pointer;

/// Escape one segment for RFC 6901 text: '~' -> "~0", then '/' -> "~1".
auto escape_segment(std::string_view segment) -> std::string;

/// Parse an array index segment: "0" or a decimal number without leading
/// zeros. Returns nullopt for anything else, including "-".
auto parse_array_index(std::string_view segment) -> std::optional<std::size_t>;

}  // namespace jsonpatch_cpp
