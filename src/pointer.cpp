#include <jsonpatch-cpp/pointer.hpp>

#include <algorithm>
#include <charconv>
#include <string>
#include <system_error>
#include <utility>

namespace jsonpatch_cpp {

namespace {

/// Unescape one segment: "~1" -> '/', "~0" -> '~', left to right, so that
/// "~01" becomes "~1" rather than "/".
auto unescape_segment(std::string_view raw) -> std::optional<std::string> {
    auto segment = std::string{};
    segment.reserve(raw.size());
    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            segment.push_back(raw[i]);
            continue;
        }
        if (i + 1 >= raw.size()) return std::nullopt;
        if (raw[i + 1] == '0') {
            segment.push_back('~');
        } else if (raw[i + 1] == '1') {
            segment.push_back('/');
        } else {
            return std::nullopt;
        }
        ++i;
    }
    return segment;
}

template <typename V>
auto traverse_impl(const std::vector<std::string>& segments, V& root)
    -> Result<V*> {
    V* current = &root;
    for (std::size_t depth = 0; depth < segments.size(); ++depth) {
        const auto& segment = segments[depth];
        if (auto* obj = current->template get_if<Object>()) {
            auto it = obj->find(segment);
            if (it == obj->end()) {
                return Error{ErrorKind::path_not_found,
                             "key \"" + segment + "\" not found"};
            }
            current = &it->second;
        } else if (auto* arr = current->template get_if<Array>()) {
            auto index = parse_array_index(segment);
            if (!index) {
                return Error{ErrorKind::invalid_index,
                             "invalid array index \"" + segment + "\""};
            }
            if (*index >= arr->size()) {
                return Error{ErrorKind::path_not_found,
                             "array index " + segment + " out of range (size " +
                                 std::to_string(arr->size()) + ")"};
            }
            current = &(*arr)[*index];
        } else {
            return Error{ErrorKind::path_not_found,
                         "cannot step into a " + std::string{to_string_view(current->kind())} +
                             " with segment \"" + segment + "\""};
        }
    }
    return current;
}

}  // anonymous namespace

auto Pointer::parse(std::string_view text) -> Result<Pointer> {
    if (text.empty()) return Pointer{};
    if (text[0] != '/') {
        return Error{ErrorKind::malformed_pointer,
                     "JSON Pointer must start with '/' or be empty: \"" + std::string{text} + "\""};
    }
    auto segments = std::vector<std::string>{};
    auto pos = std::size_t{1};
    while (true) {
        auto next = text.find('/', pos);
        auto segment = unescape_segment(text.substr(pos, next - pos));
        if (!segment) {
            return Error{ErrorKind::malformed_pointer,
                         "invalid '~' escape in JSON Pointer \"" + std::string{text} + "\""};
        }
        segments.push_back(std::move(*segment));
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return Pointer{std::move(segments)};
}

auto Pointer::to_string() const -> std::string {
    auto result = std::string{};
    for (const auto& segment : segments_) {
        result.push_back('/');
        result += escape_segment(segment);
    }
    return result;
}

auto Pointer::parent() const -> Result<Pointer> {
    if (is_root()) {
        return Error{ErrorKind::invalid_operation, "the root pointer has no parent"};
    }
    return Pointer{std::vector<std::string>(segments_.begin(), segments_.end() - 1)};
}

auto Pointer::starts_with(const Pointer& prefix) const -> bool {
    if (prefix.size() > size()) return false;
    return std::equal(prefix.segments_.begin(), prefix.segments_.end(), segments_.begin());
}

auto Pointer::traverse(const Value& value) const -> Result<const Value*> {
    return traverse_impl(segments_, value);
}

auto Pointer::traverse(Value& value) const -> Result<Value*> {
    return traverse_impl(segments_, value);
}

auto Pointer::operator/(std::string_view segment) const -> Pointer {
    auto segments = segments_;
    segments.emplace_back(segment);
    return Pointer{std::move(segments)};
}

auto Pointer::operator/(std::size_t index) const -> Pointer {
    return *this / std::string_view{std::to_string(index)};
}

auto join(const Pointer& prefix, const Pointer& suffix) -> Pointer {
    auto segments = prefix.segments();
    segments.insert(segments.end(), suffix.segments().begin(), suffix.segments().end());
    return Pointer{std::move(segments)};
}

auto escape_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

auto parse_array_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros are not allowed per RFC 6901 (except "0" itself)
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

}  // namespace jsonpatch_cpp
