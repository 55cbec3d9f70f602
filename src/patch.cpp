#include <jsonpatch-cpp/patch.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonpatch_cpp {

namespace {

// The document is held as the only member of a synthetic root object under
// this key, so operations on "" are mutations of a child like any other.
constexpr auto document_key = std::string_view{"document"};

using Failure = std::optional<Error>;

// A target pointer as the caller wrote it, without the synthetic key.
auto display(const Pointer& target) -> std::string {
    const auto& segments = target.segments();
    return Pointer{std::vector<std::string>(segments.begin() + 1, segments.end())}.to_string();
}

// An integer in index syntax that parse_array_index rejects is negative or
// too large for std::size_t: out of range rather than malformed.
auto is_integer_text(std::string_view segment) -> bool {
    if (!segment.empty() && segment.front() == '-') segment.remove_prefix(1);
    if (segment.empty()) return false;
    if (segment.size() > 1 && segment.front() == '0') return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](char c) { return c >= '0' && c <= '9'; });
}

auto resolve_parent(Value& wrapper, const Pointer& target) -> Result<Value*> {
    auto parent = target.parent();
    if (!parent) return parent.error();
    return parent->traverse(wrapper);
}

auto add_child(Value& wrapper, const Pointer& target, Value value, bool strict) -> Failure {
    auto parent = resolve_parent(wrapper, target);
    if (!parent) return parent.error();
    const auto& child = target.back();

    return std::visit(overload{
        [&](Object& obj) -> Failure {
            auto it = obj.find(child);
            if (it != obj.end()) {
                if (strict) {
                    return Error{ErrorKind::duplicate_key,
                                 "cannot add \"" + display(target) +
                                     "\": value already exists (use lenient mode to overwrite)"};
                }
                it->second = std::move(value);
                return std::nullopt;
            }
            obj.emplace(child, std::move(value));
            return std::nullopt;
        },
        [&](Array& arr) -> Failure {
            if (child == end_of_array) {
                arr.push_back(std::move(value));
                return std::nullopt;
            }
            auto index = parse_array_index(child);
            if (!index && !is_integer_text(child)) {
                return Error{ErrorKind::invalid_index,
                             "could not parse array index \"" + child + "\""};
            }
            if (!index || *index > arr.size()) {
                return Error{ErrorKind::index_out_of_bounds,
                             "array index " + child + " out of bounds for add (size " +
                                 std::to_string(arr.size()) + ")"};
            }
            arr.insert(arr.begin() + static_cast<std::ptrdiff_t>(*index), std::move(value));
            return std::nullopt;
        },
        [&](const auto&) -> Failure {
            return Error{ErrorKind::invalid_target,
                         "cannot add \"" + display(target) + "\": parent is not an object or array"};
        },
    }, (*parent)->data);
}

auto remove_child(Value& wrapper, const Pointer& target, bool strict) -> Failure {
    auto parent = resolve_parent(wrapper, target);
    if (!parent) return parent.error();
    const auto& child = target.back();

    return std::visit(overload{
        [&](Object& obj) -> Failure {
            auto it = obj.find(child);
            if (it == obj.end()) {
                if (strict) {
                    return Error{ErrorKind::missing_key,
                                 "cannot remove \"" + display(target) +
                                     "\": key does not exist (use lenient mode to allow this)"};
                }
                return std::nullopt;
            }
            obj.erase(it);
            return std::nullopt;
        },
        [&](Array& arr) -> Failure {
            auto index = parse_array_index(child);
            if (!index && !is_integer_text(child)) {
                return Error{ErrorKind::invalid_index,
                             "could not parse array index \"" + child + "\""};
            }
            if (!index || *index >= arr.size()) {
                if (strict) {
                    return Error{ErrorKind::index_out_of_bounds,
                                 "array index " + child + " out of bounds for remove (size " +
                                     std::to_string(arr.size()) + ")"};
                }
                return std::nullopt;
            }
            arr.erase(arr.begin() + static_cast<std::ptrdiff_t>(*index));
            return std::nullopt;
        },
        [&](const auto&) -> Failure {
            return Error{ErrorKind::invalid_target,
                         "cannot remove \"" + display(target) + "\": parent is not an object or array"};
        },
    }, (*parent)->data);
}

// Copies the value at a pointer out of the document.
auto read_at(Value& wrapper, const Pointer& source) -> Result<Value> {
    auto found = source.traverse(wrapper);
    if (!found) return found.error();
    return **found;
}

auto apply_one(Value& wrapper, const Operation& op, const Pointer& root,
               bool strict) -> std::optional<ApplyError> {
    const auto rooted = rebase(op, root);
    auto lift = [](Failure failure) -> std::optional<ApplyError> {
        if (!failure) return std::nullopt;
        return ApplyError{std::move(*failure)};
    };

    return std::visit(overload{
        [&](const OpAdd& o) {
            return lift(add_child(wrapper, o.path, o.value, strict));
        },
        [&](const OpRemove& o) {
            return lift(remove_child(wrapper, o.path, strict));
        },
        [&](const OpReplace& o) {
            if (auto failure = remove_child(wrapper, o.path, strict)) return lift(std::move(failure));
            return lift(add_child(wrapper, o.path, o.value, strict));
        },
        [&](const OpMove& o) {
            auto value = read_at(wrapper, o.from);
            if (!value) return lift(value.error());
            if (auto failure = remove_child(wrapper, o.from, strict)) return lift(std::move(failure));
            return lift(add_child(wrapper, o.to, std::move(value).value(), strict));
        },
        [&](const OpCopy& o) {
            auto value = read_at(wrapper, o.from);
            if (!value) return lift(value.error());
            return lift(add_child(wrapper, o.to, std::move(value).value(), strict));
        },
        [&](const OpTest& o) -> std::optional<ApplyError> {
            auto actual = o.path.traverse(wrapper);
            if (!actual) return lift(actual.error());
            if (!(**actual == o.value)) return ApplyError{TestFailed{op}};
            return std::nullopt;
        },
    }, rooted);
}

}  // anonymous namespace

auto is_test_failure(const ApplyError& error) -> bool {
    return std::holds_alternative<TestFailed>(error);
}

auto describe(const ApplyError& error) -> std::string {
    return std::visit(overload{
        [](const Error& e) {
            return std::string{to_string_view(e.kind)} + ": " + e.message;
        },
        [](const TestFailed& t) {
            if (const auto* test = std::get_if<OpTest>(&t.operation)) {
                return "test failed: value at \"" + test->path.to_string() + "\" does not match";
            }
            return std::string{"test failed"};
        },
    }, error);
}

auto apply(const Value& base, std::span<const Operation> operations,
           bool strict) -> Result<Value, ApplyError> {
    auto copy = clone(base);
    if (!copy) return ApplyError{copy.error()};

    const auto key = std::string{document_key};
    auto wrapper = Value{Object{}};
    wrapper.get_if<Object>()->emplace(key, std::move(copy).value());
    const auto root = Pointer{std::vector<std::string>{key}};

    for (std::size_t i = 0; i < operations.size(); ++i) {
        auto failure = apply_one(wrapper, operations[i], root, strict);
        if (!failure) continue;
        if (auto* err = std::get_if<Error>(&*failure)) {
            err->message = "operation " + std::to_string(i) + " (" +
                           std::string{to_string_view(kind_of(operations[i]))} + "): " +
                           err->message;
        }
        return std::move(*failure);
    }

    auto& members = *wrapper.get_if<Object>();
    auto it = members.find(key);
    if (it == members.end()) {
        // Only reachable if an operation removed the document itself.
        return Value{};
    }
    return std::move(it->second);
}

}  // namespace jsonpatch_cpp
