#include <jsonpatch-cpp/json.hpp>

#include <jsonpatch-cpp/diff.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace jsonpatch_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

void to_json(nlohmann::json& j, Null) {
    j = nullptr;
}

void to_json(nlohmann::json& j, const Value& v) {
    std::visit(overload{
        [&](Null) { j = nullptr; },
        [&](bool b) { j = b; },
        [&](std::int64_t i) { j = i; },
        [&](std::uint64_t u) { j = u; },
        [&](double d) { j = d; },
        [&](const std::string& s) { j = s; },
        [&](const Array& arr) {
            j = nlohmann::json::array();
            for (const auto& elem : arr) {
                auto child = nlohmann::json{};
                to_json(child, elem);
                j.push_back(std::move(child));
            }
        },
        [&](const Object& obj) {
            j = nlohmann::json::object();
            for (const auto& [key, val] : obj) {
                to_json(j[key], val);
            }
        },
    }, v.data);
}

namespace {

auto convert(const nlohmann::json& j) -> Result<Value> {
    switch (j.type()) {
        case nlohmann::json::value_t::null:
            return Value{};
        case nlohmann::json::value_t::boolean:
            return Value{j.get<bool>()};
        case nlohmann::json::value_t::number_integer:
            return Value{j.get<std::int64_t>()};
        case nlohmann::json::value_t::number_unsigned:
            // If it fits in int64, the Value constructor stores it as int64
            return Value{j.get<std::uint64_t>()};
        case nlohmann::json::value_t::number_float:
            return Value{j.get<double>()};
        case nlohmann::json::value_t::string:
            return Value{j.get<std::string>()};
        case nlohmann::json::value_t::array: {
            auto arr = Array{};
            arr.reserve(j.size());
            for (const auto& elem : j) {
                auto child = convert(elem);
                if (!child) return child.error();
                arr.push_back(std::move(child).value());
            }
            return Value{std::move(arr)};
        }
        case nlohmann::json::value_t::object: {
            auto obj = Object{};
            for (const auto& [key, val] : j.items()) {
                auto child = convert(val);
                if (!child) return child.error();
                obj.emplace(key, std::move(child).value());
            }
            return Value{std::move(obj)};
        }
        case nlohmann::json::value_t::binary:
        case nlohmann::json::value_t::discarded:
            break;
    }
    return Error{ErrorKind::not_encodable,
                 std::string{"cannot convert JSON of type "} + j.type_name() + " to a Value"};
}

}  // anonymous namespace

void from_json(const nlohmann::json& j, Value& v) {
    auto converted = convert(j);
    if (!converted) {
        throw std::runtime_error{converted.error().message};
    }
    v = std::move(converted).value();
}

void to_json(nlohmann::json& j, const Pointer& p) {
    j = p.to_string();
}

void to_json(nlohmann::json& j, const Operation& op) {
    std::visit(overload{
        [&](const OpAdd& o) {
            j = nlohmann::json{{"op", "add"}, {"path", o.path}, {"value", o.value}};
        },
        [&](const OpRemove& o) {
            j = nlohmann::json{{"op", "remove"}, {"path", o.path}};
        },
        [&](const OpReplace& o) {
            j = nlohmann::json{{"op", "replace"}, {"path", o.path}, {"value", o.value}};
        },
        [&](const OpMove& o) {
            j = nlohmann::json{{"op", "move"}, {"from", o.from}, {"to", o.to}};
        },
        [&](const OpCopy& o) {
            j = nlohmann::json{{"op", "copy"}, {"from", o.from}, {"to", o.to}};
        },
        [&](const OpTest& o) {
            j = nlohmann::json{{"op", "test"}, {"path", o.path}, {"value", o.value}};
        },
    }, op);
}

// =============================================================================
// Non-throwing conversions and the wire codec
// =============================================================================

auto value_from_json(const nlohmann::json& j) -> Result<Value> {
    return convert(j);
}

auto parse_json_text(std::string_view text) -> Result<nlohmann::json> {
    try {
        return nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Error{ErrorKind::invalid_json, e.what()};
    }
}

namespace {

auto read_pointer(const nlohmann::json& record, const char* field) -> Result<Pointer> {
    auto it = record.find(field);
    if (it == record.end()) {
        return Error{ErrorKind::malformed_operation,
                     std::string{"patch field \""} + field + "\" is missing"};
    }
    if (!it->is_string()) {
        return Error{ErrorKind::malformed_operation,
                     std::string{"patch field \""} + field + "\" must be a string, got " +
                         it->type_name()};
    }
    return Pointer::parse(it->get_ref<const std::string&>());
}

auto read_value(const nlohmann::json& record) -> Result<Value> {
    auto it = record.find("value");
    if (it == record.end()) {
        return Error{ErrorKind::malformed_operation, "patch field \"value\" is missing"};
    }
    return value_from_json(*it);
}

// move/copy name their target "to"; RFC 6902 spells it "path".
auto read_target(const nlohmann::json& record) -> Result<Pointer> {
    if (!record.contains("to") && record.contains("path")) {
        return read_pointer(record, "path");
    }
    return read_pointer(record, "to");
}

template <typename Op>
auto path_and_value(const nlohmann::json& record) -> Result<Operation> {
    auto path = read_pointer(record, "path");
    if (!path) return path.error();
    auto value = read_value(record);
    if (!value) return value.error();
    return Operation{Op{std::move(path).value(), std::move(value).value()}};
}

template <typename Op>
auto from_and_to(const nlohmann::json& record) -> Result<Operation> {
    auto from = read_pointer(record, "from");
    if (!from) return from.error();
    auto to = read_target(record);
    if (!to) return to.error();
    return Operation{Op{std::move(from).value(), std::move(to).value()}};
}

}  // anonymous namespace

auto operation_from_json(const nlohmann::json& j) -> Result<Operation> {
    if (!j.is_object()) {
        return Error{ErrorKind::malformed_operation,
                     std::string{"patch operation must be an object, got "} + j.type_name()};
    }
    auto op_it = j.find("op");
    if (op_it == j.end()) {
        return Error{ErrorKind::malformed_operation, "patch field \"op\" is missing"};
    }
    if (!op_it->is_string()) {
        return Error{ErrorKind::malformed_operation, "patch field \"op\" must be a string"};
    }
    const auto& name = op_it->get_ref<const std::string&>();
    auto kind = op_kind_from_string(name);
    if (!kind) {
        return Error{ErrorKind::unknown_operation,
                     "invalid JSON Patch operation \"" + name + "\""};
    }

    switch (*kind) {
        case OpKind::add:     return path_and_value<OpAdd>(j);
        case OpKind::replace: return path_and_value<OpReplace>(j);
        case OpKind::test:    return path_and_value<OpTest>(j);
        case OpKind::move:    return from_and_to<OpMove>(j);
        case OpKind::copy:    return from_and_to<OpCopy>(j);
        case OpKind::remove: {
            auto path = read_pointer(j, "path");
            if (!path) return path.error();
            return Operation{OpRemove{std::move(path).value()}};
        }
    }
    return Error{ErrorKind::unknown_operation, "invalid JSON Patch operation \"" + name + "\""};
}

auto patch_from_json(const nlohmann::json& j) -> Result<std::vector<Operation>> {
    if (!j.is_array()) {
        return Error{ErrorKind::malformed_operation, "JSON Patch must be an array"};
    }
    auto ops = std::vector<Operation>{};
    ops.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); ++i) {
        auto op = operation_from_json(j[i]);
        if (!op) {
            auto err = op.error();
            err.message = "operation " + std::to_string(i) + ": " + err.message;
            return err;
        }
        ops.push_back(std::move(op).value());
    }
    return ops;
}

auto patch_to_json(std::span<const Operation> operations) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& op : operations) {
        auto record = nlohmann::json{};
        to_json(record, op);
        j.push_back(std::move(record));
    }
    return j;
}

// =============================================================================
// JSON Patch on nlohmann::json documents
// =============================================================================

auto apply_json_patch(const nlohmann::json& doc, const nlohmann::json& patch,
                      bool strict) -> Result<nlohmann::json, ApplyError> {
    auto ops = patch_from_json(patch);
    if (!ops) return ApplyError{ops.error()};
    auto base = value_from_json(doc);
    if (!base) return ApplyError{base.error()};

    auto patched = jsonpatch_cpp::apply(*base, *ops, strict);
    if (!patched) return std::move(patched).error();

    auto out = nlohmann::json{};
    to_json(out, *patched);
    return out;
}

auto diff_json_patch(const nlohmann::json& before,
                     const nlohmann::json& after) -> Result<nlohmann::json> {
    auto lhs = value_from_json(before);
    if (!lhs) return Error{ErrorKind::diff_failed, lhs.error().message};
    auto rhs = value_from_json(after);
    if (!rhs) return Error{ErrorKind::diff_failed, rhs.error().message};

    auto ops = diff(*lhs, *rhs);
    if (!ops) return ops.error();
    return patch_to_json(*ops);
}

}  // namespace jsonpatch_cpp
