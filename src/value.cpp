#include <jsonpatch-cpp/value.hpp>

#include <cmath>
#include <cstdint>
#include <utility>

namespace jsonpatch_cpp {

auto Value::kind() const noexcept -> ValueKind {
    return std::visit(overload{
        [](Null) { return ValueKind::null; },
        [](bool) { return ValueKind::boolean; },
        [](std::int64_t) { return ValueKind::integer; },
        [](std::uint64_t) { return ValueKind::integer; },
        [](double) { return ValueKind::floating; },
        [](const std::string&) { return ValueKind::string; },
        [](const Array&) { return ValueKind::array; },
        [](const Object&) { return ValueKind::object; },
    }, data);
}

namespace {

auto integers_equal(std::int64_t a, std::uint64_t b) -> bool {
    return a >= 0 && static_cast<std::uint64_t>(a) == b;
}

}  // anonymous namespace

auto operator==(const Value& a, const Value& b) -> bool {
    // Signed and unsigned storage of the same integer are the same value.
    if (const auto* ai = std::get_if<std::int64_t>(&a.data)) {
        if (const auto* bu = std::get_if<std::uint64_t>(&b.data)) return integers_equal(*ai, *bu);
    }
    if (const auto* au = std::get_if<std::uint64_t>(&a.data)) {
        if (const auto* bi = std::get_if<std::int64_t>(&b.data)) return integers_equal(*bi, *au);
    }
    if (a.data.index() != b.data.index()) return false;

    return std::visit(overload{
        [&](const Array& lhs) {
            const auto& rhs = std::get<Array>(b.data);
            if (lhs.size() != rhs.size()) return false;
            for (std::size_t i = 0; i < lhs.size(); ++i) {
                if (!(lhs[i] == rhs[i])) return false;
            }
            return true;
        },
        [&](const Object& lhs) {
            const auto& rhs = std::get<Object>(b.data);
            if (lhs.size() != rhs.size()) return false;
            for (const auto& [key, val] : lhs) {
                auto it = rhs.find(key);
                if (it == rhs.end() || !(val == it->second)) return false;
            }
            return true;
        },
        [&](const auto& lhs) {
            return lhs == std::get<std::decay_t<decltype(lhs)>>(b.data);
        },
    }, a.data);
}

auto is_encodable(const Value& v) -> bool {
    return std::visit(overload{
        [](double d) { return std::isfinite(d); },
        [](const Array& arr) {
            for (const auto& elem : arr) {
                if (!is_encodable(elem)) return false;
            }
            return true;
        },
        [](const Object& obj) {
            for (const auto& [key, val] : obj) {
                if (!is_encodable(val)) return false;
            }
            return true;
        },
        [](const auto&) { return true; },
    }, v.data);
}

namespace {

// Returns false on the first non-finite number.
auto clone_into(const Value& src, Value& dst) -> bool {
    return std::visit(overload{
        [&](double d) {
            if (!std::isfinite(d)) return false;
            dst.data = d;
            return true;
        },
        [&](const Array& arr) {
            auto out = Array{};
            out.reserve(arr.size());
            for (const auto& elem : arr) {
                auto& slot = out.emplace_back();
                if (!clone_into(elem, slot)) return false;
            }
            dst.data = std::move(out);
            return true;
        },
        [&](const Object& obj) {
            auto out = Object{};
            for (const auto& [key, val] : obj) {
                auto& slot = out[key];
                if (!clone_into(val, slot)) return false;
            }
            dst.data = std::move(out);
            return true;
        },
        [&](const auto& scalar) {
            dst.data = scalar;
            return true;
        },
    }, src.data);
}

}  // anonymous namespace

auto clone(const Value& v) -> Result<Value> {
    auto copy = Value{};
    if (!clone_into(v, copy)) {
        return Error{ErrorKind::not_encodable, "value contains a non-finite number"};
    }
    return copy;
}

}  // namespace jsonpatch_cpp
