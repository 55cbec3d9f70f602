#include <jsonpatch-cpp/operation.hpp>

#include <array>
#include <utility>

namespace jsonpatch_cpp {

auto op_kind_from_string(std::string_view name) -> std::optional<OpKind> {
    static constexpr auto kinds = std::array{
        OpKind::add, OpKind::remove, OpKind::replace,
        OpKind::move, OpKind::copy, OpKind::test,
    };
    for (auto kind : kinds) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

auto kind_of(const Operation& op) -> OpKind {
    return std::visit(overload{
        [](const OpAdd&) { return OpKind::add; },
        [](const OpRemove&) { return OpKind::remove; },
        [](const OpReplace&) { return OpKind::replace; },
        [](const OpMove&) { return OpKind::move; },
        [](const OpCopy&) { return OpKind::copy; },
        [](const OpTest&) { return OpKind::test; },
    }, op);
}

auto rebase(const Operation& op, const Pointer& prefix) -> Operation {
    return std::visit(overload{
        [&](const OpAdd& o) -> Operation { return OpAdd{join(prefix, o.path), o.value}; },
        [&](const OpRemove& o) -> Operation { return OpRemove{join(prefix, o.path)}; },
        [&](const OpReplace& o) -> Operation { return OpReplace{join(prefix, o.path), o.value}; },
        [&](const OpMove& o) -> Operation { return OpMove{join(prefix, o.from), join(prefix, o.to)}; },
        [&](const OpCopy& o) -> Operation { return OpCopy{join(prefix, o.from), join(prefix, o.to)}; },
        [&](const OpTest& o) -> Operation { return OpTest{join(prefix, o.path), o.value}; },
    }, op);
}

}  // namespace jsonpatch_cpp
