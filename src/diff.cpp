#include <jsonpatch-cpp/diff.hpp>

#include <utility>

namespace jsonpatch_cpp {

namespace {

using Operations = std::vector<Operation>;

void diff_values(const Value& before, const Value& after, const Pointer& at, Operations& out);

// Keys of both objects are visited once each, in sorted order: a merge walk
// over the two sorted maps.
void diff_objects(const Object& before, const Object& after, const Pointer& at, Operations& out) {
    auto lhs = before.begin();
    auto rhs = after.begin();
    while (lhs != before.end() || rhs != after.end()) {
        if (rhs == after.end() || (lhs != before.end() && lhs->first < rhs->first)) {
            out.push_back(OpRemove{at / lhs->first});
            ++lhs;
        } else if (lhs == before.end() || rhs->first < lhs->first) {
            out.push_back(OpAdd{at / rhs->first, rhs->second});
            ++rhs;
        } else {
            diff_values(lhs->second, rhs->second, at / lhs->first, out);
            ++lhs;
            ++rhs;
        }
    }
}

void diff_arrays(const Array& before, const Array& after, const Pointer& at, Operations& out) {
    // Always replace arrays whose size changed (not optimal).
    if (before.size() != after.size()) {
        out.push_back(OpReplace{at, after});
        return;
    }
    for (std::size_t i = 0; i < before.size(); ++i) {
        diff_values(before[i], after[i], at / i, out);
    }
}

void diff_values(const Value& before, const Value& after, const Pointer& at, Operations& out) {
    if (before.is_null() && after.is_null()) return;

    const auto* before_obj = before.get_if<Object>();
    const auto* after_obj = after.get_if<Object>();
    if (before_obj && after_obj) {
        diff_objects(*before_obj, *after_obj, at, out);
        return;
    }

    const auto* before_arr = before.get_if<Array>();
    const auto* after_arr = after.get_if<Array>();
    if (before_arr && after_arr) {
        diff_arrays(*before_arr, *after_arr, at, out);
        return;
    }

    // Null on one side, a kind change, or a different scalar.
    if (!(before == after)) {
        out.push_back(OpReplace{at, after});
    }
}

}  // anonymous namespace

auto diff(const Value& before, const Value& after) -> Result<std::vector<Operation>> {
    if (!is_encodable(before) || !is_encodable(after)) {
        return Error{ErrorKind::diff_failed, "cannot diff a value containing a non-finite number"};
    }
    auto ops = Operations{};
    diff_values(before, after, Pointer{}, ops);
    return ops;
}

}  // namespace jsonpatch_cpp
