// basic_usage: demonstrates the core jsonpatch-cpp API
//
// Shows building values, parsing pointers, computing a diff, applying it,
// and the difference between strict and lenient application.
//
// Build: cmake -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/basic_usage

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdio>
#include <vector>

namespace jp = jsonpatch_cpp;

static void print(const char* label, const jp::Value& value) {
    auto j = nlohmann::json{};
    jp::to_json(j, value);
    std::printf("%s: %s\n", label, j.dump().c_str());
}

int main() {
    // -- Build two versions of a document ------------------------------------
    const auto before = jp::Value{jp::Object{
        {"title", "Shopping List"},
        {"items", jp::Array{"Milk", "Eggs"}},
        {"owner", jp::Object{{"name", "Alice"}, {"email", "alice@example.com"}}},
    }};
    const auto after = jp::Value{jp::Object{
        {"title", "Groceries"},
        {"items", jp::Array{"Milk", "Eggs", "Bread"}},
        {"owner", jp::Object{{"name", "Alice"}}},
        {"shared", true},
    }};
    print("before", before);
    print("after ", after);

    // -- Diff ----------------------------------------------------------------
    auto ops = jp::diff(before, after);
    if (!ops) {
        std::fprintf(stderr, "diff failed: %s\n", ops.error().message.c_str());
        return 1;
    }
    std::printf("patch : %s\n", jp::patch_to_json(*ops).dump().c_str());

    // -- Apply ---------------------------------------------------------------
    auto patched = jp::apply(before, *ops);
    if (!patched) {
        std::fprintf(stderr, "apply failed: %s\n", jp::describe(patched.error()).c_str());
        return 1;
    }
    print("result", *patched);
    std::printf("result == after: %s\n", *patched == after ? "yes" : "no");

    // -- Pointers ------------------------------------------------------------
    auto ptr = jp::Pointer::parse("/owner/name");
    if (ptr) {
        if (auto found = ptr->traverse(after)) {
            print("/owner/name", **found);
        }
    }
    const auto escaped = jp::Pointer{} / "a/b" / "m~n" / std::size_t{0};
    std::printf("escaped pointer: %s\n", escaped.to_string().c_str());

    // -- Strict vs lenient ---------------------------------------------------
    const auto cleanup = std::vector<jp::Operation>{
        jp::OpRemove{.path = jp::Pointer{} / "draft"},
    };
    auto strict = jp::apply(after, cleanup);
    if (!strict) {
        std::printf("strict:  %s\n", jp::describe(strict.error()).c_str());
    }
    auto lenient = jp::apply(after, cleanup, false);
    if (lenient) {
        print("lenient", *lenient);
    }

    return 0;
}
