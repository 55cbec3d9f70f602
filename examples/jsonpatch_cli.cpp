// jsonpatch_cli: command line driver for diff and apply
//
//   jsonpatch_cli diff <before.json> <after.json>
//   jsonpatch_cli apply <doc.json> <patch.json> [--lenient]
//
// Writes the resulting patch or document to stdout as JSON. Exits with 1 on
// an error, 2 on a failed `test` operation, and 64 on bad usage.
//
// Build: cmake -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/jsonpatch_cli diff a.json b.json

#include <jsonpatch-cpp/json.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace jp = jsonpatch_cpp;

static constexpr int exit_error = 1;
static constexpr int exit_test_failed = 2;
static constexpr int exit_usage = 64;

static auto usage() -> int {
    std::fprintf(stderr,
                 "usage: jsonpatch_cli diff <before.json> <after.json>\n"
                 "       jsonpatch_cli apply <doc.json> <patch.json> [--lenient]\n");
    return exit_usage;
}

static auto read_json_file(const char* path) -> std::optional<nlohmann::json> {
    auto ifs = std::ifstream{path, std::ios::binary};
    if (!ifs) {
        std::fprintf(stderr, "cannot open %s\n", path);
        return std::nullopt;
    }
    const auto text = std::string{std::istreambuf_iterator<char>{ifs},
                                  std::istreambuf_iterator<char>{}};
    auto parsed = jp::parse_json_text(text);
    if (!parsed) {
        std::fprintf(stderr, "%s: %s\n", path, parsed.error().message.c_str());
        return std::nullopt;
    }
    return std::move(parsed).value();
}

static auto run_diff(const char* before_path, const char* after_path) -> int {
    auto before = read_json_file(before_path);
    auto after = read_json_file(after_path);
    if (!before || !after) return exit_error;

    auto patch = jp::diff_json_patch(*before, *after);
    if (!patch) {
        std::fprintf(stderr, "diff: %s\n", patch.error().message.c_str());
        return exit_error;
    }
    std::printf("%s\n", patch->dump(2).c_str());
    return 0;
}

static auto run_apply(const char* doc_path, const char* patch_path, bool strict) -> int {
    auto doc = read_json_file(doc_path);
    auto patch = read_json_file(patch_path);
    if (!doc || !patch) return exit_error;

    auto result = jp::apply_json_patch(*doc, *patch, strict);
    if (!result) {
        std::fprintf(stderr, "apply: %s\n", jp::describe(result.error()).c_str());
        return jp::is_test_failure(result.error()) ? exit_test_failed : exit_error;
    }
    std::printf("%s\n", result->dump(2).c_str());
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return usage();
    const auto command = std::string_view{argv[1]};

    if (command == "diff" && argc == 4) {
        return run_diff(argv[2], argv[3]);
    }
    if (command == "apply" && (argc == 4 || argc == 5)) {
        auto strict = true;
        if (argc == 5) {
            if (std::string_view{argv[4]} != "--lenient") return usage();
            strict = false;
        }
        return run_apply(argv[2], argv[3], strict);
    }
    return usage();
}
