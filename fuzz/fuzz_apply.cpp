// Fuzz target for patch decoding and application.
// Input is a JSON array [document, patch]. Both strict and lenient runs must
// leave the input untouched, and a successful strict run must be reproducible
// from a diff of its input and output.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

namespace jp = jsonpatch_cpp;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    auto input = jp::parse_json_text(std::string_view{reinterpret_cast<const char*>(data), size});
    if (!input || !input->is_array() || input->size() != 2) return 0;

    auto doc = jp::value_from_json((*input)[0]);
    auto ops = jp::patch_from_json((*input)[1]);
    if (!doc || !ops) return 0;

    const auto snapshot = *doc;
    auto strict = jp::apply(*doc, *ops);
    auto lenient = jp::apply(*doc, *ops, false);
    (void)lenient;
    if (!(*doc == snapshot)) std::abort();

    if (strict) {
        auto back = jp::diff(*doc, *strict);
        if (!back) std::abort();
        auto replayed = jp::apply(*doc, *back);
        if (!replayed || !(*replayed == *strict)) std::abort();
    }
    return 0;
}
