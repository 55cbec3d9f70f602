// Fuzz target for Pointer::parse(): any accepted pointer must serialize back
// to text that parses to the same segments.

#include <jsonpatch-cpp/pointer.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view{reinterpret_cast<const char*>(data), size};

    auto ptr = jsonpatch_cpp::Pointer::parse(text);
    if (ptr) {
        auto reparsed = jsonpatch_cpp::Pointer::parse(ptr->to_string());
        if (!reparsed || *reparsed != *ptr) std::abort();
    }
    return 0;
}
