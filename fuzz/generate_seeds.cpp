// Helper to generate seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself.

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

static void write_seed(const std::string& path, std::string_view data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

int main() {
    namespace fs = std::filesystem;
    const auto pointer_dir = std::string{"fuzz/corpus/pointer"};
    const auto apply_dir = std::string{"fuzz/corpus/apply"};
    fs::create_directories(pointer_dir);
    fs::create_directories(apply_dir);

    // Pointer seeds: root, empty key, escapes, indices
    write_seed(pointer_dir + "/seed_root.txt", "");
    write_seed(pointer_dir + "/seed_empty_key.txt", "/");
    write_seed(pointer_dir + "/seed_escapes.txt", "/a~1b/m~0n/~01");
    write_seed(pointer_dir + "/seed_index.txt", "/items/0/-");
    write_seed(pointer_dir + "/seed_bad_escape.txt", "/a~2");

    // Apply seeds: [document, patch]
    write_seed(apply_dir + "/seed_add.json",
               R"([{"a":[1,2]},[{"op":"add","path":"/a/-","value":3}]])");
    write_seed(apply_dir + "/seed_remove.json",
               R"([{"x":1,"y":2},[{"op":"remove","path":"/x"}]])");
    write_seed(apply_dir + "/seed_replace_root.json",
               R"([{"x":1},[{"op":"replace","path":"","value":[true,null]}]])");
    write_seed(apply_dir + "/seed_move_copy.json",
               R"([{"a":{"b":1},"c":[]},[{"op":"copy","from":"/a","to":"/c/-"},)"
               R"({"op":"move","from":"/a/b","path":"/d"}]])");
    write_seed(apply_dir + "/seed_test.json",
               R"([{"v":3},[{"op":"test","path":"/v","value":3},{"op":"add","path":"/w","value":4}]])");

    return 0;
}
