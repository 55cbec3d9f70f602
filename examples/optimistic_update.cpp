// optimistic_update: guarding a patch with `test` operations
//
// A client computes a patch against the version of a record it last read
// and prefixes it with a `test` of the version field. If another writer got
// there first, the test fails, the server's copy is left untouched, and the
// client re-reads and retries.
//
// Build: cmake -B build -DJSONPATCH_CPP_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/examples/optimistic_update

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <utility>
#include <vector>

namespace jp = jsonpatch_cpp;

// =============================================================================
// A toy record store
// =============================================================================

class RecordStore {
public:
    explicit RecordStore(jp::Value initial) : record_{std::move(initial)} {}

    auto read() const -> const jp::Value& { return record_; }

    // Applies the patch atomically, bumping the version on success.
    auto submit(const std::vector<jp::Operation>& patch) -> jp::Result<std::int64_t, jp::ApplyError> {
        auto updated = jp::apply(record_, patch);
        if (!updated) return std::move(updated).error();

        auto* version = updated->get_if<jp::Object>()->at("version").get_if<std::int64_t>();
        *version += 1;
        record_ = std::move(updated).value();
        return *version;
    }

private:
    jp::Value record_;
};

static auto version_of(const jp::Value& record) -> std::int64_t {
    return *record.get_if<jp::Object>()->at("version").get_if<std::int64_t>();
}

// Builds the guarded patch that turns `seen` into `wanted`.
static auto guarded_patch(const jp::Value& seen, const jp::Value& wanted)
    -> jp::Result<std::vector<jp::Operation>> {
    auto ops = jp::diff(seen, wanted);
    if (!ops) return ops.error();
    auto patch = std::vector<jp::Operation>{
        jp::OpTest{.path = jp::Pointer{} / "version", .value = version_of(seen)},
    };
    patch.insert(patch.end(), ops->begin(), ops->end());
    return patch;
}

// Rewrites `field` of the record, retrying until no other writer interferes.
static auto update(RecordStore& store, const std::string& field, const jp::Value& value,
                   RecordStore* interferer) -> bool {
    for (int attempt = 1; attempt <= 3; ++attempt) {
        const auto seen = store.read();
        auto wanted = seen;
        wanted.get_if<jp::Object>()->insert_or_assign(field, value);

        auto patch = guarded_patch(seen, wanted);
        if (!patch) {
            std::fprintf(stderr, "diff failed: %s\n", patch.error().message.c_str());
            return false;
        }
        std::printf("attempt %d: %s\n", attempt, jp::patch_to_json(*patch).dump().c_str());

        // Simulate a concurrent writer on the first attempt.
        if (interferer != nullptr && attempt == 1) {
            auto bump = std::vector<jp::Operation>{
                jp::OpReplace{.path = jp::Pointer{} / "status", .value = "locked"},
            };
            if (auto r = interferer->submit(bump); !r) {
                std::fprintf(stderr, "concurrent write failed: %s\n",
                             jp::describe(r.error()).c_str());
                return false;
            }
            std::printf("  (another writer bumped the record to version %lld)\n",
                        static_cast<long long>(version_of(interferer->read())));
        }

        auto result = store.submit(*patch);
        if (result) {
            std::printf("  committed version %lld\n", static_cast<long long>(*result));
            return true;
        }
        if (!jp::is_test_failure(result.error())) {
            std::fprintf(stderr, "  rejected: %s\n", jp::describe(result.error()).c_str());
            return false;
        }
        std::printf("  conflict: %s, retrying\n", jp::describe(result.error()).c_str());
    }
    return false;
}

int main() {
    auto store = RecordStore{jp::Value{jp::Object{
        {"version", 1},
        {"title", "Quarterly report"},
        {"status", "draft"},
    }}};

    if (!update(store, "title", "Q3 report", &store)) return 1;

    auto final_json = nlohmann::json{};
    jp::to_json(final_json, store.read());
    std::printf("final: %s\n", final_json.dump().c_str());
    return 0;
}
