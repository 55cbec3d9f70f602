// jsonpatch-cpp benchmarks: diff, apply and codec throughput.

#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/jsonpatch.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <vector>

using namespace jsonpatch_cpp;

// An object of n records, each a small nested object.
static auto make_records(std::size_t n, std::int64_t revision) -> Value {
    auto obj = Object{};
    for (std::size_t i = 0; i < n; ++i) {
        obj.emplace("record" + std::to_string(i), Object{
            {"id", static_cast<std::int64_t>(i)},
            {"revision", revision},
            {"tags", Array{"a", "b", "c"}},
            {"owner", Object{{"name", "Alice"}, {"active", true}}},
        });
    }
    return Value{std::move(obj)};
}

// Every tenth record gets a new revision.
static auto touch_records(const Value& base) -> Value {
    auto out = base;
    auto i = std::size_t{0};
    for (auto& [key, record] : *out.get_if<Object>()) {
        if (i++ % 10 == 0) {
            record.get_if<Object>()->insert_or_assign("revision", std::int64_t{-1});
        }
    }
    return out;
}

// =============================================================================
// Pointer
// =============================================================================

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto ptr = Pointer::parse("/store/book/0/author~1editor/name");
        benchmark::DoNotOptimize(ptr);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse);

static void bm_pointer_traverse(benchmark::State& state) {
    const auto doc = make_records(100, 0);
    const auto ptr = Pointer::parse("/record42/owner/name").value();
    for (auto _ : state) {
        auto found = ptr.traverse(doc);
        benchmark::DoNotOptimize(found);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_traverse);

// =============================================================================
// Diff
// =============================================================================

static void bm_diff_identical(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_records(n, 0);
    for (auto _ : state) {
        auto ops = diff(doc, doc);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_identical)->Range(10, 1000);

static void bm_diff_sparse_changes(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_records(n, 0);
    const auto after = touch_records(before);
    for (auto _ : state) {
        auto ops = diff(before, after);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_diff_sparse_changes)->Range(10, 1000);

// =============================================================================
// Apply
// =============================================================================

static void bm_apply_diff(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_records(n, 0);
    const auto ops = diff(before, touch_records(before)).value();
    for (auto _ : state) {
        auto patched = jsonpatch_cpp::apply(before, ops);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * ops.size()));
}
BENCHMARK(bm_apply_diff)->Range(10, 1000);

static void bm_apply_array_appends(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto base = Value{Object{{"list", Array{}}}};
    auto ops = std::vector<Operation>{};
    for (std::size_t i = 0; i < n; ++i) {
        ops.push_back(OpAdd{.path = Pointer{} / "list" / "-", .value = static_cast<std::int64_t>(i)});
    }
    for (auto _ : state) {
        auto patched = jsonpatch_cpp::apply(base, ops);
        benchmark::DoNotOptimize(patched);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_apply_array_appends)->Range(10, 1000);

// =============================================================================
// Wire codec
// =============================================================================

static void bm_patch_decode(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto before = make_records(n, 0);
    const auto encoded = patch_to_json(diff(before, touch_records(before)).value());
    for (auto _ : state) {
        auto ops = patch_from_json(encoded);
        benchmark::DoNotOptimize(ops);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * encoded.size()));
}
BENCHMARK(bm_patch_decode)->Range(10, 1000);

static void bm_value_from_json(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto j = nlohmann::json{};
    to_json(j, make_records(n, 0));
    for (auto _ : state) {
        auto v = value_from_json(j);
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_value_from_json)->Range(10, 1000);
