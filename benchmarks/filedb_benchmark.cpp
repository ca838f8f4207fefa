// filedb-cpp benchmarks -- measures the cost of the load/apply/store cycle
// and of in-memory path resolution.

#include <filedb-cpp/filedb.hpp>
#include <filedb-cpp/json.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

using namespace filedb_cpp;

namespace {

auto bench_file(const char* name) -> std::filesystem::path {
    return std::filesystem::temp_directory_path() / name;
}

/// A root with `n` top-level objects of ten keys each.
auto make_root(std::int64_t n) -> Object {
    auto root = Object{};
    for (std::int64_t i = 0; i < n; ++i) {
        auto entry = Object{};
        for (int k = 0; k < 10; ++k) {
            entry.emplace("field" + std::to_string(k), Value{i * 10 + k});
        }
        root.emplace("entry" + std::to_string(i), std::move(entry));
    }
    return root;
}

auto increment(const std::optional<Value>& current) -> Value {
    return Value{get_as<std::int64_t>(current).value_or(0) + 1};
}

}  // namespace

// =============================================================================
// In-memory apply
// =============================================================================

static void bm_apply_set_deep(benchmark::State& state) {
    const auto doc = Document{bench_file("filedb_bm_unused.json")};
    auto path = Path{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        path.push_back("k" + std::to_string(i));
    }
    const auto tx = Ref{doc, path}.set(1);
    for (auto _ : state) {
        auto root = Object{};
        tx.apply(root);
        benchmark::DoNotOptimize(root);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_apply_set_deep)->Range(1, 64);

static void bm_apply_combined_updates(benchmark::State& state) {
    const auto doc = Document{bench_file("filedb_bm_unused.json")};
    auto members = std::vector<Transaction>{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        members.push_back(doc.ref("counter" + std::to_string(i % 8)).update(increment));
    }
    const auto tx = combine(std::move(members));
    auto root = Object{};
    for (auto _ : state) {
        tx.apply(root);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(bm_apply_combined_updates)->Range(8, 512);

// =============================================================================
// Codec
// =============================================================================

static void bm_dump_object(benchmark::State& state) {
    const auto root = make_root(state.range(0));
    for (auto _ : state) {
        auto text = dump_object(root);
        benchmark::DoNotOptimize(text);
    }
}
BENCHMARK(bm_dump_object)->Range(8, 4096);

static void bm_parse_object(benchmark::State& state) {
    const auto text = dump_object(make_root(state.range(0)));
    for (auto _ : state) {
        auto root = parse_object(text);
        benchmark::DoNotOptimize(root);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<std::int64_t>(text.size()));
}
BENCHMARK(bm_parse_object)->Range(8, 4096);

// =============================================================================
// Full execute() cycle
// =============================================================================

static void bm_execute_update(benchmark::State& state) {
    const auto file = bench_file("filedb_bm_execute.json");
    const auto doc = Document{file};
    doc.store(make_root(state.range(0)));
    const auto tx = doc.at("entry0.field0").update(increment);
    for (auto _ : state) {
        execute(tx);
    }
    state.SetItemsProcessed(state.iterations());
    std::filesystem::remove(file);
}
BENCHMARK(bm_execute_update)->Range(8, 1024);

static void bm_execute_update_in_place(benchmark::State& state) {
    const auto file = bench_file("filedb_bm_execute_in_place.json");
    auto options = DocumentOptions{};
    options.atomic_write = false;
    const auto doc = Document{file, options};
    doc.store(make_root(state.range(0)));
    const auto tx = doc.at("entry0.field0").update(increment);
    for (auto _ : state) {
        execute(tx);
    }
    state.SetItemsProcessed(state.iterations());
    std::filesystem::remove(file);
}
BENCHMARK(bm_execute_update_in_place)->Range(8, 1024);

static void bm_ref_get(benchmark::State& state) {
    const auto file = bench_file("filedb_bm_get.json");
    const auto doc = Document{file};
    doc.store(make_root(state.range(0)));
    const auto ref = doc.at("entry0.field5");
    for (auto _ : state) {
        auto v = ref.get();
        benchmark::DoNotOptimize(v);
    }
    state.SetItemsProcessed(state.iterations());
    std::filesystem::remove(file);
}
BENCHMARK(bm_ref_get)->Range(8, 1024);

BENCHMARK_MAIN();
