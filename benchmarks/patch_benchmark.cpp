// splice-ot benchmarks — measures throughput of the patch operations.

#include <splice-ot/json.hpp>
#include <splice-ot/patch.hpp>
#include <splice-ot/random.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <random>
#include <string>
#include <utility>
#include <vector>

using namespace splice_ot;

static auto make_doc(std::size_t size) -> std::string {
    auto rng = std::mt19937{42};
    return random_ascii(size, rng);
}

// =============================================================================
// Hashing
// =============================================================================

static void bm_content_hash(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    for (auto _ : state) {
        benchmark::DoNotOptimize(ContentHash::of(doc));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * doc.size()));
}
BENCHMARK(bm_content_hash)->Range(64, 1 << 20);

// =============================================================================
// Building and applying
// =============================================================================

static void bm_add_operation_typing(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    for (auto _ : state) {
        auto patch = Patch{ContentHash{}};
        for (std::size_t i = 0; i < n; ++i) {
            patch.add_operation(Operation{512 + i, 0, "x"});
        }
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_add_operation_typing)->Range(8, 512);

static void bm_add_operation_scattered(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    const auto doc = make_doc(64 * 1024);
    for (auto _ : state) {
        state.PauseTiming();
        auto rng = std::mt19937{7};
        auto ops = std::vector<Operation>{};
        auto length = doc.size();
        for (std::size_t i = 0; i < n; ++i) {
            ops.push_back(random_operation(length, rng));
            length = static_cast<std::size_t>(static_cast<std::int64_t>(length) +
                                              ops.back().length_change());
        }
        auto patch = Patch{ContentHash{}};
        state.ResumeTiming();

        for (auto& op : ops) patch.add_operation(std::move(op));
        benchmark::DoNotOptimize(patch);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_add_operation_scattered)->Range(8, 512);

static void bm_apply(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    auto rng = std::mt19937{3};
    const auto patch = random_patch(doc, rng, 30);
    for (auto _ : state) {
        benchmark::DoNotOptimize(patch.apply(doc));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * doc.size()));
}
BENCHMARK(bm_apply)->Range(1024, 1 << 20);

static void bm_apply_verified(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    auto rng = std::mt19937{3};
    const auto patch = random_patch(doc, rng, 30);
    const auto cfg = Config{Verification::full};
    for (auto _ : state) {
        benchmark::DoNotOptimize(patch.apply(doc, cfg));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * doc.size()));
}
BENCHMARK(bm_apply_verified)->Range(1024, 1 << 20);

static void bm_invert(benchmark::State& state) {
    const auto doc = make_doc(16 * 1024);
    auto rng = std::mt19937{5};
    const auto patch = random_patch(doc, rng, 30);
    for (auto _ : state) {
        benchmark::DoNotOptimize(patch.invert(doc));
    }
}
BENCHMARK(bm_invert);

// =============================================================================
// Transform
// =============================================================================

static void bm_transform(benchmark::State& state) {
    const auto doc = make_doc(static_cast<std::size_t>(state.range(0)));
    auto rng = std::mt19937{11};
    const auto mine = random_patch(doc, rng, 10);
    const auto theirs = random_patch(doc, rng, 10);
    const auto policy = TransformPolicy{};
    for (auto _ : state) {
        benchmark::DoNotOptimize(splice_ot::transform(mine, theirs, doc, policy));
    }
}
BENCHMARK(bm_transform)->Range(1024, 64 * 1024);

static void bm_merge(benchmark::State& state) {
    const auto doc = make_doc(16 * 1024);
    auto rng = std::mt19937{13};
    const auto older = random_patch(doc, rng, 30);
    const auto newer = random_patch(older.apply(doc), rng, 30);
    for (auto _ : state) {
        benchmark::DoNotOptimize(merge(older, newer));
    }
}
BENCHMARK(bm_merge);

// =============================================================================
// Wire format
// =============================================================================

static void bm_serialize(benchmark::State& state) {
    const auto doc = make_doc(16 * 1024);
    auto rng = std::mt19937{17};
    const auto patch = random_patch(doc, rng, 30);
    for (auto _ : state) {
        benchmark::DoNotOptimize(serialize(patch));
    }
}
BENCHMARK(bm_serialize);

static void bm_deserialize(benchmark::State& state) {
    const auto doc = make_doc(16 * 1024);
    auto rng = std::mt19937{17};
    const auto text = serialize(random_patch(doc, rng, 30));
    for (auto _ : state) {
        benchmark::DoNotOptimize(deserialize(text));
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_deserialize);
