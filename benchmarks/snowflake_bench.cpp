#include <memory>

#include <benchmark/benchmark.h>

#include "gidkit/core/clock.hpp"
#include "gidkit/ids/snowflake.hpp"

namespace {

std::unique_ptr<gidkit::ids::IdGenerator> make_generator() {
    std::unique_ptr<gidkit::ids::IdGenerator> gen;
    const gidkit::core::Status s =
        gidkit::ids::IdGenerator::create(gidkit::ids::IdGeneratorConfig{1, gidkit::core::system_clock()}, &gen);
    if (!gidkit::core::is_ok(s)) {
        return nullptr;
    }
    return gen;
}

// Shared across benchmark threads.
std::unique_ptr<gidkit::ids::IdGenerator> g_shared;

} // namespace

static void BM_SnowflakeGenerate(benchmark::State& state) {
    auto gen = make_generator();
    if (gen == nullptr) {
        state.SkipWithError("IdGenerator::create failed");
        return;
    }
    for (auto _ : state) {
        benchmark::DoNotOptimize(gen->generate());
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SnowflakeGenerate);

static void BM_SnowflakeGenerateContended(benchmark::State& state) {
    if (state.thread_index() == 0) {
        g_shared = make_generator();
    }
    for (auto _ : state) {
        if (g_shared == nullptr) {
            state.SkipWithError("IdGenerator::create failed");
            break;
        }
        benchmark::DoNotOptimize(g_shared->generate());
    }
    state.SetItemsProcessed(state.iterations());
    if (state.thread_index() == 0) {
        g_shared.reset();
    }
}
BENCHMARK(BM_SnowflakeGenerateContended)->Threads(1)->Threads(4)->Threads(8);

static void BM_SnowflakeDecompose(benchmark::State& state) {
    const gidkit::ids::u64 id = gidkit::ids::snowflake_compose(123456789, 42, 7);
    for (auto _ : state) {
        benchmark::DoNotOptimize(gidkit::ids::snowflake_unix_ms(id));
        benchmark::DoNotOptimize(gidkit::ids::snowflake_machine_tag(id));
        benchmark::DoNotOptimize(gidkit::ids::snowflake_sequence(id));
    }
}
BENCHMARK(BM_SnowflakeDecompose);
