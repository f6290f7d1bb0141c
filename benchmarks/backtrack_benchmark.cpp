// backtrack-cpp benchmarks: measures the cost of recording and replaying.

#include <backtrack-cpp/backtrack.hpp>

#include <benchmark/benchmark.h>
#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace backtrack_cpp;

static auto iota_recorder() -> Recorder<std::int64_t> {
    auto n = std::int64_t{0};
    return Recorder<std::int64_t>{[n]() mutable -> std::optional<std::int64_t> { return n++; }};
}

// =============================================================================
// Recording
// =============================================================================

static void bm_record_fresh(benchmark::State& state) {
    const auto n = state.range(0);
    for (auto _ : state) {
        auto rec = iota_recorder();
        auto c = rec.copying();
        for (std::int64_t i = 0; i < n; ++i) {
            benchmark::DoNotOptimize(c.next());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_record_fresh)->Range(64, 1 << 16);

static void bm_replay_read_unlocked(benchmark::State& state) {
    const auto n = state.range(0);
    auto rec = iota_recorder();
    auto c = rec.referencing();
    for (std::int64_t i = 0; i < n; ++i) c.next();
    rec.set_read_locking(false);
    for (auto _ : state) {
        c.start_again();
        for (std::int64_t i = 0; i < n; ++i) {
            benchmark::DoNotOptimize(c.next());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_replay_read_unlocked)->Range(64, 1 << 16);

// =============================================================================
// Replay
// =============================================================================

static void bm_replay_copying_int(benchmark::State& state) {
    const auto n = state.range(0);
    auto rec = iota_recorder();
    auto c = rec.copying();
    for (std::int64_t i = 0; i < n; ++i) c.next();

    for (auto _ : state) {
        c.start_again();
        for (std::int64_t i = 0; i < n; ++i) {
            benchmark::DoNotOptimize(c.next());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_replay_copying_int)->Range(64, 1 << 16);

static auto string_recorder(std::int64_t n) -> Recorder<std::string> {
    auto values = std::vector<std::string>{};
    values.reserve(static_cast<std::size_t>(n));
    for (std::int64_t i = 0; i < n; ++i) {
        values.push_back("a reasonably long token number " + std::to_string(i));
    }
    return record(std::move(values));
}

static void bm_replay_copying_string(benchmark::State& state) {
    const auto n = state.range(0);
    auto rec = string_recorder(n);
    auto c = rec.copying();
    while (c.next()) {}

    for (auto _ : state) {
        c.start_again();
        for (std::int64_t i = 0; i < n; ++i) {
            benchmark::DoNotOptimize(c.next());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_replay_copying_string)->Range(64, 1 << 14);

static void bm_replay_referencing_string(benchmark::State& state) {
    const auto n = state.range(0);
    auto rec = string_recorder(n);
    auto c = rec.referencing();
    while (c.next()) {}

    for (auto _ : state) {
        c.start_again();
        for (std::int64_t i = 0; i < n; ++i) {
            benchmark::DoNotOptimize(c.next());
        }
    }
    state.SetItemsProcessed(state.iterations() * n);
}
BENCHMARK(bm_replay_referencing_string)->Range(64, 1 << 14);

// =============================================================================
// Backtracking pattern: advance k, rewind k-1 (a parser retrying alternatives)
// =============================================================================

static void bm_sawtooth(benchmark::State& state) {
    const auto k = state.range(0);
    auto rec = iota_recorder();
    auto c = rec.copying();

    for (auto _ : state) {
        auto m = c.get_ref_point();
        for (std::int64_t i = 0; i < k; ++i) c.next();
        c.backtrack(Mark{m.position + 1});
    }
    state.SetItemsProcessed(state.iterations() * k);
}
BENCHMARK(bm_sawtooth)->Arg(4)->Arg(16)->Arg(64);

// =============================================================================
// Parallel replay across a shared history
// =============================================================================

static void bm_parallel_replay(benchmark::State& state) {
    const auto n = state.range(0);
    const auto workers = std::thread::hardware_concurrency();
    auto rec = iota_recorder();
    auto warm = rec.copying();
    for (std::int64_t i = 0; i < n; ++i) warm.next();

    auto executor = tf::Executor{workers};
    for (auto _ : state) {
        auto taskflow = tf::Taskflow{};
        taskflow.for_each_index(0u, workers, 1u, [&rec, n](unsigned) {
            auto c = rec.referencing();
            for (std::int64_t i = 0; i < n; ++i) {
                benchmark::DoNotOptimize(c.next());
            }
        });
        executor.run(taskflow).wait();
    }
    state.SetItemsProcessed(state.iterations() * n * workers);
}
BENCHMARK(bm_parallel_replay)->Range(1 << 10, 1 << 16)->UseRealTime();

BENCHMARK_MAIN();
