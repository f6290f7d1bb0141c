// parallel_explore: many threads searching one recorded stream
//
// Demonstrates: a History is safe to share between threads (shared_mutex
// internally). Each Taskflow task gets its own cursor, starts from a
// different mark, and scans for a pattern. The expensive source is still
// called exactly once per position.
//
// Build: cmake --build build
// Run:   ./build/examples/parallel_explore

#include <backtrack-cpp/backtrack.hpp>

#include <taskflow/taskflow.hpp>
#include <taskflow/algorithm/for_each.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <thread>
#include <vector>

namespace bt = backtrack_cpp;

int main() {
    constexpr std::size_t stream_length = 20'000;
    constexpr std::size_t window = 4;

    // A pseudo-random digit stream standing in for a slow sensor or socket.
    auto source_calls = std::atomic<std::size_t>{0};
    auto state = std::uint32_t{12345};
    auto produced = std::size_t{0};
    auto rec = bt::Recorder<int>{[&]() -> std::optional<int> {
        source_calls.fetch_add(1, std::memory_order_relaxed);
        if (produced == stream_length) return std::nullopt;
        ++produced;
        state = state * 1664525u + 1013904223u;
        return static_cast<int>((state >> 16) % 10);
    }};

    // Record everything once up front with a scout cursor.
    auto scout = rec.referencing();
    while (scout.next()) {}
    std::printf("recorded %zu digits with %zu source calls\n", rec.size(), source_calls.load());

    // Every start position is explored by its own cursor, in parallel.
    auto matches = std::vector<std::uint8_t>(stream_length, 0);
    auto executor = tf::Executor{std::thread::hardware_concurrency()};
    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, stream_length - window + 1, std::size_t{1},
        [&rec, &matches](std::size_t start) {
            auto cursor = rec.referencing(bt::Mark{start});
            // Looking for a strictly increasing run of `window` digits.
            auto previous = -1;
            for (std::size_t k = 0; k < window; ++k) {
                const auto* digit = cursor.next();
                if (!digit || *digit <= previous) return;
                previous = *digit;
            }
            matches[start] = 1;
        });
    executor.run(taskflow).wait();

    auto count = std::size_t{0};
    auto first = std::optional<std::size_t>{};
    for (std::size_t i = 0; i < matches.size(); ++i) {
        if (!matches[i]) continue;
        ++count;
        if (!first) first = i;
    }
    std::printf("increasing runs of %zu: %zu\n", window, count);

    if (first) {
        auto show = rec.copying(bt::Mark{*first});
        std::printf("first at %zu:", *first);
        for (std::size_t k = 0; k < window; ++k) std::printf(" %d", *show.next());
        std::printf("\n");
    }

    std::printf("source calls after exploring: %zu\n", source_calls.load());
    return 0;
}
