#pragma once

// Test helper: a source over a fixed list of values that counts how often
// it is called and can be told to fail on a given call.

#include <backtrack-cpp/source.hpp>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace backtrack_cpp::test_support {

struct SourceStats {
    std::size_t calls = 0;
    std::size_t produced = 0;
    std::size_t calls_after_end = 0;
    std::optional<std::size_t> fail_on_call;  // 1-based
};

template <typename T>
auto counting_source(std::vector<T> values, std::shared_ptr<SourceStats> stats) -> Source<T> {
    auto next_index = std::size_t{0};
    auto finished = false;
    return [values = std::move(values), stats, next_index, finished]() mutable
               -> std::optional<T> {
        ++stats->calls;
        if (finished) ++stats->calls_after_end;
        if (stats->fail_on_call && *stats->fail_on_call == stats->calls) {
            throw std::runtime_error{"source failure"};
        }
        if (next_index == values.size()) {
            finished = true;
            return std::nullopt;
        }
        ++stats->produced;
        return values[next_index++];
    };
}

// An item whose copy constructor throws while copy_failures > 0. Moves
// never throw, so recording it does not trip the failure.
struct FragileItem {
    static inline int copy_failures = 0;

    int value = 0;

    explicit FragileItem(int v) : value{v} {}

    FragileItem(const FragileItem& other) : value{other.value} {
        if (copy_failures > 0) {
            --copy_failures;
            throw std::runtime_error{"copy failed"};
        }
    }

    FragileItem(FragileItem&&) noexcept = default;
    auto operator=(const FragileItem&) -> FragileItem& = default;
    auto operator=(FragileItem&&) noexcept -> FragileItem& = default;
};

}  // namespace backtrack_cpp::test_support
