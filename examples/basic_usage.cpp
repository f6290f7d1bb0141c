// basic_usage: demonstrates core backtrack-cpp API
//
// Shows recording a source, copying and referencing cursors, marks and
// backtracking, walking back, and exporting the history as JSON.
//
// Build: cmake --build build
// Run:   ./build/examples/basic_usage

#include <backtrack-cpp/backtrack.hpp>
#include <backtrack-cpp/json.hpp>

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace bt = backtrack_cpp;

int main() {
    // -- A source that can only be read once ---------------------------------
    auto produced = 0;
    auto rec = bt::Recorder<int>{[&produced]() -> std::optional<int> {
        if (produced == 5) return std::nullopt;
        ++produced;
        std::printf("  (source produced %d)\n", produced * 10);
        return produced * 10;
    }};

    // -- Copying cursor: advance, mark, backtrack ----------------------------
    auto c = rec.copying();
    std::printf("first: %d\n", *c.next());
    auto mark = c.get_ref_point();
    std::printf("marked position %zu\n", mark.position);
    std::printf("next: %d\n", *c.next());
    std::printf("next: %d\n", *c.next());

    c.backtrack(mark);
    std::printf("after backtrack: %d (replayed, no source call)\n", *c.next());

    // -- Referencing cursor over the same history ----------------------------
    auto r = rec.referencing();
    std::printf("referencing cursor:");
    for (const auto& v : r) std::printf(" %d", v);
    std::printf("\n");

    // -- Walk back from the current position ---------------------------------
    auto wb = c.walk_back();
    std::printf("walking back:");
    while (auto v = wb.next()) std::printf(" %d", *v);
    std::printf("\n");

    // -- Out-of-range marks are rejected -------------------------------------
    try {
        c.backtrack(bt::Mark{99});
    } catch (const bt::BacktrackError& e) {
        std::printf("rejected: %s\n", e.what());
    }

    // -- Inspect the history -------------------------------------------------
    std::printf("history: %s\n", bt::export_history(rec).dump().c_str());
    std::printf("cursor:  %s\n", nlohmann::json(c).dump().c_str());

    return 0;
}
