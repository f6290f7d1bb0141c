#include <backtrack-cpp/cursor.hpp>
#include <backtrack-cpp/recorder.hpp>

#include "counting_source.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace backtrack_cpp;
using backtrack_cpp::test_support::counting_source;
using backtrack_cpp::test_support::SourceStats;

namespace {

// Neither copyable nor comparable by value; only reachable by reference.
struct Uncopyable {
    explicit Uncopyable(int v) : value{v} {}
    Uncopyable(const Uncopyable&) = delete;
    auto operator=(const Uncopyable&) -> Uncopyable& = delete;
    Uncopyable(Uncopyable&&) = default;
    auto operator=(Uncopyable&&) -> Uncopyable& = default;

    int value;
};

}  // namespace

TEST(ReferencingCursor, yields_pointers_into_history) {
    auto rec = record(std::vector{10, 20, 30});
    auto c = rec.referencing();

    const auto* first = c.next();
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(*first, 10);
    EXPECT_EQ(first, &rec.history()->at(0));
}

TEST(ReferencingCursor, scenario_ten_twenty_thirty) {
    auto stats = std::make_shared<SourceStats>();
    auto rec = Recorder<int>{counting_source(std::vector{10, 20, 30}, stats)};
    auto c = rec.referencing();

    EXPECT_EQ(*c.next(), 10);
    auto m = c.get_ref_point();
    EXPECT_EQ(*c.next(), 20);
    EXPECT_EQ(*c.next(), 30);
    EXPECT_EQ(c.next(), nullptr);
    EXPECT_EQ(c.get_ref_point(), Mark{3});

    c.backtrack(m);
    EXPECT_EQ(*c.next(), 20);
    EXPECT_EQ(*c.next(), 30);
    EXPECT_EQ(c.next(), nullptr);
    EXPECT_EQ(rec.size(), 3u);
    EXPECT_EQ(stats->calls_after_end, 0u);
}

TEST(ReferencingCursor, replay_returns_the_same_address) {
    auto rec = record(std::vector<std::string>{"a", "b"});
    auto c = rec.referencing();

    const auto* a1 = c.next();
    c.start_again();
    const auto* a2 = c.next();

    EXPECT_EQ(a1, a2);
}

TEST(ReferencingCursor, view_stays_valid_while_other_cursors_grow_history) {
    auto values = std::vector<std::string>{};
    for (int i = 0; i < 500; ++i) values.push_back("item-" + std::to_string(i));
    auto rec = record(values);

    auto early = rec.referencing();
    const auto* view = early.next();
    ASSERT_NE(view, nullptr);

    auto other = rec.referencing();
    while (other.next()) {}
    EXPECT_EQ(rec.size(), 500u);

    EXPECT_EQ(*view, "item-0");
    EXPECT_EQ(view, &rec.history()->at(0));
}

TEST(ReferencingCursor, view_outlives_cursor_and_recorder) {
    const std::string* view = nullptr;
    auto keep_alive = std::shared_ptr<History<std::string>>{};
    {
        auto rec = record(std::vector<std::string>{"kept"});
        auto c = rec.referencing();
        view = c.next();
        keep_alive = rec.history();
    }
    ASSERT_NE(view, nullptr);
    EXPECT_EQ(*view, "kept");
}

TEST(ReferencingCursor, works_with_uncopyable_items) {
    auto n = 0;
    auto rec = Recorder<Uncopyable>{[&n]() -> std::optional<Uncopyable> {
        if (n == 3) return std::nullopt;
        return Uncopyable{n++};
    }};
    auto c = rec.referencing();

    EXPECT_EQ(c.next()->value, 0);
    auto m = c.get_ref_point();
    EXPECT_EQ(c.next()->value, 1);
    EXPECT_EQ(c.next()->value, 2);
    EXPECT_EQ(c.next(), nullptr);

    c.backtrack(m);
    EXPECT_EQ(c.next()->value, 1);
    EXPECT_EQ(n, 3);
}

TEST(ReferencingCursor, backtrack_past_history_throws) {
    auto rec = record(std::vector{1});
    auto c = rec.referencing();
    EXPECT_THROW(c.backtrack(Mark{2}), BacktrackError);
    EXPECT_EQ(c.get_ref_point(), Mark{0});
}

TEST(ReferencingCursor, range_for_binds_references) {
    auto rec = record(std::vector{1, 2, 3});
    auto c = rec.referencing();

    auto addresses = std::vector<const int*>{};
    for (const auto& v : c) addresses.push_back(&v);

    ASSERT_EQ(addresses.size(), 3u);
    for (std::size_t i = 0; i < addresses.size(); ++i) {
        EXPECT_EQ(addresses[i], &rec.history()->at(i));
    }
}

TEST(ReferencingCursor, copying_and_referencing_share_one_history) {
    auto stats = std::make_shared<SourceStats>();
    auto rec = Recorder<int>{counting_source(std::vector{4, 5, 6}, stats)};
    auto copying = rec.copying();
    auto referencing = rec.referencing();

    EXPECT_EQ(copying.next(), 4);
    EXPECT_EQ(copying.next(), 5);
    EXPECT_EQ(*referencing.next(), 4);
    EXPECT_EQ(*referencing.next(), 5);
    EXPECT_EQ(*referencing.next(), 6);
    EXPECT_EQ(copying.next(), 6);

    EXPECT_EQ(stats->calls, 3u);
}
