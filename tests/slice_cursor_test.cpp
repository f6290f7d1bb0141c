#include <backtrack-cpp/slice_cursor.hpp>

#include <gtest/gtest.h>

#include <array>
#include <iterator>
#include <ranges>
#include <span>
#include <string>
#include <vector>

using namespace backtrack_cpp;

TEST(SliceCursor, walks_forward_and_starts_again) {
    const auto data = std::array{true, false};
    auto sc = SliceCursor<bool>{data};

    EXPECT_EQ(sc.next(), &data[0]);
    EXPECT_EQ(sc.next(), &data[1]);
    EXPECT_EQ(sc.next(), nullptr);
    EXPECT_EQ(sc.get_ref_point(), Mark{2});

    sc.start_again();
    EXPECT_EQ(sc.next(), &data[0]);
}

TEST(SliceCursor, position_does_not_run_past_the_end) {
    const auto data = std::vector{1};
    auto sc = SliceCursor<int>{data};

    sc.next();
    sc.next();
    sc.next();
    EXPECT_EQ(sc.get_ref_point(), Mark{1});
}

TEST(SliceCursor, backtrack_to_mark) {
    const auto data = std::vector{1, 2, 3};
    auto sc = SliceCursor<int>{data};
    sc.next();
    auto m = sc.get_ref_point();
    sc.next();
    sc.next();

    sc.backtrack(m);
    EXPECT_EQ(*sc.next(), 2);
}

TEST(SliceCursor, backtrack_past_end_throws) {
    const auto data = std::vector{1, 2, 3};
    auto sc = SliceCursor<int>{data};

    EXPECT_THROW(sc.backtrack(Mark{4}), BacktrackError);
    EXPECT_EQ(sc.get_ref_point(), Mark{0});
    EXPECT_NO_THROW(sc.backtrack(Mark{3}));
}

TEST(SliceCursor, slice_between_marks) {
    const auto data = std::vector<std::string>{"a", "b", "c", "d"};
    auto sc = SliceCursor<std::string>{data};

    auto s = sc.slice(Mark{1}, Mark{3});
    ASSERT_TRUE(s.has_value());
    ASSERT_EQ(s->size(), 2u);
    EXPECT_EQ((*s)[0], "b");
    EXPECT_EQ((*s)[1], "c");
}

TEST(SliceCursor, slice_rejects_reversed_or_out_of_bounds) {
    const auto data = std::vector{1, 2, 3};
    auto sc = SliceCursor<int>{data};

    EXPECT_FALSE(sc.slice(Mark{2}, Mark{1}).has_value());
    EXPECT_FALSE(sc.slice(Mark{0}, Mark{4}).has_value());
    auto empty = sc.slice(Mark{3}, Mark{3});
    ASSERT_TRUE(empty.has_value());
    EXPECT_TRUE(empty->empty());
}

TEST(SliceCursor, slice_from_mark_to_current_position) {
    const auto data = std::vector{1, 2, 3, 4};
    auto sc = SliceCursor<int>{data};
    sc.next();
    auto m = sc.get_ref_point();
    sc.next();
    sc.next();

    auto consumed = sc.slice_from(m);
    ASSERT_TRUE(consumed.has_value());
    EXPECT_EQ(std::vector(consumed->begin(), consumed->end()), (std::vector{2, 3}));
}

TEST(SliceCursor, range_for_and_concepts) {
    static_assert(std::ranges::input_range<SliceCursor<int>>);

    const auto data = std::vector{5, 6, 7};
    auto sc = SliceCursor<int>{data};
    auto sum = 0;
    for (auto v : sc) sum += v;
    EXPECT_EQ(sum, 18);
    EXPECT_EQ(sc.get_ref_point(), Mark{3});
}

TEST(SliceCursor, default_constructed_is_empty) {
    auto sc = SliceCursor<int>{};
    EXPECT_EQ(sc.size(), 0u);
    EXPECT_EQ(sc.next(), nullptr);
}
