#include <backtrack-cpp/error.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace backtrack_cpp;

TEST(ErrorKind, to_string_view_covers_all_variants) {
    EXPECT_EQ(to_string_view(ErrorKind::out_of_range),      "out_of_range");
    EXPECT_EQ(to_string_view(ErrorKind::invalid_operation), "invalid_operation");
}

TEST(Error, construction_and_equality) {
    const auto e1 = Error{ErrorKind::out_of_range, "past the end"};
    const auto e2 = Error{ErrorKind::out_of_range, "past the end"};
    const auto e3 = Error{ErrorKind::invalid_operation, "past the end"};

    EXPECT_EQ(e1, e2);
    EXPECT_NE(e1, e3);
}

TEST(Error, different_messages_are_not_equal) {
    const auto e1 = Error{ErrorKind::out_of_range, "foo"};
    const auto e2 = Error{ErrorKind::out_of_range, "bar"};

    EXPECT_NE(e1, e2);
}

TEST(BacktrackError, carries_structured_error) {
    const auto err = BacktrackError{Error{ErrorKind::invalid_operation, "detached"}};

    EXPECT_EQ(err.kind(), ErrorKind::invalid_operation);
    EXPECT_EQ(err.error().message, "detached");
    EXPECT_EQ(std::string{err.what()}, "invalid_operation: detached");
}

TEST(BacktrackError, is_catchable_as_std_out_of_range) {
    EXPECT_THROW(throw BacktrackError(Error{ErrorKind::out_of_range, "x"}), std::out_of_range);
}

TEST(BacktrackError, out_of_range_message_names_position_and_size) {
    const auto err = detail::out_of_range_error("backtrack to", 7, 3);

    EXPECT_EQ(err.kind(), ErrorKind::out_of_range);
    EXPECT_EQ(err.error().message, "backtrack to position 7 is past the recorded history of 3 items");
}

TEST(BacktrackError, out_of_range_message_singular_item) {
    const auto err = detail::out_of_range_error("record", 2, 1);
    EXPECT_EQ(err.error().message, "record position 2 is past the recorded history of 1 item");
}

TEST(BacktrackError, detached_cursor_is_invalid_operation) {
    EXPECT_EQ(detail::detached_cursor_error().kind(), ErrorKind::invalid_operation);
}
