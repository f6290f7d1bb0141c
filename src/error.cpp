#include <backtrack-cpp/error.hpp>

#include <string>
#include <utility>

namespace backtrack_cpp {

namespace {

auto format_what(const Error& error) -> std::string {
    auto result = std::string{to_string_view(error.kind)};
    result += ": ";
    result += error.message;
    return result;
}

}  // namespace

BacktrackError::BacktrackError(Error error)
    : std::out_of_range{format_what(error)}, error_{std::move(error)} {}

namespace detail {

auto out_of_range_error(std::string_view what, std::size_t position,
                        std::size_t size) -> BacktrackError {
    auto message = std::string{what};
    message += " position ";
    message += std::to_string(position);
    message += " is past the recorded history of ";
    message += std::to_string(size);
    message += size == 1 ? " item" : " items";
    return BacktrackError{Error{ErrorKind::out_of_range, std::move(message)}};
}

auto detached_cursor_error() -> BacktrackError {
    return BacktrackError{Error{ErrorKind::invalid_operation,
                                "cursor is not attached to a history"}};
}

}  // namespace detail

}  // namespace backtrack_cpp
