/// @file error.hpp
/// @brief Error types for the backtrack-cpp library.

#pragma once

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace backtrack_cpp {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    out_of_range,       ///< A position lies beyond the recorded history.
    invalid_operation,  ///< An operation is invalid in the current context.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::out_of_range:      return "out_of_range";
        case ErrorKind::invalid_operation: return "invalid_operation";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// The exception thrown for rejected positions and misused cursors.
///
/// Derives from std::out_of_range so callers that only care about bad
/// positions can catch the standard type. The structured Error is
/// available through error().
class BacktrackError : public std::out_of_range {
public:
    explicit BacktrackError(Error error);

    auto error() const noexcept -> const Error& { return error_; }
    auto kind() const noexcept -> ErrorKind { return error_.kind; }

private:
    Error error_;
};

namespace detail {

/// Build the error raised when `position` lies past `size` recorded items.
auto out_of_range_error(std::string_view what, std::size_t position,
                        std::size_t size) -> BacktrackError;

/// Build the error raised when a cursor without a history is driven.
auto detached_cursor_error() -> BacktrackError;

}  // namespace detail

}  // namespace backtrack_cpp
