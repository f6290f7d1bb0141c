/// @file mark.hpp
/// @brief Mark type for saved positions in a recorded history.

#pragma once

#include <compare>
#include <cstddef>

namespace backtrack_cpp {

/// A saved position in a recorded history.
///
/// A Mark is the index of the next item a cursor will consume. It holds
/// no reference to the history it came from and stays valid for the
/// whole lifetime of that history, because recorded items are never
/// removed. Marks are not portable between different histories.
///
/// Obtain a mark with get_ref_point() and return to it with backtrack().
struct Mark {
    std::size_t position{0};  ///< Index of the next item to be consumed.

    auto operator==(const Mark&) const -> bool = default;
    auto operator<=>(const Mark&) const = default;
};

}  // namespace backtrack_cpp
