/// @file walkback.hpp
/// @brief Walkback: a reverse walk over a recorded history.

#pragma once

#include <backtrack-cpp/history.hpp>
#include <backtrack-cpp/mark.hpp>
#include <backtrack-cpp/mode.hpp>

#include <cstddef>
#include <memory>
#include <utility>

namespace backtrack_cpp {

/// Walks backwards over the recorded history, starting at the position
/// of the cursor that created it.
///
/// Each call to next() yields the previous item in the same output mode
/// as the cursor. get_ref_point() names the position just before the
/// item most recently yielded, so backtracking a cursor to it makes the
/// cursor's next() repeat that item. A walkback only reads recorded
/// items; it never calls the source.
///
/// @code
/// cursor.next();  // 1
/// cursor.next();  // 2
/// auto wb = cursor.walk_back();
/// wb.next();      // 2
/// cursor.backtrack(wb.get_ref_point());
/// cursor.next();  // 2 again
/// @endcode
template <typename T, ModeFor<T> Mode>
class Walkback {
public:
    using output_type = typename Mode::template output<T>;

    Walkback(std::shared_ptr<History<T>> history, Mark start)
        : history_{std::move(history)}, position_{start.position} {}

    /// Step back one item and yield it; yields the empty output at the
    /// oldest position.
    auto next() -> output_type {
        if (position_ == 0) return Mode::template convert<T>(nullptr);
        auto out = Mode::template convert<T>(&history_->at(position_ - 1));
        --position_;
        return out;
    }

    auto get_ref_point() const -> Mark { return Mark{position_}; }

    /// Whether the walk has reached the oldest position.
    auto done() const -> bool { return position_ == 0; }

private:
    std::shared_ptr<History<T>> history_;
    std::size_t position_;
};

}  // namespace backtrack_cpp
