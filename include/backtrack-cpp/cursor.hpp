/// @file cursor.hpp
/// @brief Backtracking cursors over a shared History.

#pragma once

#include <backtrack-cpp/error.hpp>
#include <backtrack-cpp/history.hpp>
#include <backtrack-cpp/mark.hpp>
#include <backtrack-cpp/mode.hpp>
#include <backtrack-cpp/walkback.hpp>

#include <cstddef>
#include <iterator>
#include <memory>
#include <utility>

namespace backtrack_cpp {

/// A position in a shared History that can advance and rewind.
///
/// next() consumes the item at the cursor's position: a recorded item is
/// replayed, the next unrecorded one is pulled from the source and
/// recorded. get_ref_point() saves the position as a Mark and
/// backtrack() returns to it, after which next() yields exactly the
/// items that followed the mark the first time.
///
/// The Mode parameter decides what next() hands out (see mode.hpp):
/// CopyingCursor<T> yields std::optional<T>, ReferencingCursor<T>
/// yields const T*. Both run the same History::record_or_replay().
///
/// Cursors share their History through a shared_ptr. Copying a cursor
/// yields an independent cursor over the same history at the same
/// position. A single cursor must not be driven from several threads at
/// once; give each thread its own copy.
///
/// @code
/// auto rec = record(std::vector{10, 20, 30});
/// auto c = rec.copying();
/// c.next();                    // 10
/// auto m = c.get_ref_point();  // Mark{1}
/// c.next();                    // 20
/// c.backtrack(m);
/// c.next();                    // 20 again, not pulled twice
/// @endcode
template <typename T, ModeFor<T> Mode>
class BasicCursor {
public:
    using value_type = T;
    using mode_type = Mode;
    using output_type = typename Mode::template output<T>;

    class iterator;

    /// A cursor attached to no history. Every operation except
    /// get_ref_point() throws BacktrackError (invalid_operation).
    BasicCursor() = default;

    /// Attach to a history at the given position.
    /// @throws BacktrackError (out_of_range) if start is past the history.
    explicit BasicCursor(std::shared_ptr<History<T>> history, Mark start = {})
        : history_{std::move(history)} {
        backtrack(start);
    }

    /// Consume the item at the current position.
    ///
    /// On an item, the position advances by one. At the end of the
    /// sequence the position is unchanged and the empty output is
    /// returned (std::nullopt or nullptr); the cursor stays usable.
    /// Exceptions thrown by the source or by copying the item propagate
    /// and leave the position unchanged.
    auto next() -> output_type {
        const auto* item = attached().record_or_replay(position_);
        auto out = Mode::template convert<T>(item);
        if (item) ++position_;
        return out;
    }

    /// Save the current position.
    auto get_ref_point() const -> Mark { return Mark{position_}; }

    /// The oldest position that can be backtracked to. The history never
    /// forgets items, so this is always the start.
    auto get_oldest_point() const -> Mark { return Mark{0}; }

    /// Return to a saved position.
    ///
    /// The mark should come from get_ref_point() on a cursor over the same
    /// history.
    /// @throws BacktrackError (out_of_range) if mark lies past the recorded
    ///   history; the position is left unchanged.
    void backtrack(Mark mark) {
        auto size = attached().size();
        if (mark.position > size) {
            throw detail::out_of_range_error("backtrack to", mark.position, size);
        }
        position_ = mark.position;
    }

    /// Restart from the oldest recorded item.
    void start_again() { backtrack(get_oldest_point()); }

    /// Walk backwards over the history from this cursor's position.
    ///
    /// Items recorded past the position by other cursors are not
    /// visited; use walk_back_from_end() for those.
    auto walk_back() const -> Walkback<T, Mode> {
        attached();
        return Walkback<T, Mode>{history_, get_ref_point()};
    }

    /// Walk backwards over the whole recorded history, starting after the
    /// newest item regardless of this cursor's position.
    auto walk_back_from_end() const -> Walkback<T, Mode> {
        return Walkback<T, Mode>{history_, Mark{attached().size()}};
    }

    /// The shared history, or nullptr for a detached cursor.
    auto history() const -> const std::shared_ptr<History<T>>& { return history_; }

    // -- Range interface ------------------------------------------------------

    /// Iterate from the current position to the end of the sequence.
    /// Iterating advances this cursor.
    auto begin() -> iterator { return iterator{*this}; }
    auto end() const -> std::default_sentinel_t { return std::default_sentinel; }

private:
    auto attached() const -> History<T>& {
        if (!history_) throw detail::detached_cursor_error();
        return *history_;
    }

    std::shared_ptr<History<T>> history_;
    std::size_t position_{0};
};

/// Single-pass iterator over a cursor; compares equal to
/// std::default_sentinel at the end of the sequence.
template <typename T, ModeFor<T> Mode>
class BasicCursor<T, Mode>::iterator {
public:
    using value_type = T;
    using iterator_concept = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;

    iterator() = default;

    explicit iterator(BasicCursor& cursor)
        : cursor_{&cursor}, current_{cursor.next()} {}

    auto operator*() const -> const T& { return *current_; }
    auto operator->() const -> const T* { return &**this; }

    auto operator++() -> iterator& {
        current_ = cursor_->next();
        return *this;
    }

    void operator++(int) { ++*this; }

    friend auto operator==(const iterator& it, std::default_sentinel_t) -> bool {
        return !it.current_;
    }

private:
    BasicCursor* cursor_{nullptr};
    output_type current_{};
};

/// A cursor yielding independent copies of recorded items.
template <typename T>
using CopyingCursor = BasicCursor<T, Copying>;

/// A cursor yielding read-only pointers into the history.
template <typename T>
using ReferencingCursor = BasicCursor<T, Referencing>;

}  // namespace backtrack_cpp
