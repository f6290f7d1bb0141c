/// @file slice_cursor.hpp
/// @brief SliceCursor: backtracking over an existing contiguous range.

#pragma once

#include <backtrack-cpp/error.hpp>
#include <backtrack-cpp/mark.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>

namespace backtrack_cpp {

/// A backtracking cursor over data that is already in memory.
///
/// The span plays the part of a fully recorded, exhausted history, so
/// nothing is pulled or copied: next() yields pointers into the span.
/// The span must outlive the cursor and every pointer it hands out.
///
/// @code
/// auto data = std::array{true, false};
/// auto sc = SliceCursor<bool>{data};
/// sc.next();          // &data[0]
/// sc.next();          // &data[1]
/// sc.next();          // nullptr
/// sc.start_again();
/// sc.next();          // &data[0]
/// @endcode
template <typename T>
class SliceCursor {
public:
    using value_type = T;
    using output_type = const T*;

    class iterator;

    SliceCursor() = default;

    explicit SliceCursor(std::span<const T> items)
        : items_{items} {}

    /// Yield the item at the current position and advance, or nullptr at
    /// the end of the span (the position then stays put).
    auto next() -> const T* {
        if (position_ >= items_.size()) return nullptr;
        return &items_[position_++];
    }

    auto get_ref_point() const -> Mark { return Mark{position_}; }
    auto get_oldest_point() const -> Mark { return Mark{0}; }

    /// @throws BacktrackError (out_of_range) if mark is past the end of
    ///   the span; the position is left unchanged.
    void backtrack(Mark mark) {
        if (mark.position > items_.size()) {
            throw detail::out_of_range_error("backtrack to", mark.position, items_.size());
        }
        position_ = mark.position;
    }

    void start_again() { position_ = 0; }

    /// The items between two marks, [first, last).
    /// @return The sub-span, or nullopt if first > last or last is past the end.
    auto slice(Mark first, Mark last) const -> std::optional<std::span<const T>> {
        if (first > last || last.position > items_.size()) return std::nullopt;
        return items_.subspan(first.position, last.position - first.position);
    }

    /// The items from a mark to the current position.
    auto slice_from(Mark first) const -> std::optional<std::span<const T>> {
        return slice(first, get_ref_point());
    }

    auto size() const -> std::size_t { return items_.size(); }

    auto begin() -> iterator { return iterator{*this}; }
    auto end() const -> std::default_sentinel_t { return std::default_sentinel; }

private:
    std::span<const T> items_;
    std::size_t position_{0};
};

template <typename T>
class SliceCursor<T>::iterator {
public:
    using value_type = T;
    using iterator_concept = std::input_iterator_tag;
    using difference_type = std::ptrdiff_t;

    iterator() = default;

    explicit iterator(SliceCursor& cursor)
        : cursor_{&cursor}, current_{cursor.next()} {}

    auto operator*() const -> const T& { return *current_; }
    auto operator->() const -> const T* { return current_; }

    auto operator++() -> iterator& {
        current_ = cursor_->next();
        return *this;
    }

    void operator++(int) { ++*this; }

    friend auto operator==(const iterator& it, std::default_sentinel_t) -> bool {
        return it.current_ == nullptr;
    }

private:
    SliceCursor* cursor_{nullptr};
    const T* current_{nullptr};
};

}  // namespace backtrack_cpp
