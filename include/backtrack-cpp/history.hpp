/// @file history.hpp
/// @brief The History class: the shared append-only record of a source.

#pragma once

#include <backtrack-cpp/error.hpp>
#include <backtrack-cpp/source.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <utility>

namespace backtrack_cpp {

/// The recorded history of a Source.
///
/// History pulls values from its source on demand and stores each one
/// exactly once. Items are only ever appended: a recorded item is never
/// removed, reordered or modified, and appending never moves existing
/// items. A pointer returned by record_or_replay() or at() therefore
/// stays valid for as long as the History exists.
///
/// A History is normally owned jointly by a Recorder and the cursors it
/// hands out (see recorder.hpp), so it lives until the last of them is
/// destroyed.
///
/// @code
/// auto history = History<int>{from_range(std::vector{10, 20, 30})};
/// auto first = history.record_or_replay(0);   // pulls 10 from the source
/// auto again = history.record_or_replay(0);   // replays 10, no pull
/// @endcode
template <typename T>
class History {
public:
    using value_type = T;

    /// Construct an empty history over the given source.
    explicit History(Source<T> source)
        : source_{std::move(source)} {}

    // Cursors and outstanding item pointers refer to this object.
    History(const History&) = delete;
    auto operator=(const History&) -> History& = delete;
    History(History&&) = delete;
    auto operator=(History&&) -> History& = delete;

    /// Get the item at a logical position, pulling it from the source if
    /// it is the next one not yet recorded.
    ///
    /// - index < size(): the recorded item (replay, no side effect).
    /// - index == size(): one call to the source. A value is appended and
    ///   returned; completion marks the history exhausted.
    /// - index == size() and exhausted(): nullptr, the source is not called.
    ///
    /// If the source throws, nothing is recorded and the exception
    /// propagates; asking for the same index again calls the source again.
    ///
    /// @return A pointer to the stored item, or nullptr at end of sequence.
    /// @throws BacktrackError (out_of_range) if index > size().
    auto record_or_replay(std::size_t index) -> const T* {
        {
            auto guard = read_guard();
            if (index < items_.size()) return &items_[index];
            check_frontier(index);
            if (exhausted_) return nullptr;
        }

        auto lock = std::unique_lock{mutex_};
        // Another cursor may have recorded this slot while we were unlocked.
        if (index < items_.size()) return &items_[index];
        check_frontier(index);
        if (exhausted_) return nullptr;

        ++pulls_;
        auto value = source_();
        if (!value) {
            exhausted_ = true;
            source_ = nullptr;
            return nullptr;
        }
        items_.push_back(std::move(*value));
        return &items_.back();
    }

    /// Get an already recorded item. Never calls the source.
    /// @throws BacktrackError (out_of_range) if index >= size().
    auto at(std::size_t index) const -> const T& {
        auto guard = read_guard();
        if (index >= items_.size()) {
            throw detail::out_of_range_error("read at", index, items_.size());
        }
        return items_[index];
    }

    /// Number of recorded items. This is also the frontier position.
    auto size() const -> std::size_t {
        auto guard = read_guard();
        return items_.size();
    }

    auto empty() const -> bool { return size() == 0; }

    /// Whether the source has signalled the end of the sequence.
    auto exhausted() const -> bool {
        auto guard = read_guard();
        return exhausted_;
    }

    /// Number of times the source has been called, including failed calls
    /// and the final call that reported the end of the sequence.
    auto pulls() const -> std::size_t {
        auto guard = read_guard();
        return pulls_;
    }

    // -- Locking control ------------------------------------------------------

    /// Enable or disable internal read locking.
    ///
    /// When enabled (default), replays and inspection take a shared lock.
    /// When disabled, they skip the lock; the caller must guarantee that
    /// no cursor appends to this history while another reads it, e.g. by
    /// recording everything up front and only replaying afterwards.
    /// Appending always takes the exclusive lock.
    void set_read_locking(bool enabled) { read_locking_ = enabled; }

    /// Check whether internal read locking is enabled.
    auto read_locking() const -> bool { return read_locking_; }

private:
    /// RAII guard that conditionally acquires a shared_lock.
    struct ReadGuard {
        std::shared_lock<std::shared_mutex> lock_;

        ReadGuard(std::shared_mutex& mtx, bool engage)
            : lock_{mtx, std::defer_lock} {
            if (engage) lock_.lock();
        }
    };

    auto read_guard() const -> ReadGuard { return ReadGuard{mutex_, read_locking_}; }

    // Caller holds a lock.
    void check_frontier(std::size_t index) const {
        if (index > items_.size()) {
            throw detail::out_of_range_error("record", index, items_.size());
        }
    }

    Source<T> source_;
    std::deque<T> items_;
    bool exhausted_{false};
    std::size_t pulls_{0};
    mutable std::shared_mutex mutex_;
    bool read_locking_{true};
};

}  // namespace backtrack_cpp
