/// @file recorder.hpp
/// @brief The Recorder class: the primary entry point of backtrack-cpp.

#pragma once

#include <backtrack-cpp/cursor.hpp>
#include <backtrack-cpp/history.hpp>
#include <backtrack-cpp/mark.hpp>
#include <backtrack-cpp/source.hpp>

#include <concepts>
#include <cstddef>
#include <iterator>
#include <memory>
#include <ranges>
#include <type_traits>
#include <utility>

namespace backtrack_cpp {

/// Records a forward-only source so that it can be replayed.
///
/// A Recorder wraps a Source in a shared History and hands out cursors
/// over it. Every cursor, of either mode, sees the same sequence, and the
/// source is called at most once per position no matter how many cursors
/// revisit it. The Recorder and its cursors own the History jointly; the
/// Recorder may be destroyed before the cursors.
///
/// @code
/// auto rec = record(std::vector{1, 2, 3});
/// auto a = rec.copying();
/// auto b = rec.referencing();
/// a.next();    // 1, pulled from the source
/// *b.next();   // 1, replayed from the history
/// @endcode
template <typename T>
class Recorder {
public:
    using value_type = T;

    /// Wrap a source in a new, empty history.
    explicit Recorder(Source<T> source)
        : history_{std::make_shared<History<T>>(std::move(source))} {}

    /// Wrap any callable returning std::optional<T>.
    template <SourceFor<T> F>
        requires (!std::same_as<std::remove_cvref_t<F>, Source<T>>)
    explicit Recorder(F&& source)
        : Recorder{Source<T>{std::forward<F>(source)}} {}

    // -- Cursors --------------------------------------------------------------

    /// A cursor yielding copies, starting at the given mark (default: the
    /// oldest item).
    /// @throws BacktrackError (out_of_range) if start is past the history.
    template <typename U = T>
        requires Copying::supports<U>
    auto copying(Mark start = {}) const -> CopyingCursor<U> {
        return CopyingCursor<U>{history_, start};
    }

    /// A cursor yielding pointers into the history, starting at the given
    /// mark (default: the oldest item).
    /// @throws BacktrackError (out_of_range) if start is past the history.
    auto referencing(Mark start = {}) const -> ReferencingCursor<T> {
        return ReferencingCursor<T>{history_, start};
    }

    // -- Inspection -----------------------------------------------------------

    /// The position just past the last recorded item. A cursor started
    /// here only sees items that have not been recorded yet.
    auto frontier() const -> Mark { return Mark{history_->size()}; }

    auto size() const -> std::size_t { return history_->size(); }
    auto exhausted() const -> bool { return history_->exhausted(); }

    /// The shared history.
    auto history() const -> const std::shared_ptr<History<T>>& { return history_; }

    // -- Locking control ------------------------------------------------------

    /// See History::set_read_locking().
    void set_read_locking(bool enabled) { history_->set_read_locking(enabled); }
    auto read_locking() const -> bool { return history_->read_locking(); }

private:
    std::shared_ptr<History<T>> history_;
};

/// Record a range. See from_range() for the lifetime rules.
template <std::ranges::input_range R>
auto record(R&& range) -> Recorder<std::ranges::range_value_t<R>> {
    return Recorder<std::ranges::range_value_t<R>>{from_range(std::forward<R>(range))};
}

/// Record an iterator pair. The iterators must outlive the recorder's
/// source.
template <std::input_iterator It, std::sentinel_for<It> Sent>
auto record(It first, Sent last) -> Recorder<std::iter_value_t<It>> {
    return Recorder<std::iter_value_t<It>>{from_iterators(std::move(first), std::move(last))};
}

}  // namespace backtrack_cpp
