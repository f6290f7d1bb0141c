/// @file source.hpp
/// @brief The Source contract: a forward-only producer of values.

#pragma once

#include <concepts>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <ranges>
#include <type_traits>
#include <utility>

namespace backtrack_cpp {

/// A forward-only producer of values.
///
/// Each call yields the next value, or std::nullopt once the sequence is
/// finished. A source may throw to report a failure. A History calls its
/// source at most once per position and never again after std::nullopt.
template <typename T>
using Source = std::function<std::optional<T>()>;

/// Any callable usable as a Source<T>.
template <typename F, typename T>
concept SourceFor = std::invocable<F&> &&
                    std::convertible_to<std::invoke_result_t<F&>, std::optional<T>>;

/// Adapt an iterator pair into a Source.
///
/// The iterators must stay valid for as long as the source is in use.
template <std::input_iterator It, std::sentinel_for<It> Sent>
    requires std::copyable<It> && std::copyable<Sent>
auto from_iterators(It first, Sent last) -> Source<std::iter_value_t<It>> {
    using value_type = std::iter_value_t<It>;
    return [first = std::move(first), last = std::move(last)]() mutable
               -> std::optional<value_type> {
        if (first == last) return std::nullopt;
        auto value = value_type(*first);
        ++first;
        return value;
    };
}

/// Adapt a range into a Source.
///
/// An lvalue range is borrowed and must outlive the source. An rvalue
/// range (e.g. a temporary vector) is moved into the source.
template <std::ranges::input_range R>
    requires std::copyable<std::ranges::iterator_t<R>>
auto from_range(R&& range) -> Source<std::ranges::range_value_t<R>> {
    using value_type = std::ranges::range_value_t<R>;
    if constexpr (std::is_lvalue_reference_v<R>) {
        return from_iterators(std::ranges::begin(range), std::ranges::end(range));
    } else {
        // std::function needs a copyable target, so the range lives on the heap.
        auto owned = std::make_shared<std::remove_cvref_t<R>>(std::forward<R>(range));
        auto it = std::ranges::begin(*owned);
        return [owned, it]() mutable -> std::optional<value_type> {
            if (it == std::ranges::end(*owned)) return std::nullopt;
            auto value = value_type(std::ranges::iter_move(it));
            ++it;
            return value;
        };
    }
}

}  // namespace backtrack_cpp
