/// @file mode.hpp
/// @brief Output modes for cursors: Copying and Referencing.

#pragma once

#include <concepts>
#include <optional>
#include <string_view>

namespace backtrack_cpp {

/// Cursor mode that yields an independent copy of each recorded item.
///
/// Output is std::optional<T>; std::nullopt marks the end of the
/// sequence. The copy shares nothing with the history, so mutating it
/// never affects later replays.
struct Copying {
    static constexpr std::string_view name = "copying";

    template <typename T>
    using output = std::optional<T>;

    template <typename T>
    static constexpr bool supports = std::copy_constructible<T>;

    template <typename T>
    static auto convert(const T* item) -> output<T> {
        if (!item) return std::nullopt;
        return *item;
    }
};

/// Cursor mode that yields a read-only pointer into the history.
///
/// Output is const T*; nullptr marks the end of the sequence. The
/// pointer stays valid for the lifetime of the history, not just of the
/// cursor that produced it. T needs no copy constructor.
struct Referencing {
    static constexpr std::string_view name = "referencing";

    template <typename T>
    using output = const T*;

    template <typename T>
    static constexpr bool supports = true;

    template <typename T>
    static auto convert(const T* item) -> output<T> { return item; }
};

/// A cursor output mode usable with items of type T.
template <typename Mode, typename T>
concept ModeFor = requires(const T* item) {
    { Mode::name } -> std::convertible_to<std::string_view>;
    { Mode::template convert<T>(item) } -> std::same_as<typename Mode::template output<T>>;
} && Mode::template supports<T>;

}  // namespace backtrack_cpp
