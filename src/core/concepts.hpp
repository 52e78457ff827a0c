/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for taskpipe extension points.
 *
 * Task identity is derived at compile time from the declared fields of a
 * value record, so the graph builder can deduplicate tasks without every
 * task kind hand-writing equality and hashing.
 */

#pragma once

#include <concepts>
#include <cstddef>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>

namespace taskpipe {

// ─────────────────────────────────────────────
// Hashable
// ─────────────────────────────────────────────

template <typename T>
concept Hashable = requires(const T& value) {
    { std::hash<T>{}(value) } -> std::convertible_to<std::size_t>;
};

// ─────────────────────────────────────────────
// ValueRecord
// ─────────────────────────────────────────────

namespace detail {

template <typename Tuple>
struct all_fields_hashable;

template <typename... Ts>
struct all_fields_hashable<std::tuple<Ts...>>
    : std::bool_constant<(Hashable<std::remove_cvref_t<Ts>> && ...)> {};

}  // namespace detail

/**
 * @concept ValueRecord
 * @brief Constrains immutable task records usable with ValueTask.
 *
 * A record names its kind through `kName` and exposes its declared fields as
 * a tuple of references (typically `std::tie(a, b)`). Equality and hashing
 * are computed over that tuple, so every field must be equality-comparable
 * and hashable.
 */
template <typename T>
concept ValueRecord = requires(const T& record) {
    { T::kName } -> std::convertible_to<std::string_view>;
    { record.fields() };
    { record.fields() == record.fields() } -> std::convertible_to<bool>;
} && detail::all_fields_hashable<std::remove_cvref_t<decltype(std::declval<const T&>().fields())>>::value;

/// Boost-style hash mixing.
constexpr void hash_combine(std::size_t& seed, std::size_t value) noexcept {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace taskpipe
