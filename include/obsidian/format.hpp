
#pragma once

#include "persistent-map.hpp"
#include "persistent-queue.hpp"
#include "persistent-set.hpp"
#include "persistent-stack.hpp"
#include "persistent-vector.hpp"
#include "sorted-map.hpp"
#include "sorted-set.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <type_traits>

/**
 * `fmt` support: sequences and sets print as `[a, b, c]` (in iteration order), maps as
 * `{k1=v1, k2=v2}`. No format specifiers are accepted.
 */

namespace obsidian::detail {

struct collection_formatter {
  constexpr auto parse(fmt::format_parse_context& ctx) -> decltype(ctx.begin()) {
    return ctx.begin();
  }
};

struct sequence_formatter : collection_formatter {
  template <typename Collection, typename FormatContext>
  auto format(const Collection& collection, FormatContext& ctx) const -> decltype(ctx.out()) {
    return fmt::format_to(ctx.out(), "[{}]", fmt::join(collection, ", "));
  }
};

struct map_formatter : collection_formatter {
  template <typename Map, typename FormatContext>
  auto format(const Map& map, FormatContext& ctx) const -> decltype(ctx.out()) {
    auto out = ctx.out();
    *out++ = '{';
    bool first = true;
    for (const auto& [key, value] : map) {
      if (!first)
        out = fmt::format_to(out, ", ");
      out = fmt::format_to(out, "{}={}", key, value);
      first = false;
    }
    *out++ = '}';
    return out;
  }
};

/**
 * The collections below are formatted by obsidian, never as generic ranges by `fmt/ranges.h`
 */
template <typename T> struct is_formatted_collection : std::false_type {};
template <typename T, bool B>
struct is_formatted_collection<persistent_vector<T, B>> : std::true_type {};
template <typename T, bool B>
struct is_formatted_collection<persistent_stack<T, B>> : std::true_type {};
template <typename T, bool B>
struct is_formatted_collection<persistent_queue<T, B>> : std::true_type {};
template <typename T, typename H, typename E, bool B>
struct is_formatted_collection<persistent_set<T, H, E, B>> : std::true_type {};
template <typename T, typename C>
struct is_formatted_collection<sorted_set<T, C>> : std::true_type {};
template <typename K, typename V, typename H, typename E, bool B>
struct is_formatted_collection<persistent_map<K, V, H, E, B>> : std::true_type {};
template <typename K, typename V, typename C>
struct is_formatted_collection<sorted_map<K, V, C>> : std::true_type {};

} // namespace obsidian::detail

template <typename T, typename Char>
struct fmt::range_format_kind<
    T, Char, std::enable_if_t<obsidian::detail::is_formatted_collection<T>::value>>
    : std::integral_constant<fmt::range_format, fmt::range_format::disabled> {};

template <typename T, bool IsThreadSafe>
struct fmt::formatter<obsidian::persistent_vector<T, IsThreadSafe>>
    : obsidian::detail::sequence_formatter {};

template <typename T, bool IsThreadSafe>
struct fmt::formatter<obsidian::persistent_stack<T, IsThreadSafe>>
    : obsidian::detail::sequence_formatter {};

template <typename T, bool IsThreadSafe>
struct fmt::formatter<obsidian::persistent_queue<T, IsThreadSafe>>
    : obsidian::detail::sequence_formatter {};

template <typename T, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct fmt::formatter<obsidian::persistent_set<T, Hash, KeyEqual, IsThreadSafe>>
    : obsidian::detail::sequence_formatter {};

template <typename T, typename Compare>
struct fmt::formatter<obsidian::sorted_set<T, Compare>> : obsidian::detail::sequence_formatter {};

template <typename K, typename V, typename Hash, typename KeyEqual, bool IsThreadSafe>
struct fmt::formatter<obsidian::persistent_map<K, V, Hash, KeyEqual, IsThreadSafe>>
    : obsidian::detail::map_formatter {};

template <typename K, typename V, typename Compare>
struct fmt::formatter<obsidian::sorted_map<K, V, Compare>> : obsidian::detail::map_formatter {};
