
#pragma once

#include "errors.hpp"
#include "nullable.hpp"
#include "persistent-map.hpp"
#include "persistent-queue.hpp"
#include "persistent-set.hpp"
#include "persistent-stack.hpp"
#include "persistent-vector.hpp"
#include "sorted-map.hpp"
#include "sorted-set.hpp"

#include <functional>
#include <initializer_list>
#include <map>
#include <ranges>
#include <type_traits>
#include <utility>

namespace obsidian {

// ----------------------------------------------------------------------------------------- Empties

/**
 * One shared empty instance per type, created on first use
 */
//@{
template <typename T> const persistent_stack<T>& empty_stack() {
  static const persistent_stack<T> instance;
  return instance;
}

template <typename T> const persistent_queue<T>& empty_queue() {
  static const persistent_queue<T> instance;
  return instance;
}

template <typename T> const persistent_vector<T>& empty_vector() {
  static const persistent_vector<T> instance;
  return instance;
}

template <typename T> const persistent_set<T>& empty_set() {
  static const persistent_set<T> instance;
  return instance;
}

template <typename K, typename V> const persistent_map<K, V>& empty_map() {
  static const persistent_map<K, V> instance;
  return instance;
}

template <typename T> const sorted_set<T>& empty_sorted_set() {
  static const sorted_set<T> instance;
  return instance;
}

template <typename K, typename V> const sorted_map<K, V>& empty_sorted_map() {
  static const sorted_map<K, V> instance;
  return instance;
}
//@}

// A fresh empty ordered by `compare`
//@{
template <typename T, typename Compare>
sorted_set<T, Compare> empty_sorted_set(const Compare& compare) {
  return sorted_set<T, Compare>(compare);
}

template <typename K, typename V, typename Compare>
sorted_map<K, V, Compare> empty_sorted_map(const Compare& compare) {
  return sorted_map<K, V, Compare>(compare);
}
//@}

// --------------------------------------------------------------------------------------- Factories

namespace detail {

  template <typename Range>
  using range_item_t = std::remove_cvref_t<std::ranges::range_reference_t<const Range&>>;

  template <typename Range>
  using range_key_t = std::remove_const_t<typename range_item_t<Range>::first_type>;

  template <typename Range> using range_mapped_t = typename range_item_t<Range>::second_type;

  template <typename Map> Map add_pairs(Map map) { return map; }

  template <typename Map, typename K, typename V, typename... Rest>
  Map add_pairs(Map map, const K& key, const V& value, const Rest&... rest) {
    return add_pairs(map.plus(key, value), rest...);
  }

  template <typename Tree> void insert_pairs(Tree&) {}

  template <typename Tree, typename K, typename V, typename... Rest>
  void insert_pairs(Tree& tree, const K& key, const V& value, const Rest&... rest) {
    tree.insert_or_assign(typename Tree::key_type(key), typename Tree::mapped_type(value));
    insert_pairs(tree, rest...);
  }

} // namespace detail

/**
 * `stack_of(a, b, c)` has `a` on top, so it iterates in argument order
 */
template <typename T, typename... Rest>
persistent_stack<T> stack_of(const T& first, const Rest&... rest) {
  return persistent_stack<T>{first, static_cast<T>(rest)...};
}

template <typename Range> auto stack_copy_of(const Range& items) {
  using T = detail::range_item_t<Range>;
  return persistent_stack<T>(std::begin(items), std::end(items));
}

template <typename T, typename... Rest>
persistent_queue<T> queue_of(const T& first, const Rest&... rest) {
  return persistent_queue<T>{first, static_cast<T>(rest)...};
}

template <typename Range> auto queue_copy_of(const Range& items) {
  using T = detail::range_item_t<Range>;
  return persistent_queue<T>(std::begin(items), std::end(items));
}

template <typename T, typename... Rest>
persistent_vector<T> vector_of(const T& first, const Rest&... rest) {
  return persistent_vector<T>{first, static_cast<T>(rest)...};
}

template <typename Range> auto vector_copy_of(const Range& items) {
  using T = detail::range_item_t<Range>;
  return persistent_vector<T>(std::begin(items), std::end(items));
}

template <typename T, typename... Rest>
persistent_set<T> set_of(const T& first, const Rest&... rest) {
  return persistent_set<T>{first, static_cast<T>(rest)...};
}

template <typename Range> auto set_copy_of(const Range& items) {
  using T = detail::range_item_t<Range>;
  return persistent_set<T>(std::begin(items), std::end(items));
}

/**
 * `map_of(k1, v1, k2, v2, ...)`; a repeated key keeps its last value
 */
template <typename K, typename V, typename... Rest>
persistent_map<K, V> map_of(const K& key, const V& value, const Rest&... rest) {
  static_assert(sizeof...(Rest) % 2 == 0, "map_of() takes key/value pairs");
  return detail::add_pairs(persistent_map<K, V>{}, key, value, rest...);
}

template <typename Range> auto map_copy_of(const Range& items) {
  using map_type = persistent_map<detail::range_key_t<Range>, detail::range_mapped_t<Range>>;
  return map_type{}.plus_all(items);
}

template <typename T, typename... Rest>
sorted_set<T> sorted_set_of(const T& first, const Rest&... rest) {
  return sorted_set<T>{first, static_cast<T>(rest)...};
}

template <typename T, typename Compare>
sorted_set<T, Compare> sorted_set_of(const Compare& compare, std::initializer_list<T> items) {
  return sorted_set<T, Compare>(items, compare);
}

template <typename Range> auto sorted_set_copy_of(const Range& items) {
  using T = detail::range_item_t<Range>;
  return sorted_set<T>(std::begin(items), std::end(items));
}

/**
 * The elements of `items` ordered by `compare`
 * @throws illegal_state_error if `compare` is null
 */
template <typename Compare, typename Range>
auto sorted_set_copy_of(const Compare& compare, const Range& items) {
  using T = detail::range_item_t<Range>;
  return sorted_set<T, Compare>(std::begin(items), std::end(items), compare);
}

template <typename K, typename V, typename... Rest>
sorted_map<K, V> sorted_map_of(const K& key, const V& value, const Rest&... rest) {
  static_assert(sizeof...(Rest) % 2 == 0, "sorted_map_of() takes key/value pairs");
  typename sorted_map<K, V>::tree_type tree;
  detail::insert_pairs(tree, key, value, rest...);
  return sorted_map<K, V>(std::move(tree));
}

template <typename Range> auto sorted_map_copy_of(const Range& items) {
  using map_type = sorted_map<detail::range_key_t<Range>, detail::range_mapped_t<Range>>;
  return map_type(std::begin(items), std::end(items));
}

template <typename Compare, typename Range>
auto sorted_map_copy_of(const Compare& compare, const Range& items) {
  using map_type =
      sorted_map<detail::range_key_t<Range>, detail::range_mapped_t<Range>, Compare>;
  return map_type(std::begin(items), std::end(items), compare);
}

// ---------------------------------------------------------------------------------- Merge policies

/**
 * How `to_sorted_map` combines the values of two items with the same key:
 * `merge(existing, incoming)`.
 */
//@{
template <typename V> std::function<V(const V&, const V&)> fail_on_duplicate_keys() {
  return [](const V&, const V&) -> V { throw illegal_state_error{"duplicate key"}; };
}

template <typename V> std::function<V(const V&, const V&)> keep_first() {
  return [](const V& existing, const V&) -> V { return existing; };
}

template <typename V> std::function<V(const V&, const V&)> keep_last() {
  return [](const V&, const V& incoming) -> V { return incoming; };
}
//@}

// -------------------------------------------------------------------------------------- Collectors

/**
 * Collects `range` into a sorted map ordered by `compare`, with `key_fn(item)` and
 * `value_fn(item)` for each item. Items with equal keys are combined with `merge`.
 *
 * @throws null_argument_error if a key is null
 */
template <typename Compare, typename Range, typename KeyFn, typename ValueFn, typename Merge>
auto to_sorted_map_by(const Compare& compare, const Range& range, KeyFn&& key_fn,
                      ValueFn&& value_fn, Merge&& merge) {
  using item_type = detail::range_item_t<Range>;
  using K = std::decay_t<std::invoke_result_t<KeyFn&, const item_type&>>;
  using V = std::decay_t<std::invoke_result_t<ValueFn&, const item_type&>>;

  detail::require_comparator(compare);
  typename sorted_map<K, V, Compare>::tree_type tree(compare);
  for (const auto& item : range) {
    K key = key_fn(item);
    V value = value_fn(item);
    detail::require_non_null(key, "key");
    auto position = tree.find(key);
    if (position == tree.end())
      tree.emplace(std::move(key), std::move(value));
    else
      position->second = merge(position->second, value);
  }
  return sorted_map<K, V, Compare>(std::move(tree));
}

/**
 * As above; a duplicate key throws `illegal_state_error`
 */
template <typename Compare, typename Range, typename KeyFn, typename ValueFn>
auto to_sorted_map_by(const Compare& compare, const Range& range, KeyFn&& key_fn,
                      ValueFn&& value_fn) {
  using item_type = detail::range_item_t<Range>;
  using V = std::decay_t<std::invoke_result_t<ValueFn&, const item_type&>>;
  return to_sorted_map_by(compare, range, key_fn, value_fn, fail_on_duplicate_keys<V>());
}

template <typename Range, typename KeyFn, typename ValueFn, typename Merge>
auto to_sorted_map(const Range& range, KeyFn&& key_fn, ValueFn&& value_fn, Merge&& merge) {
  using item_type = detail::range_item_t<Range>;
  using K = std::decay_t<std::invoke_result_t<KeyFn&, const item_type&>>;
  return to_sorted_map_by(std::less<K>{}, range, key_fn, value_fn, merge);
}

template <typename Range, typename KeyFn, typename ValueFn>
auto to_sorted_map(const Range& range, KeyFn&& key_fn, ValueFn&& value_fn) {
  using item_type = detail::range_item_t<Range>;
  using K = std::decay_t<std::invoke_result_t<KeyFn&, const item_type&>>;
  return to_sorted_map_by(std::less<K>{}, range, key_fn, value_fn);
}

} // namespace obsidian
