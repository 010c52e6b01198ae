
#pragma once

#include <concepts>
#include <cstddef>
#include <iterator>

namespace obsidian {

/**
 * Capabilities shared by the persistent collections.
 *
 * Every modifier is `const` and returns a new collection of the same type, so each concept
 * checks that `plus`/`minus`-style calls on a `const C&` yield a `C`.
 */

template <typename C>
concept persistent_collection = std::copyable<C> && requires(const C& c) {
  typename C::value_type;
  typename C::const_iterator;
  { c.begin() } -> std::same_as<typename C::const_iterator>;
  { c.end() } -> std::same_as<typename C::const_iterator>;
  { c.size() } -> std::convertible_to<std::size_t>;
  { c.empty() } -> std::convertible_to<bool>;
  { c == c } -> std::convertible_to<bool>;
};

/**
 * Indexed access and positional edits (vector, stack)
 */
template <typename C>
concept persistent_sequence = persistent_collection<C> &&
    requires(const C& c, std::size_t index, const typename C::value_type& value) {
  { c.get(index) } -> std::same_as<const typename C::value_type&>;
  { c.plus(value) } -> std::same_as<C>;
  { c.with(index, value) } -> std::same_as<C>;
  { c.plus_at(index, value) } -> std::same_as<C>;
  { c.minus_at(index) } -> std::same_as<C>;
  { c.minus(value) } -> std::same_as<C>;
  { c.sub_list(index, index) } -> std::same_as<C>;
  { c.index_of(value) } -> std::convertible_to<std::size_t>;
};

template <typename C>
concept persistent_set_like = persistent_collection<C> &&
    requires(const C& c, const typename C::value_type& value) {
  { c.contains(value) } -> std::convertible_to<bool>;
  { c.count(value) } -> std::convertible_to<std::size_t>;
  { c.plus(value) } -> std::same_as<C>;
  { c.minus(value) } -> std::same_as<C>;
};

template <typename C>
concept persistent_stack_like = persistent_sequence<C> &&
    requires(const C& c) {
  { c.peek() } -> std::same_as<const typename C::value_type*>;
  { c.pop() } -> std::same_as<C>;
};

template <typename C>
concept persistent_queue_like = persistent_collection<C> &&
    requires(const C& c, const typename C::value_type& value) {
  { c.peek() } -> std::same_as<const typename C::value_type*>;
  { c.plus(value) } -> std::same_as<C>;
  { c.minus() } -> std::same_as<C>;
};

template <typename C>
concept persistent_map_like = persistent_collection<C> &&
    requires(const C& c, const typename C::key_type& key, const typename C::value_type& value) {
  { c.find(key) } -> std::same_as<const typename C::value_type*>;
  { c.at(key) } -> std::same_as<const typename C::value_type&>;
  { c.contains_key(key) } -> std::convertible_to<bool>;
  { c.plus(key, value) } -> std::same_as<C>;
  { c.minus(key) } -> std::same_as<C>;
};

template <typename C>
concept sorted_map_like = persistent_map_like<C> && requires(const C& c,
                                                             const typename C::key_type& key) {
  c.comparator();
  { c.first_key() } -> std::same_as<const typename C::key_type&>;
  { c.floor_key(key) } -> std::same_as<const typename C::key_type*>;
  c.sub_map(key, key);
  c.descending_map();
};

template <typename C>
concept sorted_set_like = persistent_set_like<C> && requires(const C& c,
                                                             const typename C::value_type& value) {
  c.comparator();
  { c.first() } -> std::same_as<const typename C::value_type&>;
  { c.floor(value) } -> std::same_as<const typename C::value_type*>;
  c.sub_set(value, value);
  c.descending_set();
};

/**
 * The in-place mutators of the standard containers. No persistent collection has any of them.
 */
template <typename C>
concept mutable_collection =
    requires(C& c) { c.clear(); } ||
    requires(C& c, const typename C::value_type& value) { c.insert(value); } ||
    requires(C& c, const typename C::value_type& value) { c.push_back(value); } ||
    requires(C& c, const typename C::value_type& value) { c.emplace(value); } ||
    requires(C& c) { c.erase(c.begin()); } ||
    requires(C& c, const typename C::key_type& key) { c[key] = c.at(key); };

} // namespace obsidian
