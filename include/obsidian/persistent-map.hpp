
#pragma once

#include "bits/_node-data.hpp"
#include "bits/_hashing.hpp"
#include "bits/_base-node-ops.hpp"
#include "bits/_hamt-node-ops.hpp"
#include "bits/_hamt-iterator.hpp"

#include "errors.hpp"
#include "nullable.hpp"

#include <fmt/format.h>

#include <functional>
#include <initializer_list>
#include <limits>
#include <optional>
#include <stdexcept>
#include <utility>

namespace obsidian {

// ---------------------------------------------------------------------------------- persistent_map

/**
 * A persistent hash map: a hash array mapped trie with 32-way branching on the mixed hash of
 * the key.
 *
 * `plus` and `minus` copy only the path from the root to the changed entry; every other node
 * is shared with the original map. Copying a map is O(1).
 *
 * Keys must not be null (see `nullable_traits`); values may be.
 */
template <typename KeyType,                           //
          typename ValueType,                         //
          typename Hash = std::hash<KeyType>,         // Hash function for keys
          typename KeyEqual = std::equal_to<KeyType>, // Equality comparision for keys
          bool IsThreadSafe = true                    // True if reference counts are atomic
          >
class persistent_map {
private:
  using Ops = detail::NodeOps<KeyType, ValueType, Hash, KeyEqual, IsThreadSafe>;
  using node_type = typename Ops::node_type;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;

public:
  //@{
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = typename Ops::item_type;
  using size_type = typename Ops::size_type;
  using hash_type = typename Ops::hash_type;
  using hasher = Hash;
  using key_equal = KeyEqual;
  using const_reference = const item_type&;
  using const_iterator = detail::Iterator<Ops>;
  using iterator = const_iterator;
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

private:
  node_ptr_type root_{nullptr}; //!< Root of the tree could be branch, leaf or collision
  std::size_t size_{0};         //!< Current size of the map

  // Adopts the reference to `root`
  constexpr persistent_map(node_ptr_type root, std::size_t size) : root_{root}, size_{size} {}

public:
  //@{ Construction/Destruction
  constexpr persistent_map() = default;
  constexpr persistent_map(const persistent_map& other) { *this = other; }
  constexpr persistent_map(persistent_map&& other) noexcept { swap(other); }
  constexpr ~persistent_map() { Ops::dec_ref(root_); }

  template <typename InputIt> persistent_map(InputIt first, InputIt last) {
    while (first != last) {
      const auto& [key, value] = *first++;
      *this = plus(key, value);
    }
  }
  persistent_map(std::initializer_list<item_type> ilist)
      : persistent_map(std::begin(ilist), std::end(ilist)) {}
  //@}

  //@{ Assignment
  constexpr persistent_map& operator=(const persistent_map& other) {
    Ops::add_ref(other.root_); // safe for self assignment
    Ops::dec_ref(root_);
    root_ = other.root_;
    size_ = other.size_;
    return *this;
  }

  constexpr persistent_map& operator=(persistent_map&& other) noexcept {
    swap(other);
    return *this;
  }

  constexpr void swap(persistent_map& other) noexcept {
    std::swap(root_, other.root_);
    std::swap(size_, other.size_);
  }
  //@}

  //@{ Iterators
  constexpr const_iterator begin() const { return cbegin(); }
  constexpr const_iterator cbegin() const {
    return const_iterator{root_, typename const_iterator::MakeBeginTag{}};
  }

  constexpr const_iterator end() const { return cend(); }
  constexpr const_iterator cend() const {
    return const_iterator{root_, typename const_iterator::MakeEndTag{}};
  }
  //@}

  //@{ Capacity
  constexpr bool empty() const { return size() == 0; }
  constexpr std::size_t size() const { return size_; }
  static constexpr std::size_t max_size() { return std::numeric_limits<std::size_t>::max(); }
  //@}

  //@{ Lookup
  /**
   * @return Pointer to the value stored against `key`, or nullptr if there is none.
   *         Valid for as long as any map sharing this entry is alive.
   */
  constexpr const value_type* find(const key_type& key) const {
    auto* item = Ops::find(root_, key);
    return item != nullptr ? &item->second : nullptr;
  }

  constexpr const item_type* find_entry(const key_type& key) const {
    return Ops::find(root_, key);
  }

  std::optional<value_type> get_opt(const key_type& key) const {
    auto* value = find(key);
    if (value == nullptr)
      return std::nullopt;
    return *value;
  }

  const value_type& at(const key_type& key) const {
    auto* value = find(key);
    if (value == nullptr)
      throw std::out_of_range{"key not found"};
    return *value;
  }

  const value_type& operator[](const key_type& key) const { return at(key); }

  constexpr bool contains_key(const key_type& key) const {
    return Ops::find(root_, key) != nullptr;
  }
  constexpr std::size_t count(const key_type& key) const { return contains_key(key); }

  /**
   * The entries as a read-only view; the map cannot change, so the view never goes stale
   */
  constexpr const persistent_map& entry_set() const noexcept { return *this; }

  /**
   * Calls `f(key, value)` for every entry
   */
  template <typename Function> void for_each(Function&& f) const { Ops::for_each(root_, f); }

  /**
   * True when both maps share the same trie; implies equality
   */
  constexpr bool identical(const persistent_map& other) const noexcept {
    return root_ == other.root_;
  }
  //@}

  //@{ Persistent modifiers
  /**
   * A map with `key` bound to `value`. Returns `*this` (sharing the root) when `key` is already
   * bound to an equal value.
   * @throws null_argument_error if `key` is null
   */
  persistent_map plus(const key_type& key, const value_type& value) const {
    detail::require_non_null(key, "key");
    auto edit = Ops::assoc(root_, Ops::calculate_hash(key), 0, key, value);
    if (edit.node == root_)
      return *this;
    return persistent_map{edit.node, edit.resized ? size_ + 1 : size_};
  }

  template <typename Range> persistent_map plus_all(const Range& items) const {
    auto out = *this;
    for (const auto& [key, value] : items)
      out = out.plus(key, value);
    return out;
  }

  persistent_map plus_all(std::initializer_list<item_type> items) const {
    return plus_all<std::initializer_list<item_type>>(items);
  }

  /**
   * A map without `key`. Returns `*this` when `key` is absent.
   */
  persistent_map minus(const key_type& key) const {
    auto edit = Ops::dissoc(root_, Ops::calculate_hash(key), 0, key);
    if (!edit.resized)
      return *this;
    return persistent_map{edit.node, size_ - 1};
  }

  template <typename Range> persistent_map minus_all(const Range& keys) const {
    auto out = *this;
    for (const auto& key : keys)
      out = out.minus(key);
    return out;
  }

  persistent_map minus_all(std::initializer_list<key_type> keys) const {
    return minus_all<std::initializer_list<key_type>>(keys);
  }
  //@}

  //@{ Observers
  static constexpr hasher hash_function() { return hasher{}; }
  static constexpr key_equal key_eq() { return key_equal{}; }
  //@}

  //@{ Friends
  friend bool operator==(const persistent_map& lhs, const persistent_map& rhs) {
    if (lhs.size() != rhs.size())
      return false;

    if (lhs.root_ == rhs.root_)
      return true;

    for (const auto& [key, value] : lhs) {
      auto* other = rhs.find(key);
      if (other == nullptr || !Ops::same_value(value, *other))
        return false;
    }
    return true;
  }

  friend bool operator!=(const persistent_map& lhs, const persistent_map& rhs) {
    return !(lhs == rhs);
  }

  friend constexpr void swap(persistent_map& lhs, persistent_map& rhs) noexcept { lhs.swap(rhs); }
  //@}

private:
  constexpr node_const_ptr_type get_root_() const { return root_; }
};

} // namespace obsidian
