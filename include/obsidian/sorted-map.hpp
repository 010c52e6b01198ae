
#pragma once

#include "bits/_sorted-range.hpp"

#include "errors.hpp"
#include "nullable.hpp"
#include "sorted-set.hpp"

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>

namespace obsidian {

// -------------------------------------------------------------------------------------- sorted_map

/**
 * A persistent ordered map over a shared, read-only `std::map` snapshot.
 *
 * Lookups, navigation and the `sub_map` family of views are O(log n). `plus` and `minus` copy
 * the whole tree, O(n); when the map would not change they return `*this` instead.
 *
 * Keys must not be null; values may be.
 */
template <typename KeyType, typename ValueType, typename Compare = std::less<KeyType>>
class sorted_map {
public:
  //@{
  using key_type = KeyType;
  using value_type = ValueType;
  using key_compare = Compare;
  using tree_type = std::map<KeyType, ValueType, Compare>;
  using item_type = typename tree_type::value_type; // std::pair<const K, V>
  using size_type = std::size_t;
  using const_reference = const item_type&;
  using const_iterator = typename tree_type::const_iterator;
  using iterator = const_iterator;
  using const_reverse_iterator = typename tree_type::const_reverse_iterator;
  using range_type = sorted_range<tree_type>;
  //@}

private:
  std::shared_ptr<const tree_type> tree_;

  static const key_type& key_of_(const item_type& item) { return item.first; }

  explicit sorted_map(std::shared_ptr<const tree_type> tree) : tree_{std::move(tree)} {}

  sorted_map rebuild_(tree_type&& tree) const {
    return sorted_map(std::make_shared<const tree_type>(std::move(tree)));
  }

public:
  //@{ Construction
  sorted_map() : sorted_map(Compare{}) {}

  /**
   * @throws illegal_state_error if `compare` is null
   */
  explicit sorted_map(const Compare& compare) {
    detail::require_comparator(compare);
    tree_ = std::make_shared<const tree_type>(compare);
  }

  /**
   * Adopts the contents of `tree`
   */
  explicit sorted_map(tree_type tree) {
    detail::require_comparator(tree.key_comp());
    for (const auto& [key, value] : tree)
      detail::require_non_null(key, "key");
    tree_ = std::make_shared<const tree_type>(std::move(tree));
  }

  /**
   * Later entries replace earlier ones with the same key
   */
  template <typename InputIt>
  sorted_map(InputIt first, InputIt last, const Compare& compare = Compare{}) {
    detail::require_comparator(compare);
    tree_type tree(compare);
    for (; first != last; ++first) {
      const auto& [key, value] = *first;
      tree.insert_or_assign(detail::require_non_null(key, "key"), value);
    }
    tree_ = std::make_shared<const tree_type>(std::move(tree));
  }

  sorted_map(std::initializer_list<item_type> ilist, const Compare& compare = Compare{})
      : sorted_map(std::begin(ilist), std::end(ilist), compare) {}
  //@}

  //@{ Iterators
  const_iterator begin() const { return tree_->cbegin(); }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return tree_->cend(); }
  const_iterator cend() const { return end(); }
  const_reverse_iterator rbegin() const { return tree_->crbegin(); }
  const_reverse_iterator rend() const { return tree_->crend(); }
  //@}

  //@{ Capacity
  bool empty() const { return tree_->empty(); }
  std::size_t size() const { return tree_->size(); }
  std::size_t max_size() const { return tree_->max_size(); }
  //@}

  //@{ Lookup
  key_compare comparator() const { return tree_->key_comp(); }

  const value_type* find(const key_type& key) const {
    auto position = tree_->find(key);
    return (position == tree_->end()) ? nullptr : &position->second;
  }

  const item_type* find_entry(const key_type& key) const {
    auto position = tree_->find(key);
    return (position == tree_->end()) ? nullptr : &*position;
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

  bool contains_key(const key_type& key) const { return tree_->find(key) != tree_->end(); }
  std::size_t count(const key_type& key) const { return tree_->count(key); }

  /**
   * Calls `f(key, value)` in key order
   */
  template <typename Function> void for_each(Function&& f) const {
    for (const auto& [key, value] : *tree_)
      f(key, value);
  }

  bool identical(const sorted_map& other) const noexcept { return tree_ == other.tree_; }
  //@}

  //@{ Navigation
  /**
   * @throws std::out_of_range when empty
   */
  const key_type& first_key() const { return first_entry_or_throw_("first_key").first; }
  const key_type& last_key() const { return last_entry_or_throw_("last_key").first; }

  const item_type* first_entry() const { return empty() ? nullptr : &*tree_->begin(); }
  const item_type* last_entry() const { return empty() ? nullptr : &*tree_->rbegin(); }

  /**
   * Entry with the greatest key strictly less than `key`, or nullptr
   */
  const item_type* lower_entry(const key_type& key) const {
    return detail::lower_element(*tree_, key);
  }

  /**
   * Entry with the greatest key less than or equal to `key`, or nullptr
   */
  const item_type* floor_entry(const key_type& key) const {
    return detail::floor_element(*tree_, key);
  }

  const item_type* ceiling_entry(const key_type& key) const {
    return detail::ceiling_element(*tree_, key);
  }

  const item_type* higher_entry(const key_type& key) const {
    return detail::higher_element(*tree_, key);
  }

  const key_type* lower_key(const key_type& key) const { return key_ptr_(lower_entry(key)); }
  const key_type* floor_key(const key_type& key) const { return key_ptr_(floor_entry(key)); }
  const key_type* ceiling_key(const key_type& key) const {
    return key_ptr_(ceiling_entry(key));
  }
  const key_type* higher_key(const key_type& key) const { return key_ptr_(higher_entry(key)); }

  /**
   * The same entries in reverse key order; O(n)
   */
  sorted_map<key_type, value_type, reversed_compare<Compare>> descending_map() const {
    using descending_type = sorted_map<key_type, value_type, reversed_compare<Compare>>;
    typename descending_type::tree_type tree(reversed_compare<Compare>{comparator()});
    for (auto position = rbegin(); position != rend(); ++position)
      tree.emplace_hint(tree.end(), *position);
    return descending_type(std::move(tree));
  }

  sorted_set<key_type, Compare> navigable_key_set() const {
    typename sorted_set<key_type, Compare>::tree_type keys(comparator());
    for (const auto& entry : *tree_)
      keys.insert(keys.end(), entry.first);
    return sorted_set<key_type, Compare>(std::move(keys));
  }

  sorted_set<key_type, reversed_compare<Compare>> descending_key_set() const {
    return navigable_key_set().descending_set();
  }

  /**
   * Entries with keys between `from` and `to`; a view onto this snapshot
   * @throws std::invalid_argument if `to` orders before `from`
   */
  range_type sub_map(const key_type& from, bool from_inclusive, const key_type& to,
                     bool to_inclusive) const {
    return detail::make_sorted_range(tree_, from, from_inclusive, to, to_inclusive, key_of_);
  }

  // [from, to)
  range_type sub_map(const key_type& from, const key_type& to) const {
    return sub_map(from, true, to, false);
  }

  range_type head_map(const key_type& to, bool inclusive = false) const {
    return detail::make_head_range(tree_, to, inclusive);
  }

  range_type tail_map(const key_type& from, bool inclusive = true) const {
    return detail::make_tail_range(tree_, from, inclusive);
  }
  //@}

  //@{ Persistent modifiers
  /**
   * @throws null_argument_error if `key` is null
   */
  sorted_map plus(const key_type& key, const value_type& value) const {
    detail::require_non_null(key, "key");
    auto* existing = find(key);
    if (existing != nullptr && detail::same_value(*existing, value))
      return *this;
    tree_type tree(*tree_);
    tree.insert_or_assign(key, value);
    return rebuild_(std::move(tree));
  }

  template <typename Range> sorted_map plus_all(const Range& items) const {
    tree_type tree(*tree_);
    bool changed = false;
    for (const auto& [key, value] : items) {
      detail::require_non_null(key, "key");
      auto position = tree.find(key);
      if (position != tree.end() && detail::same_value(position->second, value))
        continue;
      tree.insert_or_assign(key, value);
      changed = true;
    }
    return changed ? rebuild_(std::move(tree)) : *this;
  }

  sorted_map plus_all(std::initializer_list<item_type> items) const {
    return plus_all<std::initializer_list<item_type>>(items);
  }

  sorted_map minus(const key_type& key) const {
    detail::require_non_null(key, "key");
    if (!contains_key(key))
      return *this;
    tree_type tree(*tree_);
    tree.erase(key);
    return rebuild_(std::move(tree));
  }

  template <typename Range> sorted_map minus_all(const Range& keys) const {
    tree_type tree(*tree_);
    for (const auto& key : keys)
      tree.erase(key);
    return (tree.size() == size()) ? *this : rebuild_(std::move(tree));
  }

  sorted_map minus_all(std::initializer_list<key_type> keys) const {
    return minus_all<std::initializer_list<key_type>>(keys);
  }
  //@}

  //@{ Friends
  friend bool operator==(const sorted_map& lhs, const sorted_map& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    if (lhs.identical(rhs))
      return true;
    for (const auto& [key, value] : lhs) {
      auto* other = rhs.find(key);
      if (other == nullptr || !detail::same_value(value, *other))
        return false;
    }
    return true;
  }

  friend bool operator!=(const sorted_map& lhs, const sorted_map& rhs) { return !(lhs == rhs); }
  //@}

private:
  static const key_type* key_ptr_(const item_type* entry) {
    return (entry == nullptr) ? nullptr : &entry->first;
  }

  const item_type& first_entry_or_throw_(const char* what) const {
    if (empty())
      detail::throw_empty_error(what);
    return *tree_->begin();
  }

  const item_type& last_entry_or_throw_(const char* what) const {
    if (empty())
      detail::throw_empty_error(what);
    return *tree_->rbegin();
  }
};

} // namespace obsidian
