
#pragma once

#include "bits/_sorted-range.hpp"

#include "errors.hpp"
#include "nullable.hpp"

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <set>

namespace obsidian {

// -------------------------------------------------------------------------------------- sorted_set

/**
 * A persistent ordered set over a shared, read-only `std::set` snapshot.
 *
 * Reads and navigation are O(log n) on the snapshot. Every change copies the whole tree, O(n),
 * and leaves the old snapshot untouched; changes that would not alter the set return `*this`.
 */
template <typename ItemType, typename Compare = std::less<ItemType>> class sorted_set {
public:
  //@{
  using item_type = ItemType;
  using value_type = ItemType;
  using key_type = ItemType;
  using key_compare = Compare;
  using size_type = std::size_t;
  using const_reference = const item_type&;
  using tree_type = std::set<ItemType, Compare>;
  using const_iterator = typename tree_type::const_iterator;
  using iterator = const_iterator;
  using const_reverse_iterator = typename tree_type::const_reverse_iterator;
  using range_type = sorted_range<tree_type>;
  //@}

private:
  std::shared_ptr<const tree_type> tree_;

  static const item_type& key_of_(const item_type& item) { return item; }

  explicit sorted_set(std::shared_ptr<const tree_type> tree) : tree_{std::move(tree)} {}

  sorted_set rebuild_(tree_type&& tree) const {
    return sorted_set(std::make_shared<const tree_type>(std::move(tree)));
  }

public:
  //@{ Construction
  sorted_set() : sorted_set(Compare{}) {}

  /**
   * @throws illegal_state_error if `compare` is null
   */
  explicit sorted_set(const Compare& compare) {
    detail::require_comparator(compare);
    tree_ = std::make_shared<const tree_type>(compare);
  }

  /**
   * Adopts the contents of `tree`
   */
  explicit sorted_set(tree_type tree) {
    detail::require_comparator(tree.key_comp());
    detail::require_no_nulls(tree, "element");
    tree_ = std::make_shared<const tree_type>(std::move(tree));
  }

  template <typename InputIt>
  sorted_set(InputIt first, InputIt last, const Compare& compare = Compare{}) {
    detail::require_comparator(compare);
    tree_type tree(compare);
    for (; first != last; ++first)
      tree.insert(detail::require_non_null(*first, "element"));
    tree_ = std::make_shared<const tree_type>(std::move(tree));
  }

  sorted_set(std::initializer_list<item_type> ilist, const Compare& compare = Compare{})
      : sorted_set(std::begin(ilist), std::end(ilist), compare) {}
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

  bool contains(const item_type& item) const { return tree_->find(item) != tree_->end(); }
  std::size_t count(const item_type& item) const { return tree_->count(item); }

  const item_type* find(const item_type& item) const {
    auto position = tree_->find(item);
    return (position == tree_->end()) ? nullptr : &*position;
  }

  template <typename Function> void for_each(Function&& f) const {
    for (const auto& item : *tree_)
      f(item);
  }

  bool identical(const sorted_set& other) const noexcept { return tree_ == other.tree_; }
  //@}

  //@{ Navigation
  /**
   * @throws std::out_of_range when empty
   */
  const item_type& first() const {
    if (empty())
      detail::throw_empty_error("first");
    return *tree_->begin();
  }

  const item_type& last() const {
    if (empty())
      detail::throw_empty_error("last");
    return *tree_->rbegin();
  }

  /**
   * Greatest element strictly less than `item`, or nullptr
   */
  const item_type* lower(const item_type& item) const {
    return detail::lower_element(*tree_, item);
  }
  const item_type* floor(const item_type& item) const {
    return detail::floor_element(*tree_, item);
  }
  const item_type* ceiling(const item_type& item) const {
    return detail::ceiling_element(*tree_, item);
  }
  const item_type* higher(const item_type& item) const {
    return detail::higher_element(*tree_, item);
  }

  /**
   * The same elements in reverse order; O(n)
   */
  sorted_set<item_type, reversed_compare<Compare>> descending_set() const {
    using descending_type = sorted_set<item_type, reversed_compare<Compare>>;
    typename descending_type::tree_type tree(reversed_compare<Compare>{comparator()});
    for (auto position = rbegin(); position != rend(); ++position)
      tree.insert(tree.end(), *position);
    return descending_type(std::move(tree));
  }

  /**
   * @throws std::invalid_argument if `to` orders before `from`
   */
  range_type sub_set(const item_type& from, bool from_inclusive, const item_type& to,
                     bool to_inclusive) const {
    return detail::make_sorted_range(tree_, from, from_inclusive, to, to_inclusive, key_of_);
  }

  range_type sub_set(const item_type& from, const item_type& to) const {
    return sub_set(from, true, to, false);
  }

  range_type head_set(const item_type& to, bool inclusive = false) const {
    return detail::make_head_range(tree_, to, inclusive);
  }

  range_type tail_set(const item_type& from, bool inclusive = true) const {
    return detail::make_tail_range(tree_, from, inclusive);
  }
  //@}

  //@{ Persistent modifiers
  /**
   * @throws null_argument_error if `item` is null
   */
  sorted_set plus(const item_type& item) const {
    detail::require_non_null(item, "element");
    if (contains(item))
      return *this;
    tree_type tree(*tree_);
    tree.insert(item);
    return rebuild_(std::move(tree));
  }

  template <typename Range> sorted_set plus_all(const Range& items) const {
    detail::require_no_nulls(items, "element");
    tree_type tree(*tree_);
    for (const auto& item : items)
      tree.insert(item);
    return (tree.size() == size()) ? *this : rebuild_(std::move(tree));
  }

  sorted_set plus_all(std::initializer_list<item_type> items) const {
    return plus_all<std::initializer_list<item_type>>(items);
  }

  sorted_set minus(const item_type& item) const {
    detail::require_non_null(item, "element");
    if (!contains(item))
      return *this;
    tree_type tree(*tree_);
    tree.erase(item);
    return rebuild_(std::move(tree));
  }

  template <typename Range> sorted_set minus_all(const Range& items) const {
    tree_type tree(*tree_);
    for (const auto& item : items)
      tree.erase(item);
    return (tree.size() == size()) ? *this : rebuild_(std::move(tree));
  }

  sorted_set minus_all(std::initializer_list<item_type> items) const {
    return minus_all<std::initializer_list<item_type>>(items);
  }
  //@}

  //@{ Friends
  friend bool operator==(const sorted_set& lhs, const sorted_set& rhs) {
    if (lhs.size() != rhs.size())
      return false;
    return lhs.identical(rhs) || std::all_of(lhs.begin(), lhs.end(), [&rhs](const auto& item) {
             return rhs.contains(item);
           });
  }

  friend bool operator!=(const sorted_set& lhs, const sorted_set& rhs) { return !(lhs == rhs); }
  //@}
};

} // namespace obsidian
