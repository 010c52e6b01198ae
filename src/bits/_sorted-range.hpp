
#pragma once

#include "obsidian/errors.hpp"
#include "obsidian/nullable.hpp"

#include <concepts>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

namespace obsidian {

/**
 * `Compare` with its arguments swapped: the ordering of descending views.
 */
template <typename Compare> struct reversed_compare {
  Compare compare{};

  template <typename L, typename R> bool operator()(const L& lhs, const R& rhs) const {
    return compare(rhs, lhs);
  }
};

// ------------------------------------------------------------------------------------ sorted_range

/**
 * A read-only window `[first, last)` onto a tree snapshot. Keeps the snapshot alive, so the
 * range outlives the map or set it came from.
 */
template <typename Tree> class sorted_range {
public:
  using tree_type = Tree;
  using value_type = typename Tree::value_type;
  using size_type = std::size_t;
  using const_reference = const value_type&;
  using const_iterator = typename Tree::const_iterator;
  using iterator = const_iterator;
  using const_reverse_iterator = std::reverse_iterator<const_iterator>;

private:
  std::shared_ptr<const Tree> tree_;
  const_iterator first_;
  const_iterator last_;

public:
  sorted_range(std::shared_ptr<const Tree> tree, const_iterator first, const_iterator last)
      : tree_{std::move(tree)}, first_{first}, last_{last} {}

  const_iterator begin() const { return first_; }
  const_iterator end() const { return last_; }
  const_reverse_iterator rbegin() const { return const_reverse_iterator{last_}; }
  const_reverse_iterator rend() const { return const_reverse_iterator{first_}; }

  bool empty() const { return first_ == last_; }
  std::size_t size() const { return static_cast<std::size_t>(std::distance(first_, last_)); }

  const value_type& front() const {
    if (empty())
      detail::throw_empty_error("front");
    return *first_;
  }

  const value_type& back() const {
    if (empty())
      detail::throw_empty_error("back");
    return *std::prev(last_);
  }
};

namespace detail {

  template <typename T> constexpr bool same_value(const T& lhs, const T& rhs) {
    if constexpr (std::equality_comparable<T>) {
      return lhs == rhs;
    } else {
      return false;
    }
  }

  /**
   * @throws illegal_state_error if `compare` is a null function (pointer)
   */
  template <typename Compare> void require_comparator(const Compare& compare) {
    if constexpr (nullable_traits<Compare>::is_nullable) {
      if (is_null(compare))
        throw illegal_state_error{"null comparator"};
    }
  }

  /**
   * Bounds of the keys between `from` and `to` in `tree`, as a `sorted_range`.
   * `key_of` projects a tree element onto its key.
   *
   * @throws std::invalid_argument if `to` orders before `from`
   */
  template <typename Tree, typename Key, typename KeyOf>
  sorted_range<Tree> make_sorted_range(const std::shared_ptr<const Tree>& tree, const Key& from,
                                       bool from_inclusive, const Key& to, bool to_inclusive,
                                       KeyOf&& key_of) {
    const auto compare = tree->key_comp();
    if (compare(to, from))
      throw std::invalid_argument{"range bounds are out of order: from > to"};

    auto first = from_inclusive ? tree->lower_bound(from) : tree->upper_bound(from);
    auto last = to_inclusive ? tree->upper_bound(to) : tree->lower_bound(to);

    // `from == to` with an exclusive bound can leave `last` before `first`
    const bool inverted = (first == tree->end()) ? (last != tree->end())
                          : (last != tree->end()) && compare(key_of(*last), key_of(*first));
    if (inverted)
      first = last;
    return sorted_range<Tree>{tree, first, last};
  }

  template <typename Tree>
  sorted_range<Tree> make_head_range(const std::shared_ptr<const Tree>& tree,
                                     const typename Tree::key_type& to, bool inclusive) {
    auto last = inclusive ? tree->upper_bound(to) : tree->lower_bound(to);
    return sorted_range<Tree>{tree, tree->begin(), last};
  }

  template <typename Tree>
  sorted_range<Tree> make_tail_range(const std::shared_ptr<const Tree>& tree,
                                     const typename Tree::key_type& from, bool inclusive) {
    auto first = inclusive ? tree->lower_bound(from) : tree->upper_bound(from);
    return sorted_range<Tree>{tree, first, tree->end()};
  }

  //@{ Navigation: nullptr when there is no such element
  template <typename Tree>
  const typename Tree::value_type* lower_element(const Tree& tree,
                                                 const typename Tree::key_type& key) {
    auto position = tree.lower_bound(key);
    return (position == tree.begin()) ? nullptr : &*std::prev(position);
  }

  template <typename Tree>
  const typename Tree::value_type* floor_element(const Tree& tree,
                                                 const typename Tree::key_type& key) {
    auto position = tree.upper_bound(key);
    return (position == tree.begin()) ? nullptr : &*std::prev(position);
  }

  template <typename Tree>
  const typename Tree::value_type* ceiling_element(const Tree& tree,
                                                   const typename Tree::key_type& key) {
    auto position = tree.lower_bound(key);
    return (position == tree.end()) ? nullptr : &*position;
  }

  template <typename Tree>
  const typename Tree::value_type* higher_element(const Tree& tree,
                                                  const typename Tree::key_type& key) {
    auto position = tree.upper_bound(key);
    return (position == tree.end()) ? nullptr : &*position;
  }
  //@}

} // namespace detail

} // namespace obsidian
