
#pragma once

#include "persistent-map.hpp"

namespace obsidian {

namespace detail {
  /**
   * Value stored against every element of a `persistent_set`. All instances are equal, so
   * re-adding an element is always a no-op on the trie.
   */
  struct Present {
    friend constexpr bool operator==(Present, Present) noexcept { return true; }
  };
} // namespace detail

// ---------------------------------------------------------------------------------- persistent_set

/**
 * A persistent hash set, implemented as a `persistent_map` to a sentinel value.
 *
 * Every modifier returns `*this` when the underlying trie did not change, so
 * `set.plus(x).identical(set)` holds whenever `x` was already present.
 */
template <typename ItemType,                           // Type of item to store
          typename Hash = std::hash<ItemType>,         // Hash function for item
          typename KeyEqual = std::equal_to<ItemType>, // Equality comparision for Item
          bool IsThreadSafe = true                     // True if Set is threadsafe
          >
class persistent_set {
private:
  using map_type = persistent_map<ItemType, detail::Present, Hash, KeyEqual, IsThreadSafe>;
  map_type map_;

  explicit persistent_set(map_type map) : map_{std::move(map)} {}

  persistent_set rewrap_(map_type map) const {
    return map.identical(map_) ? *this : persistent_set{std::move(map)};
  }

public:
  using item_type = ItemType;
  using value_type = ItemType;
  using size_type = typename map_type::size_type;
  using hash_type = typename map_type::hash_type;
  using hasher = typename map_type::hasher;
  using key_equal = typename map_type::key_equal;
  using const_reference = const item_type&;
  static constexpr bool is_thread_safe = IsThreadSafe;

  /**
   * Projects the keys out of the map's iterator
   */
  class const_iterator {
  private:
    typename map_type::const_iterator position_;

  public:
    using iterator_category = std::bidirectional_iterator_tag;
    using value_type = ItemType;
    using difference_type = std::ptrdiff_t;
    using reference = const ItemType&;
    using pointer = const ItemType*;

    const_iterator() = default;
    explicit const_iterator(typename map_type::const_iterator position) : position_{position} {}

    reference operator*() const { return position_->first; }
    pointer operator->() const { return &position_->first; }

    const_iterator& operator++() {
      ++position_;
      return *this;
    }
    const_iterator& operator--() {
      --position_;
      return *this;
    }
    const_iterator operator++(int) { return const_iterator{position_++}; }
    const_iterator operator--(int) { return const_iterator{position_--}; }

    bool operator==(const const_iterator& other) const { return position_ == other.position_; }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }
  };
  using iterator = const_iterator;

  //@{ Construction/Destruction
  persistent_set() = default;
  persistent_set(const persistent_set& other) = default;
  persistent_set(persistent_set&& other) noexcept = default;
  ~persistent_set() = default;

  template <typename InputIt> persistent_set(InputIt first, InputIt last) {
    while (first != last)
      *this = plus(*first++);
  }
  persistent_set(std::initializer_list<item_type> ilist)
      : persistent_set(std::begin(ilist), std::end(ilist)) {}
  //@}

  //@{ Assignment
  persistent_set& operator=(const persistent_set& other) = default;
  persistent_set& operator=(persistent_set&& other) noexcept = default;
  void swap(persistent_set& other) noexcept { map_.swap(other.map_); }
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{map_.begin()}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{map_.end()}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return map_.empty(); }
  std::size_t size() const { return map_.size(); }
  static constexpr std::size_t max_size() { return map_type::max_size(); }
  //@}

  //@{ Lookup
  bool contains(const item_type& item) const { return map_.contains_key(item); }
  std::size_t count(const item_type& item) const { return map_.count(item); }

  /**
   * @return The stored element equal to `item`, or nullptr
   */
  const item_type* find(const item_type& item) const {
    auto* entry = map_.find_entry(item);
    return entry != nullptr ? &entry->first : nullptr;
  }

  template <typename Function> void for_each(Function&& f) const {
    map_.for_each([&f](const item_type& item, detail::Present) { f(item); });
  }

  bool identical(const persistent_set& other) const noexcept { return map_.identical(other.map_); }
  //@}

  //@{ Persistent modifiers
  /**
   * @throws null_argument_error if `item` is null
   */
  persistent_set plus(const item_type& item) const {
    detail::require_non_null(item, "element");
    return rewrap_(map_.plus(item, detail::Present{}));
  }

  template <typename Range> persistent_set plus_all(const Range& items) const {
    auto out = map_;
    for (const auto& item : items) {
      detail::require_non_null(item, "element");
      out = out.plus(item, detail::Present{});
    }
    return rewrap_(std::move(out));
  }

  persistent_set plus_all(std::initializer_list<item_type> items) const {
    return plus_all<std::initializer_list<item_type>>(items);
  }

  persistent_set minus(const item_type& item) const { return rewrap_(map_.minus(item)); }

  template <typename Range> persistent_set minus_all(const Range& items) const {
    return rewrap_(map_.minus_all(items));
  }

  persistent_set minus_all(std::initializer_list<item_type> items) const {
    return minus_all<std::initializer_list<item_type>>(items);
  }
  //@}

  //@{ Observers
  static constexpr hasher hash_function() { return map_type::hash_function(); }
  static constexpr key_equal key_eq() { return map_type::key_eq(); }
  //@}

  //@{ Friends
  friend bool operator==(const persistent_set& lhs, const persistent_set& rhs) {
    return lhs.map_ == rhs.map_;
  }

  friend bool operator!=(const persistent_set& lhs, const persistent_set& rhs) {
    return !(lhs == rhs);
  }

  friend void swap(persistent_set& lhs, persistent_set& rhs) noexcept { lhs.swap(rhs); }
  //@}
};

} // namespace obsidian
