
#pragma once

#include "bits/_cons-ops.hpp"

#include "errors.hpp"
#include "nullable.hpp"

#include <algorithm>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <vector>

namespace obsidian {

// -------------------------------------------------------------------------------- persistent_stack

/**
 * A persistent LIFO stack (cons list). Index 0 is the top.
 *
 * `plus` and `pop` are O(1) and share everything below the top. Indexed operations copy the
 * cells above the index and relink them onto the unchanged suffix.
 */
template <typename T, bool IsThreadSafe = true> class persistent_stack {
private:
  using Ops = detail::ConsOps<T, IsThreadSafe>;
  using cell_ptr_type = typename Ops::cell_ptr_type;

public:
  //@{
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using const_reference = const T&;
  static constexpr size_type npos{std::numeric_limits<size_type>::max()};
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

  class const_iterator {
  private:
    cell_ptr_type cell_{nullptr};

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = const T&;
    using pointer = const T*;

    const_iterator() = default;
    explicit const_iterator(cell_ptr_type cell) : cell_{cell} {}

    reference operator*() const { return cell_->head_; }
    pointer operator->() const { return &cell_->head_; }

    const_iterator& operator++() {
      cell_ = cell_->tail_;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const { return cell_ == other.cell_; }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }
  };
  using iterator = const_iterator;

private:
  cell_ptr_type head_{nullptr};

  // Adopts the reference to `head`
  explicit persistent_stack(cell_ptr_type head) : head_{head} {}

public:
  //@{ Construction/Destruction
  persistent_stack() = default;
  persistent_stack(const persistent_stack& other) { *this = other; }
  persistent_stack(persistent_stack&& other) noexcept { swap(other); }
  ~persistent_stack() { Ops::dec_ref(head_); }

  /**
   * `*first` ends up on top
   */
  template <typename InputIt> persistent_stack(InputIt first, InputIt last) {
    std::vector<T> items(first, last);
    detail::require_no_nulls(items, "element");
    head_ = Ops::push_all(items.begin(), items.end(), nullptr, Ops::identity);
  }
  persistent_stack(std::initializer_list<T> ilist)
      : persistent_stack(std::begin(ilist), std::end(ilist)) {}
  //@}

  //@{ Assignment
  persistent_stack& operator=(const persistent_stack& other) {
    Ops::add_ref(other.head_);
    Ops::dec_ref(head_);
    head_ = other.head_;
    return *this;
  }

  persistent_stack& operator=(persistent_stack&& other) noexcept {
    swap(other);
    return *this;
  }

  void swap(persistent_stack& other) noexcept { std::swap(head_, other.head_); }
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{head_}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return head_ == nullptr; }
  std::size_t size() const { return Ops::size(head_); }
  static constexpr std::size_t max_size() { return std::numeric_limits<std::size_t>::max(); }
  //@}

  //@{ Element access
  /**
   * @return The top element, or nullptr when empty
   */
  const T* peek() const { return empty() ? nullptr : &head_->head_; }

  const T& front() const {
    if (empty())
      detail::throw_empty_error("front");
    return head_->head_;
  }

  /**
   * O(index)
   * @throws std::out_of_range unless `index < size()`
   */
  const T& get(std::size_t index) const {
    detail::check_index(index, size());
    return Ops::drop(head_, index)->head_;
  }

  std::size_t index_of(const T& value) const {
    std::size_t index = 0;
    for (auto* cell = head_; cell != nullptr; cell = cell->tail_, ++index)
      if (cell->head_ == value)
        return index;
    return npos;
  }

  bool contains(const T& value) const { return index_of(value) != npos; }

  template <typename Function> void for_each(Function&& f) const {
    for (auto* cell = head_; cell != nullptr; cell = cell->tail_)
      f(cell->head_);
  }

  bool identical(const persistent_stack& other) const noexcept { return head_ == other.head_; }
  //@}

  //@{ Persistent modifiers
  /**
   * Pushes `value`, O(1)
   * @throws null_argument_error if `value` is null
   */
  persistent_stack plus(const T& value) const {
    detail::require_non_null(value, "element");
    return persistent_stack{Ops::cons(value, head_)};
  }

  /**
   * Pushes every element of `values`, so that the stack reads in the same order as the range
   */
  template <typename Range> persistent_stack plus_all(const Range& values) const {
    return plus_all_at(0, values);
  }

  persistent_stack plus_all(std::initializer_list<T> values) const {
    return plus_all<std::initializer_list<T>>(values);
  }

  /**
   * The stack below the top, sharing every cell; `*this` when empty
   */
  persistent_stack pop() const {
    if (empty())
      return *this;
    Ops::add_ref(head_->tail_);
    return persistent_stack{head_->tail_};
  }

  /**
   * @throws std::out_of_range unless `index < size()`
   */
  persistent_stack with(std::size_t index, const T& value) const {
    detail::require_non_null(value, "element");
    detail::check_index(index, size());
    return splice_(index, 1, &value, &value + 1);
  }

  /**
   * Inserts `value` at `index`, which may equal `size()`
   */
  persistent_stack plus_at(std::size_t index, const T& value) const {
    detail::require_non_null(value, "element");
    detail::check_position_index(index, size());
    return splice_(index, 0, &value, &value + 1);
  }

  template <typename Range>
  persistent_stack plus_all_at(std::size_t index, const Range& values) const {
    detail::check_position_index(index, size());
    std::vector<T> items(std::begin(values), std::end(values));
    detail::require_no_nulls(items, "element");
    if (items.empty())
      return *this;
    return splice_(index, 0, items.cbegin(), items.cend());
  }

  persistent_stack minus_at(std::size_t index) const {
    detail::check_index(index, size());
    if (index == 0)
      return pop();
    const T* none = nullptr;
    return splice_(index, 1, none, none);
  }

  /**
   * Removes the first occurrence of `value`; `*this` when absent
   */
  persistent_stack minus(const T& value) const {
    const auto index = index_of(value);
    return (index == npos) ? *this : minus_at(index);
  }

  /**
   * Removes every element equal to one of `values`. Everything below the last removed
   * element is shared.
   */
  template <typename Range> persistent_stack minus_all(const Range& values) const {
    std::vector<const T*> kept;
    std::size_t kept_above_suffix = 0;
    cell_ptr_type suffix = nullptr;
    bool removed = false;

    for (auto* cell = head_; cell != nullptr; cell = cell->tail_) {
      if (std::find(std::begin(values), std::end(values), cell->head_) != std::end(values)) {
        removed = true;
        kept_above_suffix = kept.size();
        suffix = cell->tail_;
      } else {
        kept.push_back(&cell->head_);
      }
    }
    if (!removed)
      return *this;

    Ops::add_ref(suffix);
    const auto last = kept.cbegin() + static_cast<difference_type>(kept_above_suffix);
    return persistent_stack{Ops::push_all(kept.cbegin(), last, suffix, Ops::deref)};
  }

  persistent_stack minus_all(std::initializer_list<T> values) const {
    return minus_all<std::initializer_list<T>>(values);
  }

  /**
   * Elements `[from, to)`. When `to == size()` the result is the shared suffix.
   * @throws std::out_of_range unless `from <= to <= size()`
   */
  persistent_stack sub_list(std::size_t from, std::size_t to) const {
    detail::check_from_to_index(from, to, size());
    auto* start = Ops::drop(head_, from);
    if (to == size()) {
      Ops::add_ref(start);
      return persistent_stack{start};
    }
    const auto items = Ops::prefix(start, to - from);
    return persistent_stack{Ops::push_all(items.cbegin(), items.cend(), nullptr, Ops::deref)};
  }

  persistent_stack sub_list(std::size_t from) const { return sub_list(from, size()); }
  //@}

  //@{ Friends
  friend bool operator==(const persistent_stack& lhs, const persistent_stack& rhs) {
    return lhs.size() == rhs.size() &&
           (lhs.identical(rhs) || std::equal(lhs.begin(), lhs.end(), rhs.begin()));
  }

  friend bool operator!=(const persistent_stack& lhs, const persistent_stack& rhs) {
    return !(lhs == rhs);
  }

  friend void swap(persistent_stack& lhs, persistent_stack& rhs) noexcept { lhs.swap(rhs); }
  //@}

private:
  // The first `index` elements, then `[first, last)`, then everything from `index + skip` on
  template <typename BidirIt>
  persistent_stack splice_(std::size_t index, std::size_t skip, BidirIt first,
                           BidirIt last) const {
    const auto above = Ops::prefix(head_, index);
    auto* suffix = Ops::drop(head_, index + skip);
    Ops::add_ref(suffix);
    auto* top = Ops::push_all(first, last, suffix, Ops::identity);
    return persistent_stack{Ops::push_all(above.cbegin(), above.cend(), top, Ops::deref)};
  }
};

} // namespace obsidian
