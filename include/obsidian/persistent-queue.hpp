
#pragma once

#include "persistent-stack.hpp"

#include <algorithm>
#include <memory>

namespace obsidian {

// -------------------------------------------------------------------------------- persistent_queue

/**
 * A persistent FIFO queue made of two stacks: elements leave from `front_` and arrive on
 * `back_`. Whenever `front_` runs dry the back is reversed into a new front, so `plus` and
 * `minus()` are amortized O(1) and `peek` is O(1).
 */
template <typename T, bool IsThreadSafe = true> class persistent_queue {
private:
  using stack_type = persistent_stack<T, IsThreadSafe>;

  stack_type front_; //!< Head of the queue on top. Only empty when the queue is.
  stack_type back_;  //!< Most recent arrival on top

  static persistent_queue make_(stack_type front, stack_type back) {
    persistent_queue out;
    out.front_ = std::move(front);
    out.back_ = std::move(back);
    out.normalize_();
    return out;
  }

public:
  //@{
  using value_type = T;
  using size_type = std::size_t;
  using difference_type = std::ptrdiff_t;
  using const_reference = const T&;
  static constexpr bool is_thread_safe = IsThreadSafe;
  //@}

  /**
   * FIFO order: the front stack top to bottom, then the back stack bottom to top
   */
  class const_iterator {
  private:
    using stack_iterator = typename stack_type::const_iterator;
    using back_items_type = std::vector<const T*>;

    stack_iterator front_position_;
    stack_iterator front_end_;
    std::shared_ptr<const back_items_type> back_;
    std::size_t back_index_{0};

  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = const T&;
    using pointer = const T*;

    const_iterator() = default;
    const_iterator(stack_iterator front_position, stack_iterator front_end,
                   std::shared_ptr<const back_items_type> back, std::size_t back_index)
        : front_position_{front_position}, front_end_{front_end}, back_{std::move(back)},
          back_index_{back_index} {}

    reference operator*() const { return *operator->(); }
    pointer operator->() const {
      if (front_position_ != front_end_)
        return &*front_position_;
      return (*back_)[back_index_];
    }

    const_iterator& operator++() {
      if (front_position_ != front_end_)
        ++front_position_;
      else
        ++back_index_;
      return *this;
    }
    const_iterator operator++(int) {
      const_iterator tmp = *this;
      ++(*this);
      return tmp;
    }

    bool operator==(const const_iterator& other) const {
      return front_position_ == other.front_position_ && back_index_ == other.back_index_;
    }
    bool operator!=(const const_iterator& other) const { return !(*this == other); }
  };
  using iterator = const_iterator;

  //@{ Construction/Destruction
  persistent_queue() = default;

  /**
   * `*first` is the head of the queue
   */
  template <typename InputIt>
  persistent_queue(InputIt first, InputIt last) : front_(first, last) {}
  persistent_queue(std::initializer_list<T> ilist)
      : persistent_queue(std::begin(ilist), std::end(ilist)) {}
  //@}

  void swap(persistent_queue& other) noexcept {
    front_.swap(other.front_);
    back_.swap(other.back_);
  }

  //@{ Iterators
  const_iterator begin() const {
    auto back_items = std::make_shared<std::vector<const T*>>(back_items_());
    std::reverse(back_items->begin(), back_items->end());
    return const_iterator{front_.begin(), front_.end(), std::move(back_items), 0};
  }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const {
    return const_iterator{front_.end(), front_.end(), nullptr, back_.size()};
  }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return front_.empty(); }
  std::size_t size() const { return front_.size() + back_.size(); }
  static constexpr std::size_t max_size() { return stack_type::max_size(); }
  //@}

  //@{ Element access
  /**
   * @return The head of the queue, or nullptr when empty
   */
  const T* peek() const { return front_.peek(); }

  const T& front() const {
    if (empty())
      detail::throw_empty_error("front");
    return front_.front();
  }

  bool contains(const T& value) const { return front_.contains(value) || back_.contains(value); }

  /**
   * Calls `f` on every element in FIFO order
   */
  template <typename Function> void for_each(Function&& f) const {
    front_.for_each(f);
    const auto back_items = back_items_();
    for (auto item = back_items.crbegin(); item != back_items.crend(); ++item)
      f(**item);
  }

  bool identical(const persistent_queue& other) const noexcept {
    return front_.identical(other.front_) && back_.identical(other.back_);
  }
  //@}

  //@{ Persistent modifiers
  /**
   * Enqueues `value`, amortized O(1)
   * @throws null_argument_error if `value` is null
   */
  persistent_queue plus(const T& value) const {
    return make_(front_, back_.plus(value));
  }

  template <typename Range> persistent_queue plus_all(const Range& values) const {
    detail::require_no_nulls(values, "element");
    auto out = *this;
    for (const auto& value : values)
      out = out.plus(value);
    return out;
  }

  persistent_queue plus_all(std::initializer_list<T> values) const {
    return plus_all<std::initializer_list<T>>(values);
  }

  /**
   * Dequeues the head; `*this` when empty
   */
  persistent_queue minus() const {
    if (empty())
      return *this;
    return make_(front_.pop(), back_);
  }

  /**
   * Removes the first occurrence of `value` (in FIFO order); `*this` when absent
   */
  persistent_queue minus(const T& value) const {
    if (!contains(value))
      return *this;
    std::vector<T> items;
    items.reserve(size());
    bool removed = false;
    for (const auto& item : *this) {
      if (!removed && item == value)
        removed = true;
      else
        items.push_back(item);
    }
    return persistent_queue(items.begin(), items.end());
  }

  template <typename Range> persistent_queue minus_all(const Range& values) const {
    auto is_removed = [&values](const T& item) {
      return std::find(std::begin(values), std::end(values), item) != std::end(values);
    };
    if (std::none_of(begin(), end(), is_removed))
      return *this;
    std::vector<T> items;
    items.reserve(size());
    for (const auto& item : *this)
      if (!is_removed(item))
        items.push_back(item);
    return persistent_queue(items.begin(), items.end());
  }

  persistent_queue minus_all(std::initializer_list<T> values) const {
    return minus_all<std::initializer_list<T>>(values);
  }
  //@}

  //@{ Friends
  friend bool operator==(const persistent_queue& lhs, const persistent_queue& rhs) {
    return lhs.size() == rhs.size() &&
           (lhs.identical(rhs) || std::equal(lhs.begin(), lhs.end(), rhs.begin()));
  }

  friend bool operator!=(const persistent_queue& lhs, const persistent_queue& rhs) {
    return !(lhs == rhs);
  }

  friend void swap(persistent_queue& lhs, persistent_queue& rhs) noexcept { lhs.swap(rhs); }
  //@}

private:
  // Newest first
  std::vector<const T*> back_items_() const {
    std::vector<const T*> items;
    items.reserve(back_.size());
    back_.for_each([&items](const T& item) { items.push_back(&item); });
    return items;
  }

  // Restores "empty front means empty queue"
  void normalize_() {
    if (!front_.empty() || back_.empty())
      return;
    for (const auto* item : back_items_()) // the oldest arrival ends up on top
      front_ = front_.plus(*item);
    back_ = stack_type{};
  }
};

} // namespace obsidian
