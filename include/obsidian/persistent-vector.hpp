
#pragma once

#include "bits/_node-data.hpp"
#include "bits/_base-node-ops.hpp"
#include "bits/_chunk-ops.hpp"

#include "errors.hpp"
#include "nullable.hpp"

#include <algorithm>
#include <compare>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <vector>

namespace obsidian {

// ------------------------------------------------------------------------------- persistent_vector

/**
 * A persistent random-access sequence stored in 32-element chunks.
 *
 * `get` is O(1). Appending copies only the last (tail) chunk, and copies the table of chunk
 * pointers once per 32 appends, so `plus` is amortized O(1). `with` copies one chunk (and the
 * table, unless the index is in the tail). Positional insert/remove and `sub_list` rebuild the
 * whole vector, O(n).
 *
 * Elements must not be null (see `nullable_traits`).
 */
template <typename T, bool IsThreadSafe = true> class persistent_vector {
private:
  using Ops = detail::ChunkOps<T, IsThreadSafe>;
  using Table = typename Ops::Table;
  using Chunk = typename Ops::Chunk;
  using node_ptr_type = typename Ops::node_ptr_type;
  using node_const_ptr_type = typename Ops::node_const_ptr_type;

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
    const persistent_vector* vector_{nullptr};
    std::size_t index_{0};

  public:
    using iterator_category = std::random_access_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using reference = const T&;
    using pointer = const T*;

    const_iterator() = default;
    const_iterator(const persistent_vector* vector, std::size_t index)
        : vector_{vector}, index_{index} {}

    reference operator*() const { return vector_->get_unchecked_(index_); }
    pointer operator->() const { return &vector_->get_unchecked_(index_); }
    reference operator[](difference_type n) const { return *(*this + n); }

    const_iterator& operator++() {
      ++index_;
      return *this;
    }
    const_iterator& operator--() {
      --index_;
      return *this;
    }
    const_iterator operator++(int) { return const_iterator{vector_, index_++}; }
    const_iterator operator--(int) { return const_iterator{vector_, index_--}; }

    const_iterator& operator+=(difference_type n) {
      index_ = static_cast<std::size_t>(static_cast<difference_type>(index_) + n);
      return *this;
    }
    const_iterator& operator-=(difference_type n) { return *this += -n; }

    friend const_iterator operator+(const_iterator position, difference_type n) {
      return position += n;
    }
    friend const_iterator operator+(difference_type n, const_iterator position) {
      return position += n;
    }
    friend const_iterator operator-(const_iterator position, difference_type n) {
      return position -= n;
    }
    friend difference_type operator-(const const_iterator& lhs, const const_iterator& rhs) {
      return static_cast<difference_type>(lhs.index_) - static_cast<difference_type>(rhs.index_);
    }

    bool operator==(const const_iterator& other) const {
      return vector_ == other.vector_ && index_ == other.index_;
    }
    std::strong_ordering operator<=>(const const_iterator& other) const {
      return index_ <=> other.index_;
    }
  };
  using iterator = const_iterator;

private:
  node_ptr_type table_{nullptr}; //!< Full chunks; null while size() <= 32
  node_ptr_type tail_{nullptr};  //!< Last chunk, 1 to 32 items; null only when empty
  std::size_t size_{0};

  // Adopts the references to `table` and `tail`
  persistent_vector(node_ptr_type table, node_ptr_type tail, std::size_t size)
      : table_{table}, tail_{tail}, size_{size} {}

public:
  //@{ Construction/Destruction
  persistent_vector() = default;
  persistent_vector(const persistent_vector& other) { *this = other; }
  persistent_vector(persistent_vector&& other) noexcept { swap(other); }
  ~persistent_vector() {
    Ops::dec_ref(table_);
    Ops::dec_ref(tail_);
  }

  template <typename InputIt> persistent_vector(InputIt first, InputIt last) {
    std::vector<T> items(first, last);
    detail::require_no_nulls(items, "element");
    *this = from_items_(items.begin(), items.size());
  }
  persistent_vector(std::initializer_list<T> ilist)
      : persistent_vector(std::begin(ilist), std::end(ilist)) {}
  //@}

  //@{ Assignment
  persistent_vector& operator=(const persistent_vector& other) {
    Ops::add_ref(other.table_);
    Ops::add_ref(other.tail_);
    Ops::dec_ref(table_);
    Ops::dec_ref(tail_);
    table_ = other.table_;
    tail_ = other.tail_;
    size_ = other.size_;
    return *this;
  }

  persistent_vector& operator=(persistent_vector&& other) noexcept {
    swap(other);
    return *this;
  }

  void swap(persistent_vector& other) noexcept {
    std::swap(table_, other.table_);
    std::swap(tail_, other.tail_);
    std::swap(size_, other.size_);
  }
  //@}

  //@{ Iterators
  const_iterator begin() const { return const_iterator{this, 0}; }
  const_iterator cbegin() const { return begin(); }
  const_iterator end() const { return const_iterator{this, size_}; }
  const_iterator cend() const { return end(); }
  //@}

  //@{ Capacity
  bool empty() const { return size_ == 0; }
  std::size_t size() const { return size_; }
  static constexpr std::size_t max_size() { return std::numeric_limits<std::size_t>::max(); }
  //@}

  //@{ Element access
  /**
   * O(1)
   * @throws std::out_of_range unless `index < size()`
   */
  const T& get(std::size_t index) const {
    detail::check_index(index, size_);
    return get_unchecked_(index);
  }

  const T& operator[](std::size_t index) const { return get(index); }

  const T& front() const {
    if (empty())
      detail::throw_empty_error("front");
    return get_unchecked_(0);
  }

  const T& back() const {
    if (empty())
      detail::throw_empty_error("back");
    return get_unchecked_(size_ - 1);
  }

  std::size_t index_of(const T& value) const {
    auto position = std::find(begin(), end(), value);
    return position == end() ? npos : static_cast<std::size_t>(position - begin());
  }

  std::size_t last_index_of(const T& value) const {
    for (auto index = size_; index > 0; --index)
      if (get_unchecked_(index - 1) == value)
        return index - 1;
    return npos;
  }

  bool contains(const T& value) const { return index_of(value) != npos; }

  template <typename Function> void for_each(Function&& f) const {
    const auto chunks = Ops::size(table_);
    for (auto i = 0u; i < chunks; ++i) {
      auto* chunk = Ops::chunk_at(table_, i);
      for (auto* item = Chunk::begin(chunk); item != Chunk::end(chunk); ++item)
        f(*item);
    }
    if (tail_ != nullptr)
      for (auto* item = Chunk::begin(tail_); item != Chunk::end(tail_); ++item)
        f(*item);
  }

  bool identical(const persistent_vector& other) const noexcept {
    return table_ == other.table_ && tail_ == other.tail_;
  }
  //@}

  //@{ Persistent modifiers
  /**
   * Appends `value`, amortized O(1)
   * @throws null_argument_error if `value` is null
   */
  persistent_vector plus(const T& value) const {
    detail::require_non_null(value, "element");
    if (tail_ != nullptr && Chunk::size(tail_) < Ops::ChunkSize) { // room in the tail
      auto* new_tail = Chunk::copy_append(tail_, value, detail::NodeType::Leaf);
      Ops::add_ref(table_);
      return persistent_vector{table_, new_tail, size_ + 1};
    }

    auto* new_tail = Chunk::make(detail::NodeType::Leaf, 0, value);
    if (tail_ == nullptr)
      return persistent_vector{nullptr, new_tail, 1};

    // The full tail moves into the table
    node_ptr_type new_table = nullptr;
    try {
      new_table = Table::copy_append(table_, tail_);
    } catch (...) {
      Ops::dec_ref(new_tail);
      throw;
    }
    Ops::add_ref(tail_);
    return persistent_vector{new_table, new_tail, size_ + 1};
  }

  template <typename Range> persistent_vector plus_all(const Range& values) const {
    detail::require_no_nulls(values, "element");
    auto out = *this;
    for (const auto& value : values)
      out = out.plus(value);
    return out;
  }

  persistent_vector plus_all(std::initializer_list<T> values) const {
    return plus_all<std::initializer_list<T>>(values);
  }

  /**
   * Replaces the element at `index`, O(1)
   * @throws std::out_of_range unless `index < size()`
   */
  persistent_vector with(std::size_t index, const T& value) const {
    detail::require_non_null(value, "element");
    detail::check_index(index, size_);
    const auto offset = tail_offset_();
    if (index >= offset) {
      auto* new_tail = Chunk::duplicate_with_overwrite(tail_, index - offset, value);
      Ops::add_ref(table_);
      return persistent_vector{table_, new_tail, size_};
    }

    const auto chunk_index = Ops::chunk_index(index);
    auto* chunk = Ops::chunk_at(table_, chunk_index);
    auto* new_chunk = Chunk::duplicate_with_overwrite(chunk, Ops::chunk_offset(index), value);
    auto* new_table = Ops::replace_chunk(table_, chunk_index, new_chunk);
    Ops::add_ref(tail_);
    return persistent_vector{new_table, tail_, size_};
  }

  /**
   * Inserts `value` before `index`; `index == size()` appends
   * @throws std::out_of_range unless `index <= size()`
   */
  persistent_vector plus_at(std::size_t index, const T& value) const {
    detail::require_non_null(value, "element");
    detail::check_position_index(index, size_);
    if (index == size_)
      return plus(value);
    const T* inserted = &value;
    return splice_(index, 0, inserted, inserted + 1);
  }

  template <typename Range>
  persistent_vector plus_all_at(std::size_t index, const Range& values) const {
    detail::require_no_nulls(values, "element");
    detail::check_position_index(index, size_);
    if (index == size_)
      return plus_all(values);
    return splice_(index, 0, std::begin(values), std::end(values));
  }

  /**
   * Removes the element at `index`
   * @throws std::out_of_range unless `index < size()`
   */
  persistent_vector minus_at(std::size_t index) const {
    detail::check_index(index, size_);
    const T* none = nullptr;
    return splice_(index, 1, none, none);
  }

  /**
   * Removes the first element equal to `value`; `*this` if there is none
   */
  persistent_vector minus(const T& value) const {
    const auto index = index_of(value);
    return (index == npos) ? *this : minus_at(index);
  }

  /**
   * Removes every element equal to any of `values`; `*this` if there are none
   */
  template <typename Range> persistent_vector minus_all(const Range& values) const {
    auto is_removed = [&values](const T& item) {
      return std::find(std::begin(values), std::end(values), item) != std::end(values);
    };
    if (std::none_of(begin(), end(), is_removed))
      return *this;
    std::vector<T> items;
    items.reserve(size_);
    std::copy_if(begin(), end(), std::back_inserter(items),
                 [&is_removed](const T& item) { return !is_removed(item); });
    return from_items_(items.begin(), items.size());
  }

  persistent_vector minus_all(std::initializer_list<T> values) const {
    return minus_all<std::initializer_list<T>>(values);
  }

  /**
   * Elements `[from, to)`
   * @throws std::out_of_range unless `from <= to <= size()`
   */
  persistent_vector sub_list(std::size_t from, std::size_t to) const {
    detail::check_from_to_index(from, to, size_);
    if (from == 0 && to == size_)
      return *this;
    return from_items_(begin() + static_cast<difference_type>(from), to - from);
  }
  //@}

  //@{ Friends
  friend bool operator==(const persistent_vector& lhs, const persistent_vector& rhs) {
    return lhs.size() == rhs.size() &&
           (lhs.identical(rhs) || std::equal(lhs.begin(), lhs.end(), rhs.begin()));
  }

  friend bool operator!=(const persistent_vector& lhs, const persistent_vector& rhs) {
    return !(lhs == rhs);
  }

  friend void swap(persistent_vector& lhs, persistent_vector& rhs) noexcept { lhs.swap(rhs); }
  //@}

private:
  std::size_t tail_offset_() const { return size_ - Ops::size(tail_); }

  const T& get_unchecked_(std::size_t index) const {
    assert(index < size_);
    const auto offset = tail_offset_();
    if (index >= offset)
      return *Chunk::dense_ptr_at(tail_, static_cast<uint32_t>(index - offset));
    auto* chunk = Ops::chunk_at(table_, Ops::chunk_index(index));
    return *Chunk::dense_ptr_at(chunk, static_cast<uint32_t>(Ops::chunk_offset(index)));
  }

  // The first `index` elements, then `[first, last)`, then everything from `index + skip` on
  template <typename InputIt>
  persistent_vector splice_(std::size_t index, std::size_t skip, InputIt first,
                            InputIt last) const {
    std::vector<T> items;
    items.reserve(size_ + 1);
    std::copy(begin(), begin() + static_cast<difference_type>(index), std::back_inserter(items));
    std::copy(first, last, std::back_inserter(items));
    std::copy(begin() + static_cast<difference_type>(index + skip), end(),
              std::back_inserter(items));
    return from_items_(items.begin(), items.size());
  }

  /**
   * A vector holding copies of `[first, first + count)`, chunked from the front
   */
  template <typename RandomIt>
  static persistent_vector from_items_(RandomIt first, std::size_t count) {
    if (count == 0)
      return persistent_vector{};

    const auto tail_size = ((count - 1) & Ops::ChunkMask) + 1; // 1..32
    const auto full_chunks = (count - tail_size) >> Ops::ChunkShift;
    auto chunk_start = [first](std::size_t chunk) {
      return first + static_cast<difference_type>(chunk * Ops::ChunkSize);
    };

    std::vector<node_ptr_type> chunks;
    chunks.reserve(full_chunks + 1);
    node_ptr_type table = nullptr;
    try {
      for (std::size_t i = 0; i < full_chunks; ++i)
        chunks.push_back(Chunk::make_from(detail::NodeType::Leaf, 0, chunk_start(i),
                                          static_cast<uint32_t>(Ops::ChunkSize)));
      chunks.push_back(Chunk::make_from(detail::NodeType::Leaf, 0, chunk_start(full_chunks),
                                        static_cast<uint32_t>(tail_size)));
      if (full_chunks > 0) {
        const auto table_size = static_cast<uint32_t>(full_chunks);
        table = Table::make_uninitialized(detail::NodeType::Branch, table_size, table_size);
      }
    } catch (...) {
      for (auto* chunk : chunks)
        Ops::dec_ref(chunk);
      throw;
    }

    if (table != nullptr)
      std::copy(chunks.begin(), chunks.begin() + full_chunks, Table::begin(table));
    return persistent_vector{table, chunks.back(), count};
  }
};

} // namespace obsidian
