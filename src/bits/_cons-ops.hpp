
#pragma once

#include "_node-data.hpp"

#include <vector>

namespace obsidian::detail {

// ----------------------------------------------------------------------------------------- ConsOps

/**
 * Immutable singly linked cells, shared between stacks (and the two halves of a queue).
 *
 * Every cell owns one reference to its tail. A null cell is the empty list.
 */
template <typename T, bool IsThreadSafe = true> struct ConsOps {
  using item_type = T;
  using node_type = NodeData<IsThreadSafe>;
  using ref_count_type = typename node_type::ref_count_type;

  struct Cell {
    node_type header_;
    const Cell* tail_;
    std::size_t size_; // of the list starting here
    item_type head_;

    // Adopts the reference to `tail`
    Cell(const item_type& head, const Cell* tail)
        : header_{NodeType::Leaf, 0}, tail_{tail}, size_{(tail == nullptr) ? 1 : tail->size_ + 1},
          head_{head} {}
  };

  using cell_ptr_type = const Cell*;

  static constexpr std::size_t CellStorageSize{round_up(sizeof(Cell), alignof(Cell))};

  //@{ Allocation
  /**
   * Constructs a cell in its own aligned block. Adopts the reference to `tail`, unless the
   * copy of `head` throws.
   */
  static cell_ptr_type make_cell(const item_type& head, cell_ptr_type tail) {
    void* memory = std::aligned_alloc(alignof(Cell), CellStorageSize);
    if (memory == nullptr)
      throw std::bad_alloc{};
    try {
      return new (memory) Cell{head, tail};
    } catch (...) {
      std::free(memory);
      throw;
    }
  }

  static void free_cell(cell_ptr_type cell) {
    auto* ptr = const_cast<Cell*>(cell);
    std::destroy_at(ptr);
    std::free(ptr);
  }
  //@}

  static std::size_t size(cell_ptr_type cell) { return (cell == nullptr) ? 0 : cell->size_; }

  //@{ Reference counting
  static void add_ref(cell_ptr_type cell) {
    if (cell != nullptr)
      cell->header_.add_ref();
  }

  // Frees cells front to back, stopping at the first one still shared. Never recursive, so
  // releasing a million element stack does not blow the call stack.
  static void dec_ref(cell_ptr_type cell) {
    while (cell != nullptr && cell->header_.dec_ref() == 0) {
      auto* tail = cell->tail_;
      free_cell(cell);
      cell = tail;
    }
  }

  static ref_count_type ref_count(cell_ptr_type cell) {
    return (cell == nullptr) ? 0 : cell->header_.ref_count();
  }
  //@}

  /**
   * A new cell on top of `tail`; takes its own reference to `tail`
   */
  static cell_ptr_type cons(const item_type& head, cell_ptr_type tail) {
    auto* cell = make_cell(head, tail);
    add_ref(tail);
    return cell;
  }

  static cell_ptr_type drop(cell_ptr_type cell, std::size_t count) {
    while (count-- > 0) {
      assert(cell != nullptr);
      cell = cell->tail_;
    }
    return cell;
  }

  /**
   * Pushes `[first, last)` onto `suffix` so that `project(*first)` ends up on top. Adopts the
   * reference to `suffix`, which is released again if a copy throws.
   */
  template <typename BidirIt, typename Project>
  static cell_ptr_type push_all(BidirIt first, BidirIt last, cell_ptr_type suffix,
                                Project&& project) {
    auto* top = suffix;
    try {
      while (last != first) {
        --last;
        top = make_cell(project(*last), top);
      }
    } catch (...) {
      dec_ref(top);
      throw;
    }
    return top;
  }

  /**
   * Addresses of the first `count` items, top to bottom
   */
  static std::vector<const item_type*> prefix(cell_ptr_type cell, std::size_t count) {
    std::vector<const item_type*> items;
    items.reserve(count);
    for (; count > 0; --count, cell = cell->tail_)
      items.push_back(&cell->head_);
    return items;
  }

  static const item_type& identity(const item_type& item) { return item; }
  static const item_type& deref(const item_type* item) { return *item; }
};

} // namespace obsidian::detail
