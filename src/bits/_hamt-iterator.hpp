
#pragma once

#include "_hamt-node-ops.hpp"

#include <iterator>

namespace obsidian::detail {

/**
 * Bidirectional iterator over the entries of a trie, in trie order.
 *
 * Holds the path from the root down to the current Leaf/Collision, with a cursor per level.
 * Since tries never change, an iterator stays valid for as long as the collection it came
 * from (or any version sharing its root) is alive.
 */
template <typename NodeOps> class Iterator {
public:
  using iterator_category = std::bidirectional_iterator_tag;
  using item_type = typename NodeOps::item_type;
  using value_type = item_type;
  using difference_type = std::ptrdiff_t;
  using reference = const item_type&;
  using pointer = const item_type*;
  using node_type = typename NodeOps::node_type;
  using node_const_ptr_type = const node_type*;

private:
  static constexpr uint32_t NotADepth{static_cast<uint32_t>(-1)};
  std::array<node_const_ptr_type, MaxTrieDepth + 1> path_{}; // +1 for the leaf node
  std::array<uint32_t, MaxTrieDepth + 1> position_{};        // of iteration in path_
  uint32_t depth_{NotADepth};

public:
  struct MakeBeginTag {};
  struct MakeEndTag {};

  constexpr Iterator() = default;

  constexpr Iterator(node_const_ptr_type root, MakeBeginTag) {
    path_[0] = root;
    if (root != nullptr) {
      depth_ = 0;
      position_[0] = 0;
      first_entry_below_();
    }
    assert_invariant_();
  }

  constexpr Iterator(node_const_ptr_type root, MakeEndTag) {
    path_[0] = root;
    assert_invariant_();
  }

  /**
   * Two iterators are equal at `end()`, or when they rest on the same entry of the same node
   */
  constexpr bool operator==(const Iterator& other) const {
    if (at_end_() || other.at_end_())
      return at_end_() && other.at_end_();
    return depth_ == other.depth_ && node_() == other.node_() && slot_() == other.slot_();
  }

  constexpr bool operator!=(const Iterator& other) const { return !(*this == other); }

  constexpr Iterator& operator++() {
    step_forward_();
    return *this;
  }

  constexpr Iterator& operator--() {
    step_back_();
    return *this;
  }

  constexpr Iterator operator++(int) {
    Iterator previous = *this;
    step_forward_();
    return previous;
  }

  constexpr Iterator operator--(int) {
    Iterator previous = *this;
    step_back_();
    return previous;
  }

  constexpr reference operator*() const { return *operator->(); }

  constexpr pointer operator->() const {
    assert(!at_end_());
    assert(node_() != nullptr && !NodeOps::is_branch(node_()));
    assert(slot_() < NodeOps::size(node_()));
    return NodeOps::Leaf::dense_ptr_at(node_(), slot_());
  }

private:
  constexpr void assert_invariant_() const {
    assert(at_end_() || !NodeOps::is_branch(node_()));
  }

  constexpr bool at_end_() const { return depth_ == NotADepth; }
  constexpr node_const_ptr_type node_() const { return path_[depth_]; }
  constexpr uint32_t& slot_() { return position_[depth_]; }
  constexpr const uint32_t& slot_() const { return position_[depth_]; }
  constexpr uint32_t last_slot_() const {
    return static_cast<uint32_t>(NodeOps::size(node_()) - 1);
  }

  // `++end()` stays at `end()`
  constexpr void step_forward_() {
    if (at_end_())
      return;
    if (slot_() < last_slot_()) { // another entry of this collision, or another child
      ++slot_();
      first_entry_below_();
      return;
    }
    // Climb until some branch has a child right of the path
    while (depth_ > 0) {
      --depth_;
      if (slot_() < last_slot_()) {
        ++slot_();
        first_entry_below_();
        return;
      }
    }
    depth_ = NotADepth;
  }

  // `--end()` is the last entry; `--begin()` is `end()`
  constexpr void step_back_() {
    if (at_end_()) {
      if (path_[0] == nullptr)
        return; // nothing to step back to
      depth_ = 0;
      slot_() = last_slot_();
      last_entry_below_();
      return;
    }
    if (slot_() > 0) {
      --slot_();
      last_entry_below_();
      return;
    }
    while (depth_ > 0) {
      --depth_;
      if (slot_() > 0) {
        --slot_();
        last_entry_below_();
        return;
      }
    }
    depth_ = NotADepth;
  }

  // Follows the current slot down, then the first child of every branch below it
  constexpr void first_entry_below_() {
    while (NodeOps::is_branch(node_())) {
      assert(depth_ + 1 < path_.size());
      auto* child = *NodeOps::Branch::dense_ptr_at(node_(), slot_());
      ++depth_;
      path_[depth_] = child;
      position_[depth_] = 0;
    }
    assert_invariant_();
  }

  // Follows the current slot down, then the last child of every branch below it
  constexpr void last_entry_below_() {
    while (NodeOps::is_branch(node_())) {
      assert(depth_ + 1 < path_.size());
      auto* child = *NodeOps::Branch::dense_ptr_at(node_(), slot_());
      ++depth_;
      path_[depth_] = child;
      assert(NodeOps::size(child) > 0);
      position_[depth_] = last_slot_();
    }
    assert_invariant_();
  }
};

} // namespace obsidian::detail
