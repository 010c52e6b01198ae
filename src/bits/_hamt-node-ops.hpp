
#pragma once

#include "_base-node-ops.hpp"

#include <array>
#include <concepts>
#include <utility>

namespace obsidian::detail {

// ----------------------------------------------------------------------------------------- NodeOps

/**
 * The hash array mapped trie.
 *
 * A trie is a null root (Empty), or one of:
 *  + Branch:    bitmap of the 32 slots in use, followed by one child pointer per set bit
 *  + Leaf:      one entry, and the mixed hash of its key
 *  + Collision: two or more entries whose keys are different but whose mixed hashes are equal
 *
 * Invariants:
 *  + Every entry below a branch at depth `d` agrees with the path on the first `5 * d` bits
 *  + A Branch with a single child has a Branch for that child (no chains down to a leaf)
 *  + A Collision has at least two entries
 */
template <typename KeyType,                           //
          typename ValueType,                         // Value Type for maps
          typename Hash = std::hash<KeyType>,         //
          typename KeyEqual = std::equal_to<KeyType>, //
          bool IsThreadSafe = true>
struct NodeOps {
  using key_type = KeyType;
  using value_type = ValueType;
  using item_type = std::pair<KeyType, ValueType>;
  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using size_type = std::size_t;
  using hash_type = typename node_type::hash_type;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;
  using hasher = Hash;
  using key_equal = KeyEqual;

  using Branch = PointerNodeOps<IsThreadSafe, true>;
  using Leaf = ItemNodeOps<item_type, IsThreadSafe>;

  static constexpr bool is_thread_safe = IsThreadSafe;

  /**
   * Result of a recursive edit.
   *
   * If `node` is the node that was edited, then nothing changed, and no reference was taken.
   * Otherwise the caller owns one reference to `node` (which may be null: the subtree is now
   * empty). `resized` is true when an entry was added or removed.
   */
  struct Edit {
    node_ptr_type node = nullptr;
    bool resized = false;
  };

  //@{ Destruction
  static constexpr void destroy(node_ptr_type node_ptr) {
    if (node_ptr == nullptr) {
      return;
    }

    if (node_ptr->type() == NodeType::Branch) {
      node_ptr_type* iterator = Branch::dense_ptr_at(node_ptr, 0); // i.e., node_type**
      node_ptr_type* end = iterator + Branch::size(node_ptr);
      while (iterator != end) {
        dec_ref(*iterator++);
      }
    } else {
      Leaf::destroy_items(node_ptr);
    }

    Branch::free_node(node_ptr);
  }
  //@}

  //@{ Getters
  static constexpr NodeType type(node_const_ptr_type node) { return node->type(); }

  static constexpr bool is_branch(node_const_ptr_type node) {
    return node->type() == NodeType::Branch;
  }

  static constexpr size_type size(node_const_ptr_type node) {
    return is_branch(node) ? Branch::size(node) : Leaf::size(node);
  }

  static constexpr hash_type hash(node_const_ptr_type node) {
    assert(node != nullptr);
    assert(!is_branch(node));
    return node->hash_;
  }
  //@}

  //@{ Reference counting
  static constexpr void add_ref(node_const_ptr_type node) {
    if (node != nullptr)
      node->add_ref();
  }
  static constexpr void dec_ref(node_const_ptr_type node) {
    if (node != nullptr && node->dec_ref() == 0)
      destroy(const_cast<node_ptr_type>(node));
  }
  static constexpr ref_count_type ref_count(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->ref_count();
  }
  //@}

  //@{ Hashing
  static constexpr hash_type calculate_hash(const key_type& key) { return hash_of<Hash>(key); }

  static constexpr bool calculate_equals(const key_type& lhs, const key_type& rhs) {
    key_equal equal_func;
    return equal_func(lhs, rhs);
  }

  static constexpr bool same_value(const value_type& lhs, const value_type& rhs) {
    if constexpr (std::equality_comparable<value_type>) {
      return lhs == rhs;
    } else {
      return false; // cannot tell, so always replace
    }
  }
  //@}

  //@{ Path
  struct TreePath {
    std::array<node_const_ptr_type, MaxTrieDepth> nodes; //!< the path is {Branch, Branch, ...}
    node_const_ptr_type leaf_end = nullptr;              //!< set if the path ends in a leaf
    uint32_t size = 0;                                   //!< number of branches in path
    void push(node_const_ptr_type node) {
      assert(size < nodes.size());
      nodes[size++] = node;
    }
  };

  /**
   * The branches visited when looking up `hash`, and the Leaf/Collision found, if any
   */
  static constexpr TreePath make_path(node_const_ptr_type root, hash_type hash) {
    TreePath path;
    auto node = root;
    while (node != nullptr && is_branch(node)) {
      const auto bit = bit_shift(mask(hash, path.size * HashBits));
      path.push(node);
      node = (node->payload_ & bit) ? *Branch::dense_ptr_at(node, dense_index(node->payload_, bit))
                                    : nullptr;
    }
    path.leaf_end = node;
    return path;
  }
  //@}

  //@{ Lookup
  static constexpr uint32_t get_index_in_leaf(node_const_ptr_type leaf, const key_type& key) {
    assert(leaf != nullptr && !is_branch(leaf));
    auto* start = Leaf::begin(leaf);
    auto* finish = Leaf::end(leaf);
    for (auto* iterator = start; iterator != finish; ++iterator) {
      if (calculate_equals(key, iterator->first))
        return static_cast<uint32_t>(iterator - start);
    }
    return NotAnIndex;
  }

  static constexpr const item_type* find(node_const_ptr_type root, const key_type& key) {
    const auto hash = calculate_hash(key);
    auto node = root;
    auto shift = 0u;
    while (node != nullptr && is_branch(node)) {
      const auto bit = bit_shift(mask(hash, shift));
      if ((node->payload_ & bit) == 0)
        return nullptr; // slot not populated
      node = *Branch::dense_ptr_at(node, dense_index(node->payload_, bit));
      shift += HashBits;
    }
    if (node == nullptr || node->hash_ != hash)
      return nullptr;
    const auto index = get_index_in_leaf(node, key);
    return (index == NotAnIndex) ? nullptr : Leaf::dense_ptr_at(node, index);
  }

  template <typename Function>
  static constexpr void for_each(node_const_ptr_type node, Function& f) {
    if (node == nullptr)
      return;
    if (is_branch(node)) {
      for (auto* iterator = Branch::begin(node); iterator != Branch::end(node); ++iterator)
        for_each(*iterator, f);
    } else {
      for (auto* iterator = Leaf::begin(node); iterator != Leaf::end(node); ++iterator)
        f(iterator->first, iterator->second);
    }
  }
  //@}

  //@{ Insert
  template <typename K, typename V>
  static node_ptr_type make_leaf(hash_type hash, K&& key, V&& value) {
    return Leaf::make(NodeType::Leaf, hash,
                      item_type{std::forward<K>(key), std::forward<V>(value)});
  }

  /**
   * A branch (or chain of branches) separating `lhs` and `rhs`, which must have different
   * hashes. Takes ownership of one reference to each, and releases both if allocation fails.
   *
   *    [...] -> lhs
   *
   *        goes to
   *
   *    [...] -> branch -> branch -> lhs
   *                               -> rhs
   */
  static node_ptr_type merge_leaves(node_ptr_type lhs, node_ptr_type rhs, uint32_t shift) {
    assert(!is_branch(lhs) && !is_branch(rhs));
    assert(lhs->hash_ != rhs->hash_); // otherwise this would be a collision
    assert(shift <= MaxShift);        // the hashes must differ by the last level

    const auto lhs_mask = mask(lhs->hash_, shift);
    const auto rhs_mask = mask(rhs->hash_, shift);

    if (lhs_mask != rhs_mask) {
      const auto bitmap = bit_shift(lhs_mask) | bit_shift(rhs_mask);
      node_ptr_type branch = nullptr;
      try {
        branch = Branch::make_uninitialized(NodeType::Branch, 2, bitmap);
      } catch (...) {
        dec_ref(lhs);
        dec_ref(rhs);
        throw;
      }
      *Branch::ptr_at(branch, lhs_mask) = lhs;
      *Branch::ptr_at(branch, rhs_mask) = rhs;
      return branch;
    }

    // Same slot at this level too: recurse one level deeper
    auto* child = merge_leaves(lhs, rhs, shift + HashBits);
    node_ptr_type branch = nullptr;
    try {
      branch = Branch::make_uninitialized(NodeType::Branch, 1, bit_shift(lhs_mask));
    } catch (...) {
      dec_ref(child);
      throw;
    }
    *Branch::dense_ptr_at(branch, 0) = child;
    return branch;
  }

  template <typename K, typename V>
  static Edit assoc(node_ptr_type node, hash_type hash, uint32_t shift, K&& key, V&& value) {
    if (node == nullptr) { // inserting into an empty tree: trivial case
      return {make_leaf(hash, std::forward<K>(key), std::forward<V>(value)), true};
    }

    if (!is_branch(node)) {
      if (node->hash_ != hash) { // split
        auto* new_leaf = make_leaf(hash, std::forward<K>(key), std::forward<V>(value));
        add_ref(node); // the old leaf now also belongs to the new branch
        return {merge_leaves(node, new_leaf, shift), true}; // on failure, releases both
      }

      const auto index = get_index_in_leaf(node, key);
      if (index == NotAnIndex) { // same hash, new key: create or extend a collision
        auto* collision = Leaf::copy_append(
            node, item_type{std::forward<K>(key), std::forward<V>(value)}, NodeType::Collision);
        return {collision, true};
      }

      if (same_value(Leaf::dense_ptr_at(node, index)->second, value))
        return {node, false}; // no-op

      auto* updated = Leaf::duplicate_with_overwrite(
          node, index, item_type{std::forward<K>(key), std::forward<V>(value)});
      return {updated, false};
    }

    const auto sparse_index = mask(hash, shift);
    const auto bit = bit_shift(sparse_index);
    if ((node->payload_ & bit) == 0) { // slot is free: grow the branch by one
      auto* new_leaf = make_leaf(hash, std::forward<K>(key), std::forward<V>(value));
      try {
        return {Branch::insert_into_branch_node(node, new_leaf, sparse_index), true};
      } catch (...) {
        dec_ref(new_leaf);
        throw;
      }
    }

    const auto index = dense_index(node->payload_, bit);
    auto* child = *Branch::dense_ptr_at(node, index);
    auto edit = assoc(child, hash, shift + HashBits, std::forward<K>(key), std::forward<V>(value));
    if (edit.node == child)
      return {node, false};
    return {replace_child(node, index, edit.node), edit.resized};
  }
  //@}

  //@{ Remove
  static Edit dissoc(node_ptr_type node, hash_type hash, uint32_t shift, const key_type& key) {
    if (node == nullptr)
      return {nullptr, false};

    if (!is_branch(node)) {
      if (node->hash_ != hash)
        return {node, false};
      const auto index = get_index_in_leaf(node, key);
      if (index == NotAnIndex)
        return {node, false};
      const auto sz = Leaf::size(node);
      if (sz == 1)
        return {nullptr, true};
      const auto new_type = (sz == 2) ? NodeType::Leaf : NodeType::Collision; // demote
      return {Leaf::duplicate_without(node, index, new_type), true};
    }

    const auto sparse_index = mask(hash, shift);
    const auto bit = bit_shift(sparse_index);
    if ((node->payload_ & bit) == 0)
      return {node, false};

    const auto index = dense_index(node->payload_, bit);
    auto* child = *Branch::dense_ptr_at(node, index);
    auto edit = dissoc(child, hash, shift + HashBits, key);
    if (!edit.resized)
      return {node, false};

    const auto sz = Branch::size(node);
    if (edit.node == nullptr) {
      if (sz == 1)
        return {nullptr, true}; // last child removed: collapse to Empty
      if (sz == 2) {
        auto* sibling = *Branch::dense_ptr_at(node, 1 - index);
        if (!is_branch(sibling)) { // hoist the sole remaining leaf
          add_ref(sibling);
          return {sibling, true};
        }
      }
      return {Branch::remove_from_branch_node(node, sparse_index), true};
    }

    if (sz == 1 && !is_branch(edit.node))
      return edit; // keep hoisting the leaf through single-child branches

    return {replace_child(node, index, edit.node), true};
  }
  //@}

private:
  /**
   * Copy of `node` with the child at `index` replaced by `new_child`; owns `new_child`, which
   * is released if the copy cannot be allocated
   */
  static node_ptr_type replace_child(node_const_ptr_type node, uint32_t index,
                                     node_ptr_type new_child) {
    node_ptr_type new_branch = nullptr;
    try {
      new_branch = Branch::duplicate(node, index);
    } catch (...) {
      dec_ref(new_child);
      throw;
    }
    *Branch::dense_ptr_at(new_branch, index) = new_child;
    return new_branch;
  }
};

} // namespace obsidian::detail
