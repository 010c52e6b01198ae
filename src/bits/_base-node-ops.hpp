
#pragma once

#include "_node-data.hpp"
#include "_hashing.hpp"

namespace obsidian::detail {

// ------------------------------------------------------------------------------------- BaseNodeOps

/**
 * Layout of a node: a `NodeData` header followed by a compact array of `T`, allocated as a
 * single aligned block.
 *
 * When `IsBitmapped` the payload is a 32 bit occupancy bitmap and the array is indexed
 * sparsely (HAMT branches). Otherwise the payload is the number of items.
 */
template <typename T, bool IsThreadSafe = true, bool IsBitmapped = false> struct BaseNodeOps {

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using hash_type = typename node_type::hash_type;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  static constexpr std::size_t LogicalSize{calculate_logical_size<item_type>()};
  static constexpr std::size_t AlignOf{std::max(alignof(item_type), alignof(node_type))};

  // The start of a compact array (pointers), or array of values (items)
  static constexpr std::size_t offset() { return round_up(sizeof(node_type), alignof(item_type)); }

  static constexpr std::size_t offset_at(node_size_type index) {
    return offset() + LogicalSize * index;
  }

  // aligned_alloc requires a multiple of the alignment
  static constexpr std::size_t storage_size(node_size_type size) {
    return round_up(offset() + LogicalSize * size, AlignOf);
  }

  static NodeType type(node_const_ptr_type node) { return node->type(); }

  static std::size_t size(node_const_ptr_type node) {
    if constexpr (IsBitmapped) {
      return popcount(node->payload_);
    } else {
      return node->payload_;
    }
  }

  //@{ Member access
  static bool is_valid_index(node_const_ptr_type node, node_size_type index) {
    if constexpr (IsBitmapped) {
      return ::obsidian::detail::is_valid_index(index, node->payload_);
    } else {
      return index < node->payload_;
    }
  }

  static item_type* ptr_at(node_const_ptr_type node, node_size_type index) {
    if constexpr (IsBitmapped) {
      assert(index < BranchFactor);
      return dense_ptr_at(node, to_dense_index(index, node->payload_));
    } else {
      return dense_ptr_at(node, index);
    }
  }

  static item_type* dense_ptr_at(node_const_ptr_type node, node_size_type index) {
    auto ptr_idx = reinterpret_cast<uintptr_t>(node) + offset_at(index);
    assert(ptr_idx % alignof(item_type) == 0); // never unaligned access
    return reinterpret_cast<item_type*>(ptr_idx);
  }

  static item_type* begin(node_const_ptr_type node) { return dense_ptr_at(node, 0); }

  static item_type* end(node_const_ptr_type node) { return dense_ptr_at(node, 0) + size(node); }
  //@}

  //@{ Allocation
  static node_ptr_type make_uninitialized(NodeType type, node_size_type size,
                                          node_size_type payload, hash_type hash = 0) {
    void* memory = std::aligned_alloc(AlignOf, storage_size(size));
    if (memory == nullptr)
      throw std::bad_alloc{};
    return new (memory) node_type{type, payload, hash};
  }

  static void free_node(node_ptr_type node) {
    node->~node_type();
    std::free(node);
  }
  //@}
};

// ------------------------------------------------------------------------------------- ItemNodeOps

/**
 * Nodes that hold values: HAMT leaves and collisions, vector chunks.
 */
template <typename T, bool IsThreadSafe = true>
struct ItemNodeOps : public BaseNodeOps<T, IsThreadSafe, false> {

  using Base = BaseNodeOps<T, IsThreadSafe, false>;

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = T;
  using hash_type = typename node_type::hash_type;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  static void copy_one(const item_type& src, item_type* dst) {
    if constexpr (std::is_trivial<item_type>::value) {
      std::memcpy(dst, &src, sizeof(item_type));
    } else {
      static_assert(std::is_copy_constructible<item_type>::value);
      new (dst) item_type(src);
    }
  }

  static void initialize_one(const item_type& src, item_type* dst) { copy_one(src, dst); }

  static void initialize_one(item_type&& src, item_type* dst) {
    if constexpr (std::is_move_constructible<item_type>::value) {
      new (dst) item_type(std::move(src));
    } else {
      copy_one(src, dst);
    }
  }

  static void destroy_items(node_ptr_type node, std::size_t count) {
    if constexpr (!std::is_trivially_destructible<item_type>::value) {
      auto* iterator = Base::dense_ptr_at(node, 0);
      auto* end = iterator + count;
      while (iterator != end)
        std::destroy_at(iterator++);
    }
  }

  static void destroy_items(node_ptr_type node) { destroy_items(node, Base::size(node)); }

  /**
   * Constructs the `count` items of a freshly allocated node with `init(index, dst)`.
   * If a constructor throws, the items built so far are destroyed and the node is freed.
   */
  template <typename Init>
  static node_ptr_type fill(node_ptr_type node, node_size_type count, Init&& init) {
    node_size_type index = 0;
    try {
      for (; index < count; ++index)
        init(index, Base::dense_ptr_at(node, index));
    } catch (...) {
      destroy_items(node, index);
      Base::free_node(node);
      throw;
    }
    return node;
  }

  template <typename Value>
  static node_ptr_type make(NodeType type, hash_type hash, Value&& value) {
    auto* ptr = Base::make_uninitialized(type, 1, 1, hash);
    return fill(ptr, 1, [&](node_size_type, item_type* dst) {
      initialize_one(std::forward<Value>(value), dst);
    });
  }

  /**
   * A node holding copies of `[first, first + count)`
   */
  template <typename RandomIt>
  static node_ptr_type make_from(NodeType type, hash_type hash, RandomIt first,
                                 node_size_type count) {
    auto* ptr = Base::make_uninitialized(type, count, count, hash);
    return fill(ptr, count, [&](node_size_type index, item_type* dst) {
      copy_one(static_cast<const item_type&>(first[index]), dst);
    });
  }

  /**
   * Duplicates a node, omitting the value at `index_to_skip`
   */
  static node_ptr_type duplicate_without(node_const_ptr_type node, uint32_t index_to_skip,
                                         NodeType new_type) {
    const auto sz = static_cast<node_size_type>(Base::size(node));
    assert(index_to_skip < sz);
    auto* new_node = Base::make_uninitialized(new_type, sz - 1, sz - 1, node->hash_);
    return fill(new_node, sz - 1, [&](node_size_type index, item_type* dst) {
      const auto read_index = (index < index_to_skip) ? index : index + 1;
      copy_one(*Base::dense_ptr_at(node, read_index), dst);
    });
  }

  /**
   * Duplicates a node, with `value` replacing the item at `index`
   */
  template <typename Value>
  static node_ptr_type duplicate_with_overwrite(node_const_ptr_type node, uint32_t index,
                                                Value&& value) {
    const auto sz = static_cast<node_size_type>(Base::size(node));
    assert(index < sz);
    auto* new_node = Base::make_uninitialized(node->type(), sz, sz, node->hash_);
    return fill(new_node, sz, [&](node_size_type i, item_type* dst) {
      if (i == index)
        initialize_one(std::forward<Value>(value), dst);
      else
        copy_one(*Base::dense_ptr_at(node, i), dst);
    });
  }

  /**
   * Creates a new node, with values copied, and `value` at the end
   */
  template <typename Value>
  static node_ptr_type copy_append(node_const_ptr_type src, Value&& value, NodeType new_type) {
    const auto sz = static_cast<node_size_type>(Base::size(src));
    auto* new_node = Base::make_uninitialized(new_type, sz + 1, sz + 1, src->hash_);
    return fill(new_node, sz + 1, [&](node_size_type i, item_type* dst) {
      if (i == sz)
        initialize_one(std::forward<Value>(value), dst);
      else
        copy_one(*Base::dense_ptr_at(src, i), dst);
    });
  }
};

// ---------------------------------------------------------------------------------- PointerNodeOps

/**
 * Nodes that hold references to other nodes: HAMT branches (bitmapped) and the vector's chunk
 * table (counted). Every pointer stored owns one reference.
 */
template <bool IsThreadSafe = true, bool IsBitmapped = true>
struct PointerNodeOps : public BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, IsBitmapped> {

  using Base = BaseNodeOps<NodeData<IsThreadSafe>*, IsThreadSafe, IsBitmapped>;

  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using item_type = node_ptr_type;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  /**
   * Duplicate a pointer node, bumping the references of the children, except perhaps at
   * an index that is about to be overwritten
   */
  static node_ptr_type duplicate(node_const_ptr_type node, uint32_t dense_index_to_skip) {
    assert(node->type() == NodeType::Branch);
    const auto sz = Base::size(node);
    node_ptr_type ptr = Base::make_uninitialized(NodeType::Branch, sz, node->payload_);

    // Copy the pointers
    item_type* dst = Base::dense_ptr_at(ptr, 0);
    const item_type* src = Base::dense_ptr_at(node, 0);
    std::memcpy(dst, src, sz * sizeof(item_type));

    // Must bump up all references
    for (auto i = 0u; i < sz; ++i) {
      if (i == dense_index_to_skip)
        continue;
      dst[i]->add_ref();
    }
    return ptr;
  }

  static node_ptr_type remove_from_branch_node(node_const_ptr_type node,
                                               uint32_t sparse_index_to_remove) {
    static_assert(IsBitmapped);
    assert(node->type() == NodeType::Branch);
    assert(Base::size(node) > 1); // otherwise the branch node would become empty
    assert(Base::is_valid_index(node, sparse_index_to_remove)); // must remove something!

    const auto sz = Base::size(node);
    const auto dense_index = to_dense_index(sparse_index_to_remove, node->payload_);

    const auto bitmap = node->payload_ & ~bit_shift(sparse_index_to_remove);
    node_ptr_type ptr = Base::make_uninitialized(NodeType::Branch, sz - 1, bitmap);

    item_type* dst = Base::dense_ptr_at(ptr, 0);
    const item_type* src = Base::dense_ptr_at(node, 0);

    auto write_pos = 0u;
    for (auto i = 0u; i < sz; ++i) {
      if (i == dense_index)
        continue;
      src[i]->add_ref();
      dst[write_pos++] = src[i];
    }
    return ptr;
  }

  /**
   * Creates a new branch node, with `value` inserted at sparse `index`
   */
  static node_ptr_type insert_into_branch_node(node_const_ptr_type src, item_type value,
                                               uint32_t index) {
    static_assert(IsBitmapped);
    assert(src->type() == NodeType::Branch);
    assert(index < BranchFactor);
    assert(!Base::is_valid_index(src, index)); // Cannot overwrite existing value

    const auto dst_bitmap = bit_shift(index) | src->payload_;
    const auto dst_size = Base::size(src) + 1;

    auto dst = Base::make_uninitialized(NodeType::Branch, dst_size, dst_bitmap);
    assert(Base::size(dst) == dst_size);

    // Copy across the (densely stored) pointers
    auto* dst_array = Base::dense_ptr_at(dst, 0);
    const auto* src_array = Base::dense_ptr_at(src, 0);
    const auto insert_pos = to_dense_index(index, dst_bitmap);

    for (auto i = 0u; i < insert_pos; ++i) {
      dst_array[i] = src_array[i];
      dst_array[i]->add_ref();
    }
    dst_array[insert_pos] = value; // insert the value
    for (auto i = insert_pos + 1; i < dst_size; ++i) {
      dst_array[i] = src_array[i - 1];
      dst_array[i]->add_ref();
    }

    return dst;
  }

  /**
   * A counted pointer node one longer than `src` (which may be null), with `value` at the end
   */
  static node_ptr_type copy_append(node_const_ptr_type src, item_type value) {
    static_assert(!IsBitmapped);
    const auto sz = static_cast<node_size_type>(src == nullptr ? 0 : Base::size(src));
    auto dst = Base::make_uninitialized(NodeType::Branch, sz + 1, sz + 1);
    auto* dst_array = Base::dense_ptr_at(dst, 0);
    for (auto i = 0u; i < sz; ++i) {
      dst_array[i] = *Base::dense_ptr_at(src, i);
      dst_array[i]->add_ref();
    }
    dst_array[sz] = value;
    return dst;
  }
};

} // namespace obsidian::detail
