
#pragma once

#include "_base-node-ops.hpp"

namespace obsidian::detail {

// ---------------------------------------------------------------------------------------- ChunkOps

/**
 * Storage of `persistent_vector`: a counted table node (type Branch) holding full 32-item
 * chunks (type Leaf), and a separately held tail chunk of 1 to 32 items.
 */
template <typename T, bool IsThreadSafe = true> struct ChunkOps {
  using item_type = T;
  using node_type = NodeData<IsThreadSafe>;
  using node_ptr_type = node_type*;
  using node_const_ptr_type = const node_type*;
  using node_size_type = typename node_type::node_size_type;
  using ref_count_type = typename node_type::ref_count_type;

  using Table = PointerNodeOps<IsThreadSafe, false>;
  using Chunk = ItemNodeOps<item_type, IsThreadSafe>;

  static constexpr std::size_t ChunkShift{HashBits};
  static constexpr std::size_t ChunkSize{std::size_t{1} << ChunkShift}; // 32
  static constexpr std::size_t ChunkMask{ChunkSize - 1};

  static constexpr std::size_t chunk_index(std::size_t index) { return index >> ChunkShift; }
  static constexpr std::size_t chunk_offset(std::size_t index) { return index & ChunkMask; }

  static constexpr void destroy(node_ptr_type node_ptr) {
    if (node_ptr == nullptr)
      return;
    if (node_ptr->type() == NodeType::Branch) {
      for (auto* iterator = Table::begin(node_ptr); iterator != Table::end(node_ptr); ++iterator)
        dec_ref(*iterator);
    } else {
      Chunk::destroy_items(node_ptr);
    }
    Table::free_node(node_ptr);
  }

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

  static constexpr std::size_t size(node_const_ptr_type node) {
    return (node == nullptr) ? 0 : node->payload_;
  }

  static constexpr node_const_ptr_type chunk_at(node_const_ptr_type table, std::size_t index) {
    assert(table != nullptr && index < Table::size(table));
    return *Table::dense_ptr_at(table, static_cast<node_size_type>(index));
  }

  /**
   * A copy of `table` with the chunk at `index` replaced; owns `new_chunk`
   */
  static node_ptr_type replace_chunk(node_const_ptr_type table, std::size_t index,
                                     node_ptr_type new_chunk) {
    auto* new_table = Table::duplicate(table, static_cast<uint32_t>(index));
    *Table::dense_ptr_at(new_table, static_cast<node_size_type>(index)) = new_chunk;
    return new_table;
  }
};

} // namespace obsidian::detail
