
#pragma once

#include <algorithm>
#include <atomic>
#include <bit>
#include <functional>
#include <memory>
#include <new>
#include <type_traits>

#include <cstdint>
#include <cstring>
#include <cassert>
#include <cstdlib>

namespace obsidian::detail {

/**
 * Tag stored in the two high bits of every node's reference count.
 *
 * HAMT nodes use all three. The vector uses `Branch` for its chunk table and `Leaf` for
 * chunks. Cons cells are always `Leaf`.
 */
enum class NodeType : uint32_t { Branch = 0, Leaf = 1, Collision = 2 };

/**
 * The bytes between successive objects in an array of T
 */
constexpr std::size_t calculate_logical_size_(std::size_t align, std::size_t size) {
  if (size <= align)
    return align;
  if (align <= 1)
    return size;
  const auto remainder = size % align;
  const auto chunks = size / align;
  return (remainder == 0) ? size : align * (chunks + 1);
}

template <typename T> constexpr std::size_t calculate_logical_size() {
  return calculate_logical_size_(alignof(T), sizeof(T));
}

constexpr std::size_t round_up(std::size_t value, std::size_t alignment) {
  return (value + alignment - 1) / alignment * alignment;
}

// ---------------------------------------------------------------------------------------- NodeData

template <bool IsThreadSafe = true> struct NodeData {
  using ref_count_type = uint32_t; // Top two bits are the node type
  using node_size_type = uint32_t; // Need all 32 bits for a bitmap
  using hash_type = uint32_t;
  using counter_type =
      std::conditional_t<IsThreadSafe, std::atomic<ref_count_type>, ref_count_type>;

  static constexpr ref_count_type TypeOffset{sizeof(ref_count_type) * 8 - 2}; // 30
  static constexpr ref_count_type TypeMask{static_cast<ref_count_type>(0x3u) << TypeOffset};
  static constexpr ref_count_type RefMask{~TypeMask};
  static constexpr ref_count_type MaxRef{RefMask};

  // @{ members
  mutable counter_type ref_count_; // The type bits are fixed at contruction
  node_size_type payload_;         // bitmap for HAMT branches, otherwise the item count
  hash_type hash_;                 // mixed hash shared by every entry of a Leaf/Collision
  // @}

  constexpr NodeData(NodeType type, node_size_type payload, hash_type hash = 0)
      : ref_count_{(static_cast<ref_count_type>(type) << TypeOffset) + 1}, payload_{payload},
        hash_{hash} {}

  constexpr ref_count_type add_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_add(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_++ & RefMask;
    }
    assert(previous_count < MaxRef);
    return previous_count + 1;
  }

  constexpr ref_count_type dec_ref() const {
    ref_count_type previous_count;
    if constexpr (IsThreadSafe) {
      previous_count = ref_count_.fetch_sub(1, std::memory_order_acq_rel) & RefMask;
    } else {
      previous_count = ref_count_-- & RefMask;
    }
    assert(previous_count > 0);
    return previous_count - 1;
  }

  constexpr ref_count_type ref_count() const {
    if constexpr (IsThreadSafe) {
      return ref_count_.load(std::memory_order_acquire) & RefMask;
    } else {
      return ref_count_ & RefMask;
    }
  }

  constexpr NodeType type() const {
    ref_count_type raw;
    if constexpr (IsThreadSafe) {
      raw = ref_count_.load(std::memory_order_relaxed);
    } else {
      raw = ref_count_;
    }
    return static_cast<NodeType>((raw & TypeMask) >> TypeOffset);
  }
};

} // namespace obsidian::detail
