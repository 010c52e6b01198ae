
#pragma once

#include "obsidian/nullable.hpp"

#include <cstddef>
#include <cstdint>
#include <cassert>

namespace obsidian::detail {

constexpr uint32_t HashBits{5};                             // bits consumed per trie level
constexpr uint32_t BranchFactor{1u << HashBits};            // 32 slots per branch
constexpr uint32_t HashMask{BranchFactor - 1};              // 0x1f
constexpr std::size_t MaxTrieDepth{7};                      // ceil(32 / 5) branch levels
constexpr uint32_t MaxShift{HashBits * (MaxTrieDepth - 1)}; // 30

constexpr uint32_t NotAnIndex{static_cast<uint32_t>(-1)};

constexpr uint8_t branch_free_popcount(uint32_t x) {
  x = x - ((x >> 1) & 0x55555555u);
  x = (x & 0x33333333u) + ((x >> 2) & 0x33333333u);
  return static_cast<uint8_t>(((x + (x >> 4) & 0x0f0f0f0fu) * 0x01010101u) >> 24);
}

/**
 * @return The number of bits in 'x' with value 1
 */
constexpr uint8_t popcount(uint32_t x) {
#if __has_builtin(__builtin_popcount)
  return __builtin_popcount(x); // some versions of gcc/clang only
#else
  return branch_free_popcount(x);
#endif
}

// ------------------------------------------------------------------------------------------ Mixing

/**
 * MurmurHash3 32 bit finalizer. A bijection on uint32_t, so distinct raw hashes never collide
 * after mixing, and poorly distributed raw hashes still spread over every trie level.
 */
constexpr uint32_t mix(uint32_t h) {
  h ^= h >> 16;
  h *= 0x85ebca6bu;
  h ^= h >> 13;
  h *= 0xc2b2ae35u;
  h ^= h >> 16;
  return h;
}

constexpr uint32_t fold(std::size_t raw) {
  if constexpr (sizeof(std::size_t) > sizeof(uint32_t)) {
    return static_cast<uint32_t>(raw ^ (raw >> 32));
  } else {
    return static_cast<uint32_t>(raw);
  }
}

/**
 * The mixed hash of `key`. A null key (see `nullable_traits`) hashes to 0 without
 * consulting `Hash`.
 */
template <typename Hash, typename Key> constexpr uint32_t hash_of(const Key& key) {
  if (is_null(key))
    return mix(0u);
  Hash hasher;
  return mix(fold(hasher(key)));
}

// ------------------------------------------------------------------------------------ Trie indices

/**
 * The 5 bit segment of `hash` used at the trie level starting at `shift`
 */
constexpr uint32_t mask(uint32_t hash, uint32_t shift) {
  assert(shift <= MaxShift);
  return (hash >> shift) & HashMask;
}

constexpr uint32_t bit_shift(uint32_t mask) {
  assert(mask < BranchFactor);
  return 1u << mask;
}

/**
 * Physical offset of the child at `bit`, in a branch whose populated slots are `bitmap`
 */
constexpr uint32_t dense_index(uint32_t bitmap, uint32_t bit) {
  return popcount(bitmap & (bit - 1));
}

constexpr uint32_t to_dense_index(uint32_t index, uint32_t bitmap) {
  assert(index < sizeof(uint32_t) * 8);
  return dense_index(bitmap, bit_shift(index)); // index=4  ==>  mask=0x0111b
}

constexpr bool is_valid_index(uint32_t index, uint32_t bitmap) {
  const auto clamped_index = (index & HashMask); // clamp required so that
  const auto bit = (1u << clamped_index);        // this left-shift is well-defined
  return (bitmap & bit);                         // on the abstract c++ machine
}

} // namespace obsidian::detail
