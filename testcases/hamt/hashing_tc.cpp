
#include "test-helpers.hpp"

#include <array>
#include <bit>
#include <memory>
#include <string>

namespace obsidian::test {

CATCH_TEST_CASE("max_trie_depth", "[max_trie_depth]") {
  const auto hash_bits = sizeof(uint32_t) * 8; // mixed hashes are 32 bits
  CATCH_REQUIRE(detail::HashBits * detail::MaxTrieDepth >= hash_bits);      // 5 * 7 = 35
  CATCH_REQUIRE(detail::HashBits * (detail::MaxTrieDepth - 1) < hash_bits); // 5 * 6 = 30
  CATCH_REQUIRE(detail::MaxShift == 30);
  CATCH_REQUIRE(detail::BranchFactor == 32);
}

CATCH_TEST_CASE("popcount", "[popcount]") {
  auto test_popcount = [](uint32_t x, int count) {
    CATCH_REQUIRE(detail::popcount(x) == count);
    CATCH_REQUIRE(detail::branch_free_popcount(x) == count);
  };
  test_popcount(0x00000000u, 0);
  test_popcount(0x01010101u, 4);
  test_popcount(0x11010101u, 5);
  test_popcount(0xf1010101u, 8);
  test_popcount(0xffffffffu, 32);
}

CATCH_TEST_CASE("sparse_index", "[sparse_index]") {
  const uint32_t bitmap = (1u << 0) | (1u << 7) | (1u << 16) | (1u << 22) | (1u << 31);
  CATCH_REQUIRE(detail::popcount(bitmap) == 5);
  CATCH_REQUIRE(detail::to_dense_index(0u, bitmap) == 0);
  CATCH_REQUIRE(detail::to_dense_index(7u, bitmap) == 1);
  CATCH_REQUIRE(detail::to_dense_index(16u, bitmap) == 2);
  CATCH_REQUIRE(detail::to_dense_index(22u, bitmap) == 3);
  CATCH_REQUIRE(detail::to_dense_index(31u, bitmap) == 4);

  for (auto i = 0u; i < 32; ++i) {
    const bool is_valid = (i == 0) || (i == 7) || (i == 16) || (i == 22) || (i == 31);
    CATCH_REQUIRE(detail::is_valid_index(i, bitmap) == is_valid);
  }
}

CATCH_TEST_CASE("hash_segments", "[hash_segments]") {
  const uint32_t hash = 0b11'00101'00100'00011'00010'00001'11111u;
  CATCH_REQUIRE(detail::mask(hash, 0) == 31);
  CATCH_REQUIRE(detail::mask(hash, 5) == 1);
  CATCH_REQUIRE(detail::mask(hash, 10) == 2);
  CATCH_REQUIRE(detail::mask(hash, 15) == 3);
  CATCH_REQUIRE(detail::mask(hash, 20) == 4);
  CATCH_REQUIRE(detail::mask(hash, 25) == 5);
  CATCH_REQUIRE(detail::mask(hash, 30) == 3); // the last level only has 2 bits
}

CATCH_TEST_CASE("hash_mixing", "[hash_mixing]") {
  // The finalizer is a bijection
  CATCH_REQUIRE(detail::mix(0u) == 0u);
  CATCH_REQUIRE(detail::mix(1u) != 1u);

  for (uint32_t value : {0u, 1u, 2u, 0x20u, 0xdeadbeefu, 0xffffffffu}) {
    CATCH_REQUIRE(unmix(detail::mix(value)) == value);
    CATCH_REQUIRE(detail::mix(unmix(value)) == value);
  }

  CATCH_REQUIRE(detail::fold(std::size_t{0x12345678u}) == 0x12345678u);
  if constexpr (sizeof(std::size_t) == 8) {
    CATCH_REQUIRE(detail::fold(std::size_t{1} << 32) == 1u);
  }

  // Placed keys land exactly where they are told
  CATCH_REQUIRE(detail::hash_of<PlacedKey::Hasher>(PlacedKey{0x21u, 0}) == 0x21u);
  CATCH_REQUIRE(detail::hash_of<PlacedKey::Hasher>(PlacedKey{0x40000001u, 7}) == 0x40000001u);
}

CATCH_TEST_CASE("hash_of_null", "[hash_of_null]") {
  int value = 7;
  CATCH_REQUIRE(detail::hash_of<std::hash<int*>>(static_cast<int*>(nullptr)) == detail::mix(0));
  CATCH_REQUIRE(detail::hash_of<std::hash<std::shared_ptr<int>>>(std::shared_ptr<int>{}) ==
                detail::mix(0));
  CATCH_REQUIRE(detail::hash_of<std::hash<int*>>(&value) ==
                detail::mix(detail::fold(std::hash<int*>{}(&value))));
  CATCH_REQUIRE(detail::hash_of<std::hash<std::string>>(std::string{"abc"}) ==
                detail::mix(detail::fold(std::hash<std::string>{}("abc"))));
}

CATCH_TEST_CASE("node_data_size_alignment", "[node_data_size_alignment]") {
  using NodeDataTheadSafe = detail::NodeData<true>;
  using NodeDataVanilla = detail::NodeData<false>;
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == alignof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == sizeof(NodeDataVanilla));
  CATCH_REQUIRE(sizeof(NodeDataTheadSafe) == 12);
  CATCH_REQUIRE(alignof(NodeDataTheadSafe) == 4);
}

CATCH_TEST_CASE("node_data_add_dec_ref", "[node_data_add_dec_ref]") {
  auto test_node = [](auto& node) {
    CATCH_REQUIRE(node.ref_count() == 1);
    CATCH_REQUIRE(node.add_ref() == 2);
    CATCH_REQUIRE(node.dec_ref() == 1);
    CATCH_REQUIRE(node.dec_ref() == 0);
  };
  auto n1 = detail::NodeData<true>{detail::NodeType::Leaf, 0};
  auto n2 = detail::NodeData<false>{detail::NodeType::Leaf, 0};

  test_node(n1);
  test_node(n2);
}

CATCH_TEST_CASE("node_type", "[node_type]") {
  using NodeType = detail::NodeType;
  for (auto type : {NodeType::Branch, NodeType::Leaf, NodeType::Collision}) {
    detail::NodeData<true> node{type, 0xffffffffu, 0xffffffffu};
    CATCH_REQUIRE(node.type() == type);
    CATCH_REQUIRE(node.ref_count() == 1);
    node.add_ref(); // the type bits survive reference counting
    CATCH_REQUIRE(node.type() == type);
    CATCH_REQUIRE(node.payload_ == 0xffffffffu);
    CATCH_REQUIRE(node.hash_ == 0xffffffffu);
  }
}

template <typename T> void test_node_size() {
  using NodeType = detail::NodeType;
  {
    auto node = T::Branch::make_uninitialized(NodeType::Branch, 0, 0);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Branch);
    CATCH_REQUIRE(T::Branch::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Branch::dense_ptr_at(node, 0));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % alignof(void*) == 0);
    CATCH_REQUIRE(T::Branch::AlignOf == alignof(void*));
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Branch::free_node(node);
  }

  {
    auto node = T::Leaf::make_uninitialized(NodeType::Collision, 0, 0, 0x1234u);
    CATCH_REQUIRE(T::size(node) == 0);
    CATCH_REQUIRE(T::type(node) == NodeType::Collision);
    CATCH_REQUIRE(T::hash(node) == 0x1234u);
    CATCH_REQUIRE(T::Leaf::offset() >= sizeof(typename T::node_type));
    auto address_0 = std::bit_cast<uintptr_t>(T::Leaf::ptr_at(node, 0));
    CATCH_REQUIRE(address_0 >= std::bit_cast<uintptr_t>(node) + sizeof(typename T::node_type));
    CATCH_REQUIRE(address_0 % alignof(typename T::Leaf::item_type) == 0);
    CATCH_REQUIRE(T::ref_count(node) == 1);
    T::Leaf::free_node(node);
  }
}

template <typename T> void test_node_configuration() {
  test_node_size<detail::NodeOps<T, T, std::hash<T>, std::equal_to<T>, true>>();
  test_node_size<detail::NodeOps<T, T, std::hash<T>, std::equal_to<T>, false>>();
}

CATCH_TEST_CASE("node_configuration", "[node_configuration]") {
  test_node_configuration<char>();
  test_node_configuration<int16_t>();
  test_node_configuration<int32_t>();
  test_node_configuration<int64_t>();
  test_node_configuration<void*>();
  test_node_configuration<std::array<char, 22>>();

  struct alignas(1) Weird0 {
    char value[5];
  };

  struct alignas(2) Weird1 {
    char value[17];
  };

  struct alignas(16) Weird2 {
    int64_t a;
    char b;
  };

  test_node_configuration<Weird0>();
  test_node_configuration<Weird1>();
  test_node_configuration<Weird2>();
}

CATCH_TEST_CASE("node_construct_destruct", "[node_construct_destruct]") {
  uint32_t counter{0}; // Tracks how many times the constructor/destructor is called
  using Ops = detail::NodeOps<TracedItem, TracedItem, TracedItem::Hasher>;

  { // Constructor should be called 8 times, and same with destructor
    const TracedItem item{counter, 3};
    auto* node_ptr = Ops::Leaf::make_uninitialized(detail::NodeType::Collision, 4, 4);
    CATCH_REQUIRE(Ops::size(node_ptr) == 4);
    for (auto i = 0u; i < Ops::size(node_ptr); ++i) {
      new (Ops::Leaf::ptr_at(node_ptr, i)) Ops::item_type{item, item};
    }
    CATCH_REQUIRE(counter == 1 + 2 * Ops::size(node_ptr));
    Ops::dec_ref(node_ptr); // Calls destructor
    CATCH_REQUIRE(counter == 1);
  }
  CATCH_REQUIRE(counter == 0);

  Ops::destroy(nullptr); // should not crash
  Ops::dec_ref(nullptr);
}

CATCH_TEST_CASE("leaf_duplicate", "[leaf_duplicate]") {
  uint32_t counter{0};
  using Ops = detail::NodeOps<TracedItem, TracedItem, TracedItem::Hasher>;
  using NodeType = detail::NodeType;

  {
    const TracedItem a{counter, 1};
    const TracedItem b{counter, 2};
    const TracedItem c{counter, 3};
    auto* leaf = Ops::make_leaf(5u, a, a);
    auto* two = Ops::Leaf::copy_append(leaf, Ops::item_type{b, b}, NodeType::Collision);
    auto* triple = Ops::Leaf::copy_append(two, Ops::item_type{c, c}, NodeType::Collision);
    CATCH_REQUIRE(Ops::type(triple) == NodeType::Collision);
    CATCH_REQUIRE(Ops::size(triple) == 3);
    CATCH_REQUIRE(Ops::hash(triple) == 5u);
    CATCH_REQUIRE(Ops::get_index_in_leaf(triple, c) == 2);

    auto* without = Ops::Leaf::duplicate_without(triple, 1, NodeType::Collision);
    CATCH_REQUIRE(Ops::size(without) == 2);
    CATCH_REQUIRE(Ops::get_index_in_leaf(without, b) == detail::NotAnIndex);
    CATCH_REQUIRE(Ops::get_index_in_leaf(without, c) == 1);

    auto* overwritten = Ops::Leaf::duplicate_with_overwrite(without, 0, Ops::item_type{a, c});
    CATCH_REQUIRE(Ops::Leaf::dense_ptr_at(overwritten, 0)->second.value() == 3);
    CATCH_REQUIRE(Ops::Leaf::dense_ptr_at(without, 0)->second.value() == 1); // untouched

    for (auto* node : {leaf, two, triple, without, overwritten})
      Ops::dec_ref(node);
    CATCH_REQUIRE(counter == 3);
  }
  CATCH_REQUIRE(counter == 0);
}

} // namespace obsidian::test
