
#pragma once

#include <catch2/catch.hpp>

#include "obsidian/persistent-map.hpp"
#include "obsidian/persistent-set.hpp"

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace obsidian::test {

// -------------------------------------------------------------------------------------- TracedItem

/**
 * Counts live instances in `counter`, so tests can check that every element copied into a
 * collection is destroyed again once all versions are gone.
 */
class TracedItem {
private:
  uint32_t& counter_;
  std::size_t value_{0};

public:
  explicit TracedItem(uint32_t& counter) : TracedItem(counter, 0) {}
  TracedItem(uint32_t& counter, std::size_t value) : counter_{counter}, value_{value} {
    counter_++;
  }
  TracedItem(const TracedItem& o) : counter_{o.counter_}, value_{o.value_} { counter_++; }
  TracedItem(TracedItem&&) = delete;
  ~TracedItem() { counter_--; };
  TracedItem& operator=(const TracedItem&) = delete;
  TracedItem& operator=(TracedItem&&) = delete;
  std::size_t value() const { return value_; }
  bool operator==(const TracedItem& o) const { return o.value() == value(); }

  struct Hasher {
    std::size_t operator()(const TracedItem& item) const {
      return static_cast<std::size_t>(item.value() & static_cast<std::size_t>(0xffffffffu));
    }
  };
};

// --------------------------------------------------------------------------------------- PlacedKey

/**
 * x * inverse(x) == 1 (mod 2^32), for odd x. Newton's iteration doubles the correct bits.
 */
constexpr uint32_t multiplicative_inverse(uint32_t x) {
  uint32_t y = x; // correct to 3 bits
  for (auto i = 0; i < 5; ++i)
    y *= 2u - x * y;
  return y;
}

/**
 * Inverse of `detail::mix`
 */
constexpr uint32_t unmix(uint32_t h) {
  h ^= h >> 16;
  h *= multiplicative_inverse(0xc2b2ae35u);
  h ^= (h >> 13) ^ (h >> 26);
  h *= multiplicative_inverse(0x85ebca6bu);
  h ^= h >> 16;
  return h;
}

static_assert(multiplicative_inverse(0x85ebca6bu) * 0x85ebca6bu == 1u);
static_assert(detail::mix(unmix(0xdeadbeefu)) == 0xdeadbeefu);
static_assert(unmix(detail::mix(12345u)) == 12345u);

/**
 * A key whose mixed hash is exactly `hash`, for building tries of a known shape
 */
struct PlacedKey {
  uint32_t hash{0}; // where the key lands in the trie
  uint32_t id{0};   // tells apart keys that share a hash
  bool operator==(const PlacedKey&) const = default;

  struct Hasher {
    std::size_t operator()(const PlacedKey& key) const { return unmix(key.hash); }
  };
};

// ------------------------------------------------------------------------------------ private_hack

/**
 * Reads the private root of a map (or of the map inside a set) without befriending tests.
 * Each type needs one `template struct rob<...>` instantiation, in a single test file.
 */
namespace private_hack {
  template <typename Tag> struct result {
    using type = typename Tag::type;
    static type ptr;
  };
  template <typename Tag> typename result<Tag>::type result<Tag>::ptr;

  template <typename Tag, typename Tag::type p> struct rob : result<Tag> {
    struct filler {
      filler() { result<Tag>::ptr = p; }
    };
    static filler filler_obj;
  };
  template <typename Tag, typename Tag::type p>
  typename rob<Tag, p>::filler rob<Tag, p>::filler_obj;

  template <typename Map> struct MapRoot {
    using type = const detail::NodeData<Map::is_thread_safe>* (Map::*)() const;
  };

  template <typename Set> struct SetMap {
    using type = persistent_map<typename Set::item_type, detail::Present, typename Set::hasher,
                                typename Set::key_equal, Set::is_thread_safe> Set::*;
  };

  template <typename Map> auto get_root(const Map& map) {
    return (map.*result<MapRoot<Map>>::ptr)();
  }

  template <typename Set> auto get_set_root(const Set& set) {
    return get_root(set.*result<SetMap<Set>>::ptr);
  }
} // namespace private_hack

// -------------------------------------------------------------------------------------- Inspection

template <typename NodeOps, typename Function>
void for_each_node(typename NodeOps::node_const_ptr_type node, Function f) {
  if (node == nullptr)
    return; // empty
  f(node);
  if (NodeOps::is_branch(node)) {
    for (auto* iterator = NodeOps::Branch::begin(node); iterator != NodeOps::Branch::end(node);
         ++iterator) {
      for_each_node<NodeOps>(*iterator, f);
    }
  }
}

/**
 * Writes the shape of the trie as a graphviz file, named `filename` in the temp directory
 */
template <typename NodeOps>
void dot_graph(const std::string& filename, typename NodeOps::node_const_ptr_type root) {
  if (root == nullptr)
    return;

  using NodeType = detail::NodeType;
  auto node_name = [](typename NodeOps::node_const_ptr_type node) -> std::string {
    const auto type = NodeOps::type(node);
    const char tag = (type == NodeType::Branch) ? 'B' : (type == NodeType::Leaf) ? 'L' : 'C';
    return fmt::format("{:c}0x{:08x}{}", tag, reinterpret_cast<uintptr_t>(node),
                       (type == NodeType::Branch) ? std::string{""}
                                                  : fmt::format("sz_{}", NodeOps::size(node)));
  };

  std::ofstream out{std::filesystem::temp_directory_path() / filename};
  out << "digraph {\n";
  for_each_node<NodeOps>(root, [&](typename NodeOps::node_const_ptr_type node) {
    if (NodeOps::is_branch(node)) {
      for (auto i = 0u; i < detail::BranchFactor; ++i) {
        if (NodeOps::Branch::is_valid_index(node, i)) {
          auto* other = *NodeOps::Branch::ptr_at(node, i);
          out << fmt::format("   {} -> {}[label=\"{}\"]\n", node_name(node), node_name(other), i);
        }
      }
    }
  });
  if (!NodeOps::is_branch(root)) {
    out << fmt::format("   {}\n", node_name(root));
  }
  out << "}\n";
}

template <typename NodeOps>
void check_leaf_invariants(typename NodeOps::node_const_ptr_type leaf) {
  using NodeType = detail::NodeType;
  const auto size = NodeOps::size(leaf);
  if (NodeOps::type(leaf) == NodeType::Leaf) {
    CATCH_REQUIRE(size == 1);
  } else {
    CATCH_REQUIRE(NodeOps::type(leaf) == NodeType::Collision);
    CATCH_REQUIRE(size >= 2); // otherwise it should have been demoted to a Leaf
  }

  const auto* items = NodeOps::Leaf::begin(leaf);
  for (auto i = 0u; i < size; ++i) {
    CATCH_REQUIRE(NodeOps::calculate_hash(items[i].first) == NodeOps::hash(leaf));
    for (auto j = i + 1; j < size; ++j) // No two keys are equal
      CATCH_REQUIRE(!NodeOps::calculate_equals(items[i].first, items[j].first));
  }
}

/**
 * Checks every structural invariant of the trie at `root`, and that it holds `expected_size`
 * entries
 */
template <typename NodeOps>
void check_trie_invariants(typename NodeOps::node_const_ptr_type root,
                           std::size_t expected_size) {
  using node_ptr = typename NodeOps::node_const_ptr_type;
  std::size_t entry_count = 0;

  auto check_leaf = [root, &entry_count](node_ptr leaf) {
    // 1. Check leaf invariants
    check_leaf_invariants<NodeOps>(leaf);
    entry_count += NodeOps::size(leaf);

    // 2. The path to the leaf follows its hash
    const auto hash = NodeOps::hash(leaf);
    const auto path = NodeOps::make_path(root, hash);
    CATCH_REQUIRE(path.leaf_end == leaf);
    for (auto i = 0u; i < path.size; ++i) {
      const auto* branch = path.nodes[i];
      const void* next_node = (i + 1 == path.size) ? path.leaf_end : path.nodes[i + 1];
      const auto sparse_index = detail::mask(hash, i * detail::HashBits);
      CATCH_REQUIRE(NodeOps::is_branch(branch));
      CATCH_REQUIRE(NodeOps::Branch::is_valid_index(branch, sparse_index));
      CATCH_REQUIRE(*NodeOps::Branch::ptr_at(branch, sparse_index) == next_node);
    }
  };

  // If a branch node has a single child, it must be another branch node
  for_each_node<NodeOps>(root, [&check_leaf](node_ptr node) {
    if (!NodeOps::is_branch(node)) {
      check_leaf(node);
      return;
    }
    CATCH_REQUIRE(NodeOps::size(node) > 0);
    if (NodeOps::size(node) == 1) {
      node_ptr child = *NodeOps::Branch::dense_ptr_at(node, 0);
      CATCH_REQUIRE(NodeOps::is_branch(child));
    }
  });

  CATCH_REQUIRE(entry_count == expected_size);
}

/**
 * Walks `map` forwards and backwards, checking each entry can be found again
 */
template <typename Map> void check_map_iterators(const Map& map) {
  auto check_entry = [&map](const auto& entry) {
    const auto* value = map.find(entry.first);
    CATCH_REQUIRE(value != nullptr);
    CATCH_REQUIRE(*value == entry.second);
  };

  {
    std::size_t counter = 0;
    for (auto ii = map.cbegin(); ii != map.cend(); ++ii) {
      check_entry(*ii);
      ++counter;
    }
    CATCH_REQUIRE(counter == map.size());
  }

  {
    std::size_t counter = 0;
    for (auto ii = map.end(); ii != map.begin();) {
      --ii;
      check_entry(*ii);
      ++counter;
    }
    CATCH_REQUIRE(counter == map.size());
  }

  { // Test postincrement
    std::size_t counter = 0;
    for (auto ii = map.cbegin(); ii != map.cend();) {
      check_entry(*ii++);
      ++counter;
    }
    CATCH_REQUIRE(counter == map.size());
  }

  { // Should be able to move beyond the end, without effect
    auto end = map.cend();
    ++end;
    CATCH_REQUIRE(end == map.cend());
  }

  { // Before the start is the end
    auto start = map.cbegin();
    --start;
    CATCH_REQUIRE(start == map.cend());
  }
}

} // namespace obsidian::test
