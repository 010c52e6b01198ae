
#include "test-helpers.hpp"

#include <map>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace obsidian::test {

using IntMap = persistent_map<int, int>;
using PlacedMap = persistent_map<PlacedKey, int, PlacedKey::Hasher>;
using TracedMap = persistent_map<TracedItem, TracedItem, TracedItem::Hasher>;
using VanillaMap = persistent_map<int, std::string, std::hash<int>, std::equal_to<int>, false>;

using IntOps = detail::NodeOps<int, int>;
using PlacedOps = detail::NodeOps<PlacedKey, int, PlacedKey::Hasher>;
using TracedOps = detail::NodeOps<TracedItem, TracedItem, TracedItem::Hasher>;
using VanillaOps = detail::NodeOps<int, std::string, std::hash<int>, std::equal_to<int>, false>;

namespace private_hack {
  template struct rob<MapRoot<IntMap>, &IntMap::get_root_>;
  template struct rob<MapRoot<PlacedMap>, &PlacedMap::get_root_>;
  template struct rob<MapRoot<TracedMap>, &TracedMap::get_root_>;
  template struct rob<MapRoot<VanillaMap>, &VanillaMap::get_root_>;
} // namespace private_hack

using private_hack::get_root;

template <typename Ops, typename Map> void check_map(const Map& map) {
  check_trie_invariants<Ops>(get_root(map), map.size());
  check_map_iterators(map);
}

CATCH_TEST_CASE("map_default_construct", "[map_default_construct]") {
  IntMap map;
  CATCH_REQUIRE(map.empty());
  CATCH_REQUIRE(map.size() == 0);
  CATCH_REQUIRE(map.begin() == map.end());
  CATCH_REQUIRE(map.find(1) == nullptr);
  CATCH_REQUIRE(!map.contains_key(1));
  CATCH_REQUIRE(map.count(1) == 0);
  CATCH_REQUIRE(!map.get_opt(1).has_value());
  CATCH_REQUIRE(map.minus(1).identical(map));
  CATCH_REQUIRE(map == IntMap{});
  CATCH_REQUIRE_THROWS_AS(map.at(1), std::out_of_range);
  check_map<IntOps>(map);
}

CATCH_TEST_CASE("map_plus_minus", "[map_plus_minus]") {
  const IntMap m0;
  const auto m1 = m0.plus(1, 10);
  const auto m2 = m1.plus(2, 20);
  const auto m3 = m2.plus(1, 11);

  CATCH_REQUIRE(m0.empty()); // earlier versions never change
  CATCH_REQUIRE(m1.size() == 1);
  CATCH_REQUIRE(m2.size() == 2);
  CATCH_REQUIRE(m3.size() == 2);
  CATCH_REQUIRE(m2.at(1) == 10);
  CATCH_REQUIRE(m3.at(1) == 11);
  CATCH_REQUIRE(m3[2] == 20);

  CATCH_REQUIRE(m3.plus(1, 11).identical(m3)); // same binding is a no-op
  CATCH_REQUIRE(m3.minus(99).identical(m3));   // so is removing an absent key

  const auto m4 = m3.minus(1);
  CATCH_REQUIRE(m4.size() == 1);
  CATCH_REQUIRE(!m4.contains_key(1));
  CATCH_REQUIRE(m3.contains_key(1));
  CATCH_REQUIRE(m4.minus(2).empty());

  for (const auto* map : {&m0, &m1, &m2, &m3, &m4})
    check_map<IntOps>(*map);
}

CATCH_TEST_CASE("map_copy_shares_root", "[map_copy_shares_root]") {
  const auto map = IntMap{}.plus(1, 1).plus(2, 2);
  CATCH_REQUIRE(IntOps::ref_count(get_root(map)) == 1);
  {
    auto copy = map;
    CATCH_REQUIRE(copy.identical(map));
    CATCH_REQUIRE(IntOps::ref_count(get_root(map)) == 2);

    auto other = IntMap{}.plus(3, 3);
    swap(copy, other);
    CATCH_REQUIRE(other.identical(map));
    CATCH_REQUIRE(copy.size() == 1);

    auto moved = std::move(other);
    CATCH_REQUIRE(moved.identical(map));
    CATCH_REQUIRE(IntOps::ref_count(get_root(map)) == 2);
  }
  CATCH_REQUIRE(IntOps::ref_count(get_root(map)) == 1);
}

CATCH_TEST_CASE("map_traced_items", "[map_traced_items]") {
  uint32_t counter{0};
  {
    TracedMap map;
    std::vector<TracedMap> versions;
    for (auto i = 0u; i < 100; ++i) {
      map = map.plus(TracedItem{counter, i}, TracedItem{counter, 2 * i});
      versions.push_back(map);
    }
    CATCH_REQUIRE(map.size() == 100);
    check_map<TracedOps>(map);

    for (auto i = 0u; i < 100; i += 2)
      map = map.minus(TracedItem{counter, i});
    CATCH_REQUIRE(map.size() == 50);
    check_map<TracedOps>(map);

    for (auto i = 0u; i < 100; ++i) {
      const TracedItem key{counter, i};
      CATCH_REQUIRE(map.contains_key(key) == (i % 2 == 1));
      CATCH_REQUIRE(versions.back().at(key).value() == 2 * i);
      CATCH_REQUIRE(versions[i].size() == i + 1);
    }

    // Overwriting keeps the size
    const auto overwritten = map.plus(TracedItem{counter, 1}, TracedItem{counter, 1000});
    CATCH_REQUIRE(overwritten.size() == map.size());
    CATCH_REQUIRE(overwritten.at(TracedItem{counter, 1}).value() == 1000);
    CATCH_REQUIRE(map.at(TracedItem{counter, 1}).value() == 2);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("map_split_and_hoist", "[map_split_and_hoist]") {
  using NodeType = detail::NodeType;
  const PlacedKey a{0x01u, 0}; // level 0 slot 1, level 1 slot 0
  const PlacedKey b{0x21u, 1}; // level 0 slot 1, level 1 slot 1
  const PlacedKey e{0x02u, 2}; // level 0 slot 2

  const auto only_a = PlacedMap{}.plus(a, 1);
  CATCH_REQUIRE(PlacedOps::type(get_root(only_a)) == NodeType::Leaf);

  const auto ab = only_a.plus(b, 2);
  {
    const auto* root = get_root(ab);
    CATCH_REQUIRE(PlacedOps::is_branch(root));
    CATCH_REQUIRE(PlacedOps::size(root) == 1);
    const auto* child = *PlacedOps::Branch::dense_ptr_at(root, 0);
    CATCH_REQUIRE(PlacedOps::is_branch(child));
    CATCH_REQUIRE(PlacedOps::size(child) == 2);
  }
  check_map<PlacedOps>(ab);
  dot_graph<PlacedOps>("obsidian_map_split.dot", get_root(ab));

  // Removing b leaves a single leaf, which moves all the way up to the root
  const auto back = ab.minus(b);
  CATCH_REQUIRE(PlacedOps::type(get_root(back)) == NodeType::Leaf);
  CATCH_REQUIRE(PlacedOps::hash(get_root(back)) == 0x01u);
  CATCH_REQUIRE(back == only_a);
  check_map<PlacedOps>(back);

  // A sibling branch is kept under a single-child root
  const auto abe = ab.plus(e, 3);
  CATCH_REQUIRE(PlacedOps::size(get_root(abe)) == 2);
  const auto ab_again = abe.minus(e);
  CATCH_REQUIRE(PlacedOps::size(get_root(ab_again)) == 1);
  CATCH_REQUIRE(ab_again == ab);
  check_map<PlacedOps>(abe);
  check_map<PlacedOps>(ab_again);

  CATCH_REQUIRE(ab.minus(a).minus(b).empty());
  CATCH_REQUIRE(get_root(ab.minus(a).minus(b)) == nullptr);
}

CATCH_TEST_CASE("map_collisions", "[map_collisions]") {
  using NodeType = detail::NodeType;
  const PlacedKey a{0x01u, 0};
  const PlacedKey c{0x01u, 1}; // same hash as a
  const PlacedKey d{0x01u, 2}; // and again
  const PlacedKey b{0x21u, 3};

  const auto a_only = PlacedMap{}.plus(a, 1);
  const auto ac = a_only.plus(c, 2);
  CATCH_REQUIRE(ac.size() == 2);
  CATCH_REQUIRE(PlacedOps::type(get_root(ac)) == NodeType::Collision);
  CATCH_REQUIRE(PlacedOps::size(get_root(ac)) == 2);
  CATCH_REQUIRE(ac.at(a) == 1);
  CATCH_REQUIRE(ac.at(c) == 2);
  CATCH_REQUIRE(!ac.contains_key(d));
  check_map<PlacedOps>(ac);

  const auto acd = ac.plus(d, 3).plus(c, 20);
  CATCH_REQUIRE(acd.size() == 3);
  CATCH_REQUIRE(acd.at(c) == 20);
  CATCH_REQUIRE(ac.at(c) == 2);
  check_map<PlacedOps>(acd);

  // A collision splits against a leaf like any other leaf
  const auto abcd = acd.plus(b, 4);
  CATCH_REQUIRE(abcd.size() == 4);
  check_map<PlacedOps>(abcd);
  dot_graph<PlacedOps>("obsidian_map_collision.dot", get_root(abcd));

  // Removal demotes to a leaf once one entry remains
  const auto ad = acd.minus(c);
  CATCH_REQUIRE(PlacedOps::type(get_root(ad)) == NodeType::Collision);
  const auto d_only = ad.minus(a);
  CATCH_REQUIRE(PlacedOps::type(get_root(d_only)) == NodeType::Leaf);
  CATCH_REQUIRE(d_only.at(d) == 3);
  check_map<PlacedOps>(d_only);

  // And the collision hoists to the root once b is removed
  const auto hoisted = abcd.minus(b);
  CATCH_REQUIRE(PlacedOps::type(get_root(hoisted)) == NodeType::Collision);
  CATCH_REQUIRE(hoisted == acd);
}

CATCH_TEST_CASE("map_deepest_split", "[map_deepest_split]") {
  using NodeType = detail::NodeType;
  const PlacedKey a{0x00000001u, 0};
  const PlacedKey d{0x40000001u, 1}; // differs from a only in the last level

  const auto ad = PlacedMap{}.plus(a, 1).plus(d, 2);
  const auto path = PlacedOps::make_path(get_root(ad), 0x01u);
  CATCH_REQUIRE(path.size == detail::MaxTrieDepth);
  CATCH_REQUIRE(path.leaf_end != nullptr);
  CATCH_REQUIRE(PlacedOps::hash(path.leaf_end) == 0x01u);
  CATCH_REQUIRE(PlacedOps::size(path.nodes[detail::MaxTrieDepth - 1]) == 2);
  check_map<PlacedOps>(ad);

  const auto a_only = ad.minus(d);
  CATCH_REQUIRE(PlacedOps::type(get_root(a_only)) == NodeType::Leaf);
  check_map<PlacedOps>(a_only);
}

// Deep merges, branch growth and path copies each hand fresh nodes up the path
CATCH_TEST_CASE("map_deep_paths_release_values", "[map_deep_paths_release_values]") {
  using DeepMap = persistent_map<PlacedKey, TracedItem, PlacedKey::Hasher>;
  const PlacedKey a{0x00000001u, 0};
  const PlacedKey b{0x00000021u, 1}; // shares the first level with a
  const PlacedKey d{0x40000001u, 2}; // differs from a only in the last level

  uint32_t counter{0};
  {
    const auto ad = DeepMap{}.plus(a, TracedItem{counter, 1}).plus(d, TracedItem{counter, 2});
    CATCH_REQUIRE(counter == 2);
    const auto abd = ad.plus(b, TracedItem{counter, 3});
    CATCH_REQUIRE(counter == 3);
    const auto updated = abd.plus(d, TracedItem{counter, 4});
    CATCH_REQUIRE(counter == 4);
    CATCH_REQUIRE(updated.at(d).value() == 4);
    CATCH_REQUIRE(abd.at(d).value() == 2);

    const auto without_a = updated.minus(a);
    CATCH_REQUIRE(without_a.size() == 2);
    CATCH_REQUIRE(counter == 4);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("map_iterators", "[map_iterators]") {
  IntMap map;
  for (auto i = 0; i < 1000; ++i)
    map = map.plus(i, -i);
  check_map<IntOps>(map);

  std::set<int> keys;
  for (const auto& [key, value] : map) {
    CATCH_REQUIRE(value == -key);
    keys.insert(key);
  }
  CATCH_REQUIRE(keys.size() == 1000);
  CATCH_REQUIRE(*keys.begin() == 0);
  CATCH_REQUIRE(*keys.rbegin() == 999);

  auto ii = map.begin();
  const auto first = *ii;
  ++ii;
  --ii;
  CATCH_REQUIRE(*ii == first);

  // Iterators outlive the map they came from, as long as the trie is shared
  IntMap::const_iterator position;
  {
    const auto copy = map;
    position = copy.begin();
  }
  CATCH_REQUIRE(*position == first);
}

CATCH_TEST_CASE("map_randomized", "[map_randomized]") {
  std::mt19937 random{42};
  std::uniform_int_distribution<int> key_dist{0, 499};
  std::uniform_int_distribution<int> op_dist{0, 2};

  IntMap map;
  std::unordered_map<int, int> expected;
  std::vector<std::pair<IntMap, std::unordered_map<int, int>>> snapshots;

  auto check_same = [](const IntMap& map, const std::unordered_map<int, int>& expected) {
    CATCH_REQUIRE(map.size() == expected.size());
    for (const auto& [key, value] : expected) {
      const auto* found = map.find(key);
      CATCH_REQUIRE(found != nullptr);
      CATCH_REQUIRE(*found == value);
    }
  };

  for (auto i = 0; i < 5000; ++i) {
    const auto key = key_dist(random);
    if (op_dist(random) == 0) {
      map = map.minus(key);
      expected.erase(key);
    } else {
      map = map.plus(key, i);
      expected.insert_or_assign(key, i);
    }
    CATCH_REQUIRE(map.size() == expected.size());
    if (i % 1000 == 999) {
      check_same(map, expected);
      check_map<IntOps>(map);
      snapshots.emplace_back(map, expected);
    }
  }

  for (const auto& [snapshot, snapshot_expected] : snapshots)
    check_same(snapshot, snapshot_expected);
}

CATCH_TEST_CASE("map_null_keys_and_values", "[map_null_keys_and_values]") {
  using SharedMap = persistent_map<std::shared_ptr<int>, int>;
  const auto key = std::make_shared<int>(1);
  const auto map = SharedMap{}.plus(key, 1);
  CATCH_REQUIRE_THROWS_AS(map.plus(nullptr, 2), null_argument_error);
  const std::vector<SharedMap::item_type> items{{key, 1}, {nullptr, 2}};
  CATCH_REQUIRE_THROWS_AS(SharedMap(items.begin(), items.end()), null_argument_error);
  CATCH_REQUIRE(!map.contains_key(nullptr));
  CATCH_REQUIRE(map.minus(nullptr).identical(map));
  CATCH_REQUIRE(map.at(key) == 1);

  // Values may be null
  int value = 3;
  using PointerMap = persistent_map<int, int*>;
  const auto pointers = PointerMap{}.plus(1, nullptr).plus(2, &value);
  CATCH_REQUIRE(pointers.size() == 2);
  CATCH_REQUIRE(pointers.find(1) != nullptr);
  CATCH_REQUIRE(*pointers.find(1) == nullptr);
  CATCH_REQUIRE(*pointers.at(2) == 3);
  CATCH_REQUIRE(pointers.plus(1, nullptr).identical(pointers));
}

CATCH_TEST_CASE("map_equality", "[map_equality]") {
  IntMap forwards;
  IntMap backwards;
  for (auto i = 0; i < 100; ++i) {
    forwards = forwards.plus(i, i);
    backwards = backwards.plus(99 - i, 99 - i);
  }
  CATCH_REQUIRE(!forwards.identical(backwards));
  CATCH_REQUIRE(forwards == backwards);
  CATCH_REQUIRE(forwards != backwards.plus(5, 6));
  CATCH_REQUIRE(forwards != backwards.minus(5));
  CATCH_REQUIRE(forwards.minus(5) != backwards.minus(6));
  CATCH_REQUIRE((IntMap{{1, 2}, {3, 4}} == IntMap{{3, 4}, {1, 2}}));
}

CATCH_TEST_CASE("map_lookup", "[map_lookup]") {
  const IntMap map{{1, 10}, {2, 20}, {3, 30}};
  CATCH_REQUIRE(map.size() == 3);
  CATCH_REQUIRE(map.get_opt(2) == std::optional<int>{20});
  CATCH_REQUIRE(!map.get_opt(4).has_value());
  CATCH_REQUIRE(map.count(3) == 1);
  CATCH_REQUIRE(map.count(4) == 0);
  CATCH_REQUIRE(map.find_entry(1)->first == 1);
  CATCH_REQUIRE(map.find_entry(1)->second == 10);
  CATCH_REQUIRE(map.find_entry(4) == nullptr);
  CATCH_REQUIRE_THROWS_AS(map.at(4), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(map[4], std::out_of_range);
  CATCH_REQUIRE(&map.entry_set() == &map);

  int key_sum = 0;
  int value_sum = 0;
  map.for_each([&](int key, int value) {
    key_sum += key;
    value_sum += value;
  });
  CATCH_REQUIRE(key_sum == 6);
  CATCH_REQUIRE(value_sum == 60);

  // Later entries win on construction
  const IntMap repeated{{1, 1}, {1, 2}};
  CATCH_REQUIRE(repeated.size() == 1);
  CATCH_REQUIRE(repeated.at(1) == 2);
}

CATCH_TEST_CASE("map_plus_all_minus_all", "[map_plus_all_minus_all]") {
  const IntMap map{{1, 10}, {2, 20}};
  const auto more = map.plus_all({{3, 30}, {1, 11}});
  CATCH_REQUIRE(more.size() == 3);
  CATCH_REQUIRE(more.at(1) == 11);

  const std::vector<std::pair<int, int>> extra{{4, 40}, {5, 50}};
  CATCH_REQUIRE(more.plus_all(extra).size() == 5);
  CATCH_REQUIRE(more.plus_all(std::vector<std::pair<int, int>>{}).identical(more));

  CATCH_REQUIRE(more.minus_all({1, 3}) == IntMap{{2, 20}});
  CATCH_REQUIRE(more.minus_all(std::vector<int>{7, 8}).identical(more));
  CATCH_REQUIRE(more.minus_all(std::set<int>{1, 2, 3}).empty());
}

CATCH_TEST_CASE("map_not_thread_safe", "[map_not_thread_safe]") {
  static_assert(!VanillaMap::is_thread_safe);
  VanillaMap map;
  for (auto i = 0; i < 200; ++i)
    map = map.plus(i, std::to_string(i));
  check_map<VanillaOps>(map);
  CATCH_REQUIRE(map.at(150) == "150");
  const auto copy = map;
  CATCH_REQUIRE(VanillaOps::ref_count(get_root(map)) == 2);
  CATCH_REQUIRE(copy.minus(150).size() == 199);
  CATCH_REQUIRE(map.size() == 200);
}

} // namespace obsidian::test
