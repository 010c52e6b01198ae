
#include "test-helpers.hpp"

#include <random>
#include <set>
#include <string>
#include <unordered_set>
#include <vector>

namespace obsidian::test {

using IntSet = persistent_set<int>;
using PlacedSet = persistent_set<PlacedKey, PlacedKey::Hasher>;
using TracedSet = persistent_set<TracedItem, TracedItem::Hasher>;

using IntSetMap = persistent_map<int, detail::Present>;
using PlacedSetMap = persistent_map<PlacedKey, detail::Present, PlacedKey::Hasher>;
using TracedSetMap = persistent_map<TracedItem, detail::Present, TracedItem::Hasher>;

using IntSetOps = detail::NodeOps<int, detail::Present>;
using PlacedSetOps = detail::NodeOps<PlacedKey, detail::Present, PlacedKey::Hasher>;
using TracedSetOps = detail::NodeOps<TracedItem, detail::Present, TracedItem::Hasher>;

namespace private_hack {
  template struct rob<SetMap<IntSet>, &IntSet::map_>;
  template struct rob<SetMap<PlacedSet>, &PlacedSet::map_>;
  template struct rob<SetMap<TracedSet>, &TracedSet::map_>;
  template struct rob<MapRoot<IntSetMap>, &IntSetMap::get_root_>;
  template struct rob<MapRoot<PlacedSetMap>, &PlacedSetMap::get_root_>;
  template struct rob<MapRoot<TracedSetMap>, &TracedSetMap::get_root_>;
} // namespace private_hack

using private_hack::get_set_root;

template <typename Ops, typename Set> void check_set(const Set& set) {
  check_trie_invariants<Ops>(get_set_root(set), set.size());

  std::size_t counter = 0;
  for (auto ii = set.begin(); ii != set.end(); ++ii) {
    CATCH_REQUIRE(set.contains(*ii));
    CATCH_REQUIRE(set.find(*ii) == &*ii); // the stored element itself
    ++counter;
  }
  CATCH_REQUIRE(counter == set.size());

  counter = 0;
  for (auto ii = set.end(); ii != set.begin();) {
    --ii;
    CATCH_REQUIRE(set.contains(*ii));
    ++counter;
  }
  CATCH_REQUIRE(counter == set.size());
}

CATCH_TEST_CASE("set_default_construct", "[set_default_construct]") {
  IntSet set;
  CATCH_REQUIRE(set.empty());
  CATCH_REQUIRE(set.size() == 0);
  CATCH_REQUIRE(set.begin() == set.end());
  CATCH_REQUIRE(!set.contains(0));
  CATCH_REQUIRE(set.find(0) == nullptr);
  CATCH_REQUIRE(set.minus(0).identical(set));
  CATCH_REQUIRE(get_set_root(set) == nullptr);
}

CATCH_TEST_CASE("set_plus_minus", "[set_plus_minus]") {
  const IntSet s0;
  const auto s1 = s0.plus(1);
  const auto s2 = s1.plus(2);
  CATCH_REQUIRE(s0.empty());
  CATCH_REQUIRE(s1.size() == 1);
  CATCH_REQUIRE(s2.size() == 2);
  CATCH_REQUIRE(s2.contains(1));
  CATCH_REQUIRE(s2.count(2) == 1);
  CATCH_REQUIRE(!s1.contains(2));

  CATCH_REQUIRE(s2.plus(1).identical(s2));
  CATCH_REQUIRE(s2.minus(3).identical(s2));

  const auto s3 = s2.minus(1);
  CATCH_REQUIRE(s3.size() == 1);
  CATCH_REQUIRE(!s3.contains(1));
  CATCH_REQUIRE(s2.contains(1));
  CATCH_REQUIRE(s3.minus(2).empty());

  check_set<IntSetOps>(s2);
  check_set<IntSetOps>(s3);
}

CATCH_TEST_CASE("set_traced_items", "[set_traced_items]") {
  uint32_t counter{0};
  {
    TracedSet set;
    for (auto i = 0u; i < 200; ++i)
      set = set.plus(TracedItem{counter, i});
    CATCH_REQUIRE(set.size() == 200);
    CATCH_REQUIRE(counter == 200);
    check_set<TracedSetOps>(set);

    const auto same = set.minus_all(std::vector<TracedItem>{}).plus(TracedItem{counter, 0});
    CATCH_REQUIRE(same.identical(set));

    auto smaller = set;
    for (auto i = 0u; i < 200; i += 2)
      smaller = smaller.minus(TracedItem{counter, i});
    CATCH_REQUIRE(smaller.size() == 100);
    check_set<TracedSetOps>(smaller);

    for (auto i = 0u; i < 200; ++i) {
      const TracedItem item{counter, i};
      CATCH_REQUIRE(set.contains(item));
      CATCH_REQUIRE(smaller.contains(item) == (i % 2 == 1));
    }
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("set_collisions", "[set_collisions]") {
  using NodeType = detail::NodeType;
  const PlacedKey a{0x7u, 0};
  const PlacedKey b{0x7u, 1};
  const PlacedKey c{0x27u, 2};

  const auto ab = PlacedSet{a, b};
  CATCH_REQUIRE(ab.size() == 2);
  CATCH_REQUIRE(PlacedSetOps::type(get_set_root(ab)) == NodeType::Collision);
  check_set<PlacedSetOps>(ab);

  const auto abc = ab.plus(c);
  CATCH_REQUIRE(abc.size() == 3);
  check_set<PlacedSetOps>(abc);

  const auto ac = abc.minus(b);
  CATCH_REQUIRE(ac.size() == 2);
  CATCH_REQUIRE(ac.contains(a));
  CATCH_REQUIRE(!ac.contains(b));
  check_set<PlacedSetOps>(ac);

  const auto c_only = ac.minus(a);
  CATCH_REQUIRE(PlacedSetOps::type(get_set_root(c_only)) == NodeType::Leaf);
  CATCH_REQUIRE(PlacedSetOps::hash(get_set_root(c_only)) == 0x27u);
}

CATCH_TEST_CASE("set_randomized", "[set_randomized]") {
  std::mt19937 random{7};
  std::uniform_int_distribution<int> value_dist{0, 999};

  IntSet set;
  std::unordered_set<int> expected;
  for (auto i = 0; i < 4000; ++i) {
    const auto value = value_dist(random);
    if (i % 3 == 0) {
      set = set.minus(value);
      expected.erase(value);
    } else {
      set = set.plus(value);
      expected.insert(value);
    }
    CATCH_REQUIRE(set.size() == expected.size());
  }

  check_set<IntSetOps>(set);
  for (auto value = 0; value < 1000; ++value)
    CATCH_REQUIRE(set.contains(value) == (expected.count(value) == 1));

  const std::set<int> from_iteration(set.begin(), set.end());
  CATCH_REQUIRE(from_iteration.size() == set.size());
}

CATCH_TEST_CASE("set_equality", "[set_equality]") {
  const IntSet lhs{1, 2, 3, 4};
  const IntSet rhs{4, 3, 2, 1};
  CATCH_REQUIRE(lhs == rhs);
  CATCH_REQUIRE(!lhs.identical(rhs));
  CATCH_REQUIRE(lhs != rhs.minus(4));
  CATCH_REQUIRE(lhs != rhs.minus(4).plus(5));
  CATCH_REQUIRE(IntSet{} == IntSet{});
  CATCH_REQUIRE((IntSet{1, 1, 1} == IntSet{1}));
}

CATCH_TEST_CASE("set_plus_all_minus_all", "[set_plus_all_minus_all]") {
  const IntSet set{1, 2, 3};
  CATCH_REQUIRE(set.plus_all({1, 2}).identical(set));
  CATCH_REQUIRE(set.minus_all({7, 8}).identical(set));
  CATCH_REQUIRE((set.plus_all({4, 5}) == IntSet{1, 2, 3, 4, 5}));
  CATCH_REQUIRE((set.minus_all(std::vector<int>{1, 3}) == IntSet{2}));
  CATCH_REQUIRE(set.minus_all(set).empty());

  int sum = 0;
  set.for_each([&sum](int value) { sum += value; });
  CATCH_REQUIRE(sum == 6);
}

CATCH_TEST_CASE("set_null_elements", "[set_null_elements]") {
  int x = 1;
  int y = 2;
  using PointerSet = persistent_set<int*>;
  const auto set = PointerSet{}.plus(&x);
  CATCH_REQUIRE_THROWS_AS(set.plus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(set.plus_all(std::vector<int*>{&y, nullptr}), null_argument_error);
  CATCH_REQUIRE(set.size() == 1); // unchanged
  CATCH_REQUIRE(!set.contains(nullptr));
  CATCH_REQUIRE(set.minus(nullptr).identical(set));
  CATCH_REQUIRE(set.plus(&y).contains(&y));
}

CATCH_TEST_CASE("set_strings", "[set_strings]") {
  using StringSet = persistent_set<std::string>;
  StringSet set;
  for (auto i = 0; i < 500; ++i)
    set = set.plus(std::to_string(i));
  CATCH_REQUIRE(set.size() == 500);
  CATCH_REQUIRE(set.contains("42"));
  CATCH_REQUIRE(!set.contains("500"));
  CATCH_REQUIRE(*set.find("499") == "499");
}

} // namespace obsidian::test
