
#include "test-helpers.hpp"

#include "obsidian/sorted-map.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace obsidian::test {

using IntMap = sorted_map<int, std::string>;

template <typename Range> static std::vector<int> range_keys(const Range& range) {
  std::vector<int> out;
  for (const auto& [key, value] : range)
    out.push_back(key);
  return out;
}

static IntMap decades() { return IntMap{{10, "a"}, {20, "b"}, {30, "c"}, {40, "d"}}; }

CATCH_TEST_CASE("sorted_map_empty", "[sorted_map_empty]") {
  const IntMap map;
  CATCH_REQUIRE(map.empty());
  CATCH_REQUIRE(map.size() == 0);
  CATCH_REQUIRE(map.begin() == map.end());
  CATCH_REQUIRE(map.find(1) == nullptr);
  CATCH_REQUIRE(!map.get_opt(1).has_value());
  CATCH_REQUIRE(map.first_entry() == nullptr);
  CATCH_REQUIRE(map.last_entry() == nullptr);
  CATCH_REQUIRE(map.floor_key(1) == nullptr);
  CATCH_REQUIRE(map.minus(1).identical(map));
  CATCH_REQUIRE_THROWS_AS(map.first_key(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(map.last_key(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(map.at(1), std::out_of_range);
  CATCH_REQUIRE(map.sub_map(0, 100).empty());
}

CATCH_TEST_CASE("sorted_map_lookup", "[sorted_map_lookup]") {
  const auto map = decades();
  CATCH_REQUIRE(map.size() == 4);
  CATCH_REQUIRE(*map.find(20) == "b");
  CATCH_REQUIRE(map.find(25) == nullptr);
  CATCH_REQUIRE(map.find_entry(30)->first == 30);
  CATCH_REQUIRE(map.get_opt(40).value() == "d");
  CATCH_REQUIRE(map.at(10) == "a");
  CATCH_REQUIRE(map[30] == "c");
  CATCH_REQUIRE(map.contains_key(10));
  CATCH_REQUIRE(!map.contains_key(11));
  CATCH_REQUIRE(map.count(40) == 1);
  CATCH_REQUIRE_THROWS_AS(map.at(50), std::out_of_range);
  CATCH_REQUIRE(range_keys(map) == std::vector<int>{10, 20, 30, 40});

  std::string joined;
  map.for_each([&joined](int, const std::string& value) { joined += value; });
  CATCH_REQUIRE(joined == "abcd");
}

CATCH_TEST_CASE("sorted_map_navigation", "[sorted_map_navigation]") {
  const auto map = decades();
  CATCH_REQUIRE(map.first_key() == 10);
  CATCH_REQUIRE(map.last_key() == 40);
  CATCH_REQUIRE(map.first_entry()->second == "a");
  CATCH_REQUIRE(map.last_entry()->second == "d");

  CATCH_REQUIRE(*map.floor_key(25) == 20);
  CATCH_REQUIRE(*map.floor_key(20) == 20);
  CATCH_REQUIRE(map.floor_key(5) == nullptr);
  CATCH_REQUIRE(*map.ceiling_key(25) == 30);
  CATCH_REQUIRE(*map.ceiling_key(30) == 30);
  CATCH_REQUIRE(map.ceiling_key(45) == nullptr);
  CATCH_REQUIRE(*map.lower_key(20) == 10);
  CATCH_REQUIRE(map.lower_key(10) == nullptr);
  CATCH_REQUIRE(*map.higher_key(20) == 30);
  CATCH_REQUIRE(map.higher_key(40) == nullptr);

  CATCH_REQUIRE(map.floor_entry(35)->second == "c");
  CATCH_REQUIRE(map.ceiling_entry(11)->second == "b");
  CATCH_REQUIRE(map.lower_entry(41)->second == "d");
  CATCH_REQUIRE(map.higher_entry(9)->second == "a");
}

CATCH_TEST_CASE("sorted_map_ranges", "[sorted_map_ranges]") {
  const auto map = decades();

  CATCH_REQUIRE(range_keys(map.sub_map(20, 40)) == std::vector<int>{20, 30});
  CATCH_REQUIRE(range_keys(map.sub_map(20, true, 40, true)) == std::vector<int>{20, 30, 40});
  CATCH_REQUIRE(range_keys(map.sub_map(20, false, 40, false)) == std::vector<int>{30});
  CATCH_REQUIRE(range_keys(map.sub_map(15, 35)) == std::vector<int>{20, 30});
  CATCH_REQUIRE(map.sub_map(20, 20).empty());
  CATCH_REQUIRE(map.sub_map(20, false, 20, false).empty());
  CATCH_REQUIRE(map.sub_map(40, false, 40, false).empty());
  CATCH_REQUIRE(map.sub_map(20, true, 20, true).size() == 1);
  CATCH_REQUIRE_THROWS_AS(map.sub_map(30, 20), std::invalid_argument);

  CATCH_REQUIRE(range_keys(map.head_map(30)) == std::vector<int>{10, 20});
  CATCH_REQUIRE(range_keys(map.head_map(30, true)) == std::vector<int>{10, 20, 30});
  CATCH_REQUIRE(range_keys(map.tail_map(30)) == std::vector<int>{30, 40});
  CATCH_REQUIRE(range_keys(map.tail_map(30, false)) == std::vector<int>{40});
  CATCH_REQUIRE(map.tail_map(50).empty());

  const auto middle = map.sub_map(15, 45);
  CATCH_REQUIRE(middle.size() == 3);
  CATCH_REQUIRE(middle.front().first == 20);
  CATCH_REQUIRE(middle.back().first == 40);
  CATCH_REQUIRE(middle.rbegin()->first == 40);
  CATCH_REQUIRE_THROWS_AS(map.sub_map(11, 12).front(), std::out_of_range);
}

CATCH_TEST_CASE("sorted_map_range_outlives_map", "[sorted_map_range_outlives_map]") {
  auto map = std::make_unique<IntMap>(decades());
  const auto range = map->tail_map(20);
  map.reset();
  CATCH_REQUIRE(range_keys(range) == std::vector<int>{20, 30, 40});
  CATCH_REQUIRE(range.back().second == "d");
}

CATCH_TEST_CASE("sorted_map_descending", "[sorted_map_descending]") {
  const auto map = decades();
  const auto descending = map.descending_map();
  CATCH_REQUIRE(range_keys(descending) == std::vector<int>{40, 30, 20, 10});
  CATCH_REQUIRE(descending.first_key() == 40);
  CATCH_REQUIRE(*descending.floor_key(25) == 30);
  CATCH_REQUIRE(range_keys(descending.sub_map(30, 10)) == std::vector<int>{30, 20});
  CATCH_REQUIRE_THROWS_AS(descending.sub_map(10, 30), std::invalid_argument);

  const auto keys = map.navigable_key_set();
  CATCH_REQUIRE(std::vector<int>(keys.begin(), keys.end()) == std::vector<int>{10, 20, 30, 40});
  const auto reversed = map.descending_key_set();
  CATCH_REQUIRE(std::vector<int>(reversed.begin(), reversed.end())
                == std::vector<int>{40, 30, 20, 10});
}

CATCH_TEST_CASE("sorted_map_comparators", "[sorted_map_comparators]") {
  using Greater = sorted_map<int, int, std::greater<int>>;
  const Greater greater{{1, 1}, {3, 3}, {2, 2}};
  CATCH_REQUIRE(range_keys(greater) == std::vector<int>{3, 2, 1});
  CATCH_REQUIRE(greater.first_key() == 3);
  CATCH_REQUIRE(*greater.higher_key(2) == 1);

  using Function = std::function<bool(int, int)>;
  using FunctionMap = sorted_map<int, int, Function>;
  CATCH_REQUIRE_THROWS_AS(FunctionMap(Function{}), illegal_state_error);
  const FunctionMap by_function(Function{[](int lhs, int rhs) { return lhs > rhs; }});
  CATCH_REQUIRE(range_keys(by_function.plus(1, 1).plus(2, 2)) == std::vector<int>{2, 1});
  CATCH_REQUIRE(by_function.comparator()(2, 1));
}

CATCH_TEST_CASE("sorted_map_modifiers", "[sorted_map_modifiers]") {
  const auto map = decades();

  const auto added = map.plus(25, "x");
  CATCH_REQUIRE(added.size() == 5);
  CATCH_REQUIRE(map.size() == 4);
  CATCH_REQUIRE(range_keys(added) == std::vector<int>{10, 20, 25, 30, 40});

  CATCH_REQUIRE(map.plus(20, "b").identical(map));
  const auto replaced = map.plus(20, "z");
  CATCH_REQUIRE(replaced.at(20) == "z");
  CATCH_REQUIRE(map.at(20) == "b");

  CATCH_REQUIRE(map.minus(25).identical(map));
  CATCH_REQUIRE(range_keys(map.minus(10)) == std::vector<int>{20, 30, 40});

  CATCH_REQUIRE(map.plus_all({{10, "a"}, {20, "b"}}).identical(map));
  CATCH_REQUIRE(map.plus_all({{50, "e"}}).last_key() == 50);
  CATCH_REQUIRE(map.minus_all({1, 2}).identical(map));
  CATCH_REQUIRE(range_keys(map.minus_all(std::vector<int>{10, 40})) == std::vector<int>{20, 30});
}

CATCH_TEST_CASE("sorted_map_null_keys", "[sorted_map_null_keys]") {
  using SharedMap = sorted_map<std::shared_ptr<int>, int>;
  const auto key = std::make_shared<int>(1);
  const auto map = SharedMap{}.plus(key, 1);
  CATCH_REQUIRE_THROWS_AS(map.plus(nullptr, 2), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(map.minus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(map.plus_all(std::vector<SharedMap::item_type>{{nullptr, 2}}),
                          null_argument_error);
  const std::vector<SharedMap::item_type> items{{key, 1}, {nullptr, 2}};
  CATCH_REQUIRE_THROWS_AS(SharedMap(items.begin(), items.end()), null_argument_error);
  CATCH_REQUIRE(map.size() == 1);
}

CATCH_TEST_CASE("sorted_map_equality", "[sorted_map_equality]") {
  const auto map = decades();
  CATCH_REQUIRE(map == decades());
  CATCH_REQUIRE(!map.identical(decades()));
  CATCH_REQUIRE(map != map.plus(10, "z"));
  CATCH_REQUIRE(map != map.minus(10));
  CATCH_REQUIRE(IntMap{} == IntMap{});

  // Later entries win on construction
  const IntMap repeated{{1, "first"}, {1, "second"}};
  CATCH_REQUIRE(repeated.size() == 1);
  CATCH_REQUIRE(repeated.at(1) == "second");
}

} // namespace obsidian::test
