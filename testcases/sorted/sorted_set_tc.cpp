
#include "test-helpers.hpp"

#include "obsidian/sorted-set.hpp"

#include <functional>
#include <iterator>
#include <memory>
#include <random>
#include <set>
#include <string>
#include <vector>

namespace obsidian::test {

using IntSet = sorted_set<int>;

template <typename Range> static std::vector<int> range_items(const Range& range) {
  return std::vector<int>(range.begin(), range.end());
}

CATCH_TEST_CASE("sorted_set_empty", "[sorted_set_empty]") {
  const IntSet set;
  CATCH_REQUIRE(set.empty());
  CATCH_REQUIRE(set.begin() == set.end());
  CATCH_REQUIRE(!set.contains(1));
  CATCH_REQUIRE(set.find(1) == nullptr);
  CATCH_REQUIRE(set.floor(1) == nullptr);
  CATCH_REQUIRE(set.higher(1) == nullptr);
  CATCH_REQUIRE(set.minus(1).identical(set));
  CATCH_REQUIRE_THROWS_AS(set.first(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(set.last(), std::out_of_range);
  CATCH_REQUIRE(set.head_set(10).empty());
}

CATCH_TEST_CASE("sorted_set_navigation", "[sorted_set_navigation]") {
  const IntSet set{30, 10, 40, 20};
  CATCH_REQUIRE(range_items(set) == std::vector<int>{10, 20, 30, 40});
  CATCH_REQUIRE(set.first() == 10);
  CATCH_REQUIRE(set.last() == 40);
  CATCH_REQUIRE(*set.find(20) == 20);
  CATCH_REQUIRE(set.count(20) == 1);
  CATCH_REQUIRE(set.count(21) == 0);

  CATCH_REQUIRE(*set.lower(30) == 20);
  CATCH_REQUIRE(set.lower(10) == nullptr);
  CATCH_REQUIRE(*set.floor(30) == 30);
  CATCH_REQUIRE(*set.floor(35) == 30);
  CATCH_REQUIRE(*set.ceiling(30) == 30);
  CATCH_REQUIRE(*set.ceiling(31) == 40);
  CATCH_REQUIRE(set.ceiling(41) == nullptr);
  CATCH_REQUIRE(*set.higher(30) == 40);
  CATCH_REQUIRE(set.higher(40) == nullptr);
}

CATCH_TEST_CASE("sorted_set_ranges", "[sorted_set_ranges]") {
  const IntSet set{10, 20, 30, 40};
  CATCH_REQUIRE(range_items(set.sub_set(20, 40)) == std::vector<int>{20, 30});
  CATCH_REQUIRE(range_items(set.sub_set(10, false, 30, true)) == std::vector<int>{20, 30});
  CATCH_REQUIRE(set.sub_set(20, false, 20, false).empty());
  CATCH_REQUIRE(set.sub_set(20, false, 30, false).empty());
  CATCH_REQUIRE_THROWS_AS(set.sub_set(30, 20), std::invalid_argument);

  CATCH_REQUIRE(range_items(set.head_set(20)) == std::vector<int>{10});
  CATCH_REQUIRE(range_items(set.head_set(20, true)) == std::vector<int>{10, 20});
  CATCH_REQUIRE(range_items(set.tail_set(20)) == std::vector<int>{20, 30, 40});
  CATCH_REQUIRE(range_items(set.tail_set(20, false)) == std::vector<int>{30, 40});

  const auto range = set.sub_set(0, 100);
  CATCH_REQUIRE(range.size() == 4);
  CATCH_REQUIRE(range.front() == 10);
  CATCH_REQUIRE(range.back() == 40);
  CATCH_REQUIRE(*range.rbegin() == 40);
}

CATCH_TEST_CASE("sorted_set_range_outlives_set", "[sorted_set_range_outlives_set]") {
  auto set = std::make_unique<IntSet>(IntSet{1, 2, 3, 4, 5});
  const auto range = set->sub_set(2, true, 4, true);
  set.reset();
  CATCH_REQUIRE(range_items(range) == std::vector<int>{2, 3, 4});
}

CATCH_TEST_CASE("sorted_set_descending", "[sorted_set_descending]") {
  const IntSet set{1, 2, 3};
  const auto descending = set.descending_set();
  CATCH_REQUIRE(range_items(descending) == std::vector<int>{3, 2, 1});
  CATCH_REQUIRE(descending.first() == 3);
  CATCH_REQUIRE(*descending.higher(2) == 1);
  CATCH_REQUIRE(range_items(descending.head_set(2)) == std::vector<int>{3});
  CATCH_REQUIRE(range_items(descending.descending_set()) == std::vector<int>{1, 2, 3});
}

CATCH_TEST_CASE("sorted_set_comparators", "[sorted_set_comparators]") {
  const sorted_set<int, std::greater<int>> greater{1, 3, 2};
  CATCH_REQUIRE(range_items(greater) == std::vector<int>{3, 2, 1});
  CATCH_REQUIRE(*greater.floor(0) == 1);

  using Function = std::function<bool(const std::string&, const std::string&)>;
  using StringSet = sorted_set<std::string, Function>;
  CATCH_REQUIRE_THROWS_AS(StringSet(Function{}), illegal_state_error);

  const auto by_length = [](const std::string& lhs, const std::string& rhs) {
    return lhs.size() < rhs.size();
  };
  const StringSet words({"ccc", "a", "bb", "dd"}, Function{by_length});
  CATCH_REQUIRE(words.size() == 3); // "dd" is equivalent to "bb"
  CATCH_REQUIRE(words.first() == "a");
  CATCH_REQUIRE(words.contains("xx"));
}

CATCH_TEST_CASE("sorted_set_modifiers", "[sorted_set_modifiers]") {
  const IntSet set{1, 2, 3};
  CATCH_REQUIRE(set.plus(2).identical(set));
  CATCH_REQUIRE(set.minus(9).identical(set));
  CATCH_REQUIRE(set.plus_all({1, 3}).identical(set));
  CATCH_REQUIRE(set.minus_all({7, 8}).identical(set));
  CATCH_REQUIRE(range_items(set.plus(0)) == std::vector<int>{0, 1, 2, 3});
  CATCH_REQUIRE(range_items(set.minus(2)) == std::vector<int>{1, 3});
  CATCH_REQUIRE(range_items(set.plus_all(std::vector<int>{5, 4}))
                == std::vector<int>{1, 2, 3, 4, 5});
  CATCH_REQUIRE(set.minus_all(std::vector<int>{1, 2, 3}).empty());
  CATCH_REQUIRE(set.size() == 3);

  int sum = 0;
  set.for_each([&sum](int value) { sum += value; });
  CATCH_REQUIRE(sum == 6);
}

CATCH_TEST_CASE("sorted_set_randomized", "[sorted_set_randomized]") {
  std::mt19937 random{11};
  std::uniform_int_distribution<int> value_dist{0, 199};

  IntSet set;
  std::set<int> expected;
  for (auto i = 0; i < 1000; ++i) {
    const auto value = value_dist(random);
    if (i % 4 == 0) {
      set = set.minus(value);
      expected.erase(value);
    } else {
      set = set.plus(value);
      expected.insert(value);
    }
  }
  CATCH_REQUIRE(range_items(set) == std::vector<int>(expected.begin(), expected.end()));
  for (auto value = 0; value < 200; ++value) {
    auto it = expected.upper_bound(value);
    const int* floor = (it == expected.begin()) ? nullptr : &*std::prev(it);
    CATCH_REQUIRE((set.floor(value) == nullptr) == (floor == nullptr));
    if (floor != nullptr)
      CATCH_REQUIRE(*set.floor(value) == *floor);
  }
}

CATCH_TEST_CASE("sorted_set_null_elements", "[sorted_set_null_elements]") {
  using SharedSet = sorted_set<std::shared_ptr<int>>;
  const auto one = std::make_shared<int>(1);
  const auto set = SharedSet{}.plus(one);
  CATCH_REQUIRE_THROWS_AS(set.plus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(set.minus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(set.plus_all(std::vector<std::shared_ptr<int>>{nullptr}),
                          null_argument_error);
  const std::vector<std::shared_ptr<int>> items{one, nullptr};
  CATCH_REQUIRE_THROWS_AS(SharedSet(items.begin(), items.end()), null_argument_error);
  CATCH_REQUIRE(set.size() == 1);
  CATCH_REQUIRE(set.contains(one));
}

CATCH_TEST_CASE("sorted_set_equality", "[sorted_set_equality]") {
  CATCH_REQUIRE((IntSet{1, 2, 3} == IntSet{3, 2, 1}));
  CATCH_REQUIRE((IntSet{1, 2, 3} != IntSet{1, 2}));
  CATCH_REQUIRE((IntSet{1, 2, 3} != IntSet{1, 2, 4}));
  CATCH_REQUIRE((IntSet{1, 1, 2} == IntSet{1, 2}));
  CATCH_REQUIRE(IntSet{} == IntSet{});
}

} // namespace obsidian::test
