
#include "test-helpers.hpp"

#include "obsidian/obsidian.hpp"

#include <fmt/format.h>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace obsidian::test {

static_assert(persistent_sequence<persistent_vector<int>>);
static_assert(persistent_stack_like<persistent_stack<int>>);
static_assert(persistent_queue_like<persistent_queue<int>>);
static_assert(persistent_set_like<persistent_set<int>>);
static_assert(persistent_map_like<persistent_map<int, int>>);
static_assert(sorted_set_like<sorted_set<int>>);
static_assert(sorted_map_like<sorted_map<int, int>>);

// No persistent collection can be changed in place
static_assert(!mutable_collection<persistent_vector<int>>);
static_assert(!mutable_collection<persistent_stack<int>>);
static_assert(!mutable_collection<persistent_queue<int>>);
static_assert(!mutable_collection<persistent_set<int>>);
static_assert(!mutable_collection<persistent_map<int, int>>);
static_assert(!mutable_collection<sorted_set<int>>);
static_assert(!mutable_collection<sorted_map<int, int>>);
static_assert(mutable_collection<std::vector<int>>);
static_assert(mutable_collection<std::map<int, int>>);

CATCH_TEST_CASE("collections_empties", "[collections_empties]") {
  CATCH_REQUIRE(&empty_stack<int>() == &empty_stack<int>());
  CATCH_REQUIRE(&empty_vector<int>() == &empty_vector<int>());
  CATCH_REQUIRE(&empty_map<int, int>() == &empty_map<int, int>());
  CATCH_REQUIRE(empty_stack<int>().empty());
  CATCH_REQUIRE(empty_queue<int>().empty());
  CATCH_REQUIRE(empty_vector<int>().empty());
  CATCH_REQUIRE(empty_set<int>().empty());
  CATCH_REQUIRE(empty_map<int, int>().empty());
  CATCH_REQUIRE(empty_sorted_set<int>().empty());
  CATCH_REQUIRE(empty_sorted_map<int, int>().empty());

  // Deriving from a shared empty leaves it untouched
  const auto one = empty_vector<int>().plus(1);
  CATCH_REQUIRE(one.size() == 1);
  CATCH_REQUIRE(empty_vector<int>().empty());

  const auto greater = empty_sorted_set<int>(std::greater<int>{}).plus(1).plus(2);
  CATCH_REQUIRE(greater.first() == 2);
  const auto by_greater = empty_sorted_map<int, int>(std::greater<int>{}).plus(1, 1).plus(2, 2);
  CATCH_REQUIRE(by_greater.first_key() == 2);
}

CATCH_TEST_CASE("collections_factories", "[collections_factories]") {
  const auto stack = stack_of(1, 2, 3);
  CATCH_REQUIRE(std::vector<int>(stack.begin(), stack.end()) == std::vector<int>{1, 2, 3});
  CATCH_REQUIRE(stack.front() == 1);

  const auto queue = queue_of(1, 2, 3);
  CATCH_REQUIRE(queue.front() == 1);
  CATCH_REQUIRE(std::vector<int>(queue.begin(), queue.end()) == std::vector<int>{1, 2, 3});

  CATCH_REQUIRE(vector_of(4, 5, 6) == persistent_vector<int>{4, 5, 6});
  CATCH_REQUIRE(set_of(1, 2, 2, 3).size() == 3);

  const auto map = map_of(1, std::string{"a"}, 2, std::string{"b"}, 1, std::string{"c"});
  CATCH_REQUIRE(map.size() == 2);
  CATCH_REQUIRE(map.at(1) == "c");

  const auto sorted = sorted_set_of(3, 1, 2);
  CATCH_REQUIRE(sorted.first() == 1);
  const auto reversed = sorted_set_of(std::greater<int>{}, {3, 1, 2});
  CATCH_REQUIRE(reversed.first() == 3);

  const auto ordered = sorted_map_of(3, std::string{"c"}, 1, std::string{"a"});
  CATCH_REQUIRE(ordered.first_key() == 1);
  CATCH_REQUIRE(ordered.at(3) == "c");
}

CATCH_TEST_CASE("collections_copy_of", "[collections_copy_of]") {
  const std::vector<int> items{3, 1, 2, 1};
  const auto stack = stack_copy_of(items);
  CATCH_REQUIRE(std::vector<int>(stack.begin(), stack.end()) == items);
  const auto queue = queue_copy_of(items);
  CATCH_REQUIRE(std::vector<int>(queue.begin(), queue.end()) == items);
  CATCH_REQUIRE(vector_copy_of(items) == persistent_vector<int>{3, 1, 2, 1});
  CATCH_REQUIRE(set_copy_of(items) == persistent_set<int>{1, 2, 3});
  const auto sorted = sorted_set_copy_of(items);
  CATCH_REQUIRE(std::vector<int>(sorted.begin(), sorted.end()) == std::vector<int>{1, 2, 3});

  const std::vector<std::pair<int, std::string>> pairs{{2, "b"}, {1, "a"}, {2, "z"}};
  const auto map = map_copy_of(pairs);
  CATCH_REQUIRE(map.size() == 2);
  CATCH_REQUIRE(map.at(2) == "z");

  const std::map<int, std::string> source{{2, "b"}, {1, "a"}};
  const auto ordered = sorted_map_copy_of(source);
  CATCH_REQUIRE(ordered.first_key() == 1);
  CATCH_REQUIRE(ordered.size() == 2);
}

CATCH_TEST_CASE("collections_copy_of_with_comparator", "[collections_copy_of_with_comparator]") {
  const std::vector<int> items{3, 1, 2, 1};
  const auto descending = sorted_set_copy_of(std::greater<>{}, items);
  CATCH_REQUIRE(std::vector<int>(descending.begin(), descending.end())
                == std::vector<int>{3, 2, 1});
  CATCH_REQUIRE(*descending.higher(2) == 1);

  const std::map<int, std::string> source{{1, "a"}, {2, "b"}, {3, "c"}};
  const auto reversed = sorted_map_copy_of(std::greater<>{}, source);
  CATCH_REQUIRE(reversed.first_key() == 3);
  CATCH_REQUIRE(reversed.last_entry()->second == "a");
  CATCH_REQUIRE(reversed.at(2) == "b");

  using IntCompare = std::function<bool(const int&, const int&)>;
  CATCH_REQUIRE_THROWS_AS(sorted_set_copy_of(IntCompare{}, items), illegal_state_error);
  CATCH_REQUIRE_THROWS_AS(sorted_map_copy_of(IntCompare{}, source), illegal_state_error);

  const auto one = std::make_shared<int>(1);
  const std::vector<std::shared_ptr<int>> with_null{one, nullptr};
  const auto by_address = std::less<>{};
  CATCH_REQUIRE_THROWS_AS(sorted_set_copy_of(by_address, with_null), null_argument_error);
  const std::vector<std::pair<std::shared_ptr<int>, int>> pairs{{one, 1}, {nullptr, 2}};
  CATCH_REQUIRE_THROWS_AS(sorted_map_copy_of(by_address, pairs), null_argument_error);
}

CATCH_TEST_CASE("collections_to_sorted_map", "[collections_to_sorted_map]") {
  const std::vector<std::string> words{"apple", "bob", "cat", "dog", "hello"};
  const auto length = [](const std::string& word) { return word.size(); };
  const auto identity = [](const std::string& word) { return word; };

  const auto firsts = to_sorted_map(words, length, identity, keep_first<std::string>());
  CATCH_REQUIRE(firsts.size() == 2);
  CATCH_REQUIRE(firsts.at(3) == "bob");
  CATCH_REQUIRE(firsts.at(5) == "apple");

  const auto lasts = to_sorted_map(words, length, identity, keep_last<std::string>());
  CATCH_REQUIRE(lasts.at(3) == "dog");
  CATCH_REQUIRE(lasts.at(5) == "hello");

  CATCH_REQUIRE_THROWS_AS(to_sorted_map(words, length, identity), illegal_state_error);
  CATCH_REQUIRE_THROWS_AS(to_sorted_map(words, length, identity,
                                        fail_on_duplicate_keys<std::string>()),
                          illegal_state_error);

  const std::vector<std::string> unique{"a", "bb", "ccc"};
  const auto by_length = to_sorted_map(unique, length, identity);
  CATCH_REQUIRE(by_length.first_key() == 1);

  const auto descending = to_sorted_map_by(std::greater<std::size_t>{}, unique, length, identity);
  CATCH_REQUIRE(descending.first_key() == 3);
  CATCH_REQUIRE(descending.last_entry()->second == "a");

  const auto concatenated = to_sorted_map_by(
      std::less<std::size_t>{}, words, length, identity,
      [](const std::string& existing, const std::string& incoming) {
        return existing + "+" + incoming;
      });
  CATCH_REQUIRE(concatenated.at(3) == "bob+cat+dog");
}

CATCH_TEST_CASE("collections_format", "[collections_format]") {
  CATCH_REQUIRE(fmt::format("{}", vector_of(1, 2, 3)) == "[1, 2, 3]");
  CATCH_REQUIRE(fmt::format("{}", stack_of(1, 2, 3)) == "[1, 2, 3]");
  CATCH_REQUIRE(fmt::format("{}", queue_of(1, 2, 3)) == "[1, 2, 3]");
  CATCH_REQUIRE(fmt::format("{}", sorted_set_of(3, 2, 1)) == "[1, 2, 3]");
  CATCH_REQUIRE(fmt::format("{}", set_of(5)) == "[5]");
  CATCH_REQUIRE(fmt::format("{}", empty_vector<int>()) == "[]");
  CATCH_REQUIRE(fmt::format("{}", map_of(1, std::string{"a"})) == "{1=a}");
  CATCH_REQUIRE(fmt::format("{}", sorted_map_of(2, std::string{"b"}, 1, std::string{"a"}))
                == "{1=a, 2=b}");
  CATCH_REQUIRE(fmt::format("{}", empty_sorted_map<int, int>()) == "{}");

  // Standard ranges keep fmt's own formatting
  CATCH_REQUIRE(fmt::format("{}", std::vector<int>{1, 2}) == "[1, 2]");
  CATCH_REQUIRE(fmt::format("{}", std::vector<persistent_vector<int>>{vector_of(1), {}})
                == "[[1], []]");
}

} // namespace obsidian::test
