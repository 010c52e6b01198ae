
#include "test-helpers.hpp"

#include "obsidian/persistent-queue.hpp"

#include <vector>

namespace obsidian::test {

using IntQueue = persistent_queue<int>;

static std::vector<int> queue_items(const IntQueue& queue) {
  return std::vector<int>(queue.begin(), queue.end());
}

CATCH_TEST_CASE("queue_empty", "[queue_empty]") {
  const IntQueue queue;
  CATCH_REQUIRE(queue.empty());
  CATCH_REQUIRE(queue.size() == 0);
  CATCH_REQUIRE(queue.peek() == nullptr);
  CATCH_REQUIRE(queue.begin() == queue.end());
  CATCH_REQUIRE(queue.minus().identical(queue));
  CATCH_REQUIRE(queue.minus(1).identical(queue));
  CATCH_REQUIRE(!queue.contains(1));
  CATCH_REQUIRE_THROWS_AS(queue.front(), std::out_of_range);
}

CATCH_TEST_CASE("queue_fifo", "[queue_fifo]") {
  const auto queue = IntQueue{}.plus(1).plus(2).minus().plus(3).plus(4);
  CATCH_REQUIRE(queue.size() == 3);
  CATCH_REQUIRE(*queue.peek() == 2);
  CATCH_REQUIRE(queue.front() == 2);
  CATCH_REQUIRE(queue_items(queue) == std::vector<int>{2, 3, 4});
  CATCH_REQUIRE(queue == IntQueue{2, 3, 4});

  const auto drained = queue.minus().minus().minus();
  CATCH_REQUIRE(drained.empty());
  CATCH_REQUIRE(queue.size() == 3); // unchanged

  std::vector<int> seen;
  queue.for_each([&seen](int value) { seen.push_back(value); });
  CATCH_REQUIRE(seen == std::vector<int>{2, 3, 4});
}

CATCH_TEST_CASE("queue_versions", "[queue_versions]") {
  IntQueue queue;
  std::vector<IntQueue> versions;
  for (auto i = 0; i < 100; ++i) {
    queue = queue.plus(i);
    if (i % 3 == 0)
      queue = queue.minus();
    versions.push_back(queue);
  }

  // Replay the same operations against a std::vector
  std::vector<int> expected;
  std::size_t head = 0;
  for (auto i = 0; i < 100; ++i) {
    expected.push_back(i);
    if (i % 3 == 0)
      ++head;
    const std::vector<int> current(expected.begin() + static_cast<std::ptrdiff_t>(head),
                                   expected.end());
    CATCH_REQUIRE(queue_items(versions[static_cast<std::size_t>(i)]) == current);
    CATCH_REQUIRE(versions[static_cast<std::size_t>(i)].size() == current.size());
  }
}

CATCH_TEST_CASE("queue_minus_value", "[queue_minus_value]") {
  const auto queue = IntQueue{1, 2}.plus(3).plus(2).plus(4);
  CATCH_REQUIRE(queue_items(queue) == std::vector<int>{1, 2, 3, 2, 4});
  CATCH_REQUIRE(queue_items(queue.minus(2)) == std::vector<int>{1, 3, 2, 4});
  CATCH_REQUIRE(queue.minus(9).identical(queue));
  CATCH_REQUIRE(queue_items(queue.minus_all({2, 4})) == std::vector<int>{1, 3});
  CATCH_REQUIRE(queue.minus_all({8, 9}).identical(queue));
  CATCH_REQUIRE(queue.minus_all(std::vector<int>{1, 2, 3, 4}).empty());
  CATCH_REQUIRE(queue.contains(3));
  CATCH_REQUIRE(queue.contains(4));
  CATCH_REQUIRE(!queue.contains(5));
}

CATCH_TEST_CASE("queue_plus_all", "[queue_plus_all]") {
  const IntQueue queue{1};
  CATCH_REQUIRE(queue_items(queue.plus_all({2, 3})) == std::vector<int>{1, 2, 3});
  CATCH_REQUIRE(queue_items(queue.plus_all(std::vector<int>{4})) == std::vector<int>{1, 4});
  CATCH_REQUIRE(queue_items(IntQueue{}.plus_all({5, 6})) == std::vector<int>{5, 6});
}

CATCH_TEST_CASE("queue_traced_items", "[queue_traced_items]") {
  uint32_t counter{0};
  {
    using TracedQueue = persistent_queue<TracedItem>;
    TracedQueue queue;
    for (auto i = 0u; i < 20; ++i)
      queue = queue.plus(TracedItem{counter, i});
    CATCH_REQUIRE(queue.front().value() == 0);
    const auto shorter = queue.minus().minus(TracedItem{counter, 10});
    CATCH_REQUIRE(shorter.size() == 18);
    CATCH_REQUIRE(shorter.front().value() == 1);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("queue_null_elements", "[queue_null_elements]") {
  int value = 1;
  using PointerQueue = persistent_queue<int*>;
  const auto queue = PointerQueue{}.plus(&value);
  CATCH_REQUIRE_THROWS_AS(queue.plus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(queue.plus_all(std::vector<int*>{&value, nullptr}),
                          null_argument_error);
  CATCH_REQUIRE(queue.size() == 1);
}

CATCH_TEST_CASE("queue_equality", "[queue_equality]") {
  // Same elements, different split between the two stacks
  const auto lhs = IntQueue{1, 2, 3};
  const auto rhs = IntQueue{0, 1}.plus(2).plus(3).minus();
  CATCH_REQUIRE(lhs == rhs);
  CATCH_REQUIRE(lhs != rhs.plus(4));
  CATCH_REQUIRE(lhs != IntQueue{3, 2, 1});
  CATCH_REQUIRE(IntQueue{} == IntQueue{});
}

} // namespace obsidian::test
