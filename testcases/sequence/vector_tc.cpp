
#include "test-helpers.hpp"

#include "obsidian/persistent-vector.hpp"

#include <algorithm>
#include <iterator>
#include <map>
#include <memory>
#include <numeric>
#include <vector>

namespace obsidian::test {

using IntVector = persistent_vector<int>;

static_assert(std::random_access_iterator<IntVector::const_iterator>);

template <typename Vector>
static void check_vector(const Vector& vector, const std::vector<int>& expected) {
  CATCH_REQUIRE(vector.size() == expected.size());
  CATCH_REQUIRE(vector.empty() == expected.empty());
  for (auto i = 0u; i < expected.size(); ++i)
    CATCH_REQUIRE(vector.get(i) == expected[i]);
  CATCH_REQUIRE(std::equal(vector.begin(), vector.end(), expected.begin(), expected.end()));
}

static std::vector<int> iota_vector(int from, int to) {
  std::vector<int> out(static_cast<std::size_t>(to - from));
  std::iota(out.begin(), out.end(), from);
  return out;
}

CATCH_TEST_CASE("vector_empty", "[vector_empty]") {
  const IntVector vector;
  CATCH_REQUIRE(vector.empty());
  CATCH_REQUIRE(vector.size() == 0);
  CATCH_REQUIRE(vector.begin() == vector.end());
  CATCH_REQUIRE(vector.index_of(1) == IntVector::npos);
  CATCH_REQUIRE(vector.last_index_of(1) == IntVector::npos);
  CATCH_REQUIRE(!vector.contains(1));
  CATCH_REQUIRE(vector.sub_list(0, 0).identical(vector));
  CATCH_REQUIRE(vector.minus(1).identical(vector));
  CATCH_REQUIRE_THROWS_AS(vector.get(0), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.front(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.back(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.with(0, 1), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.minus_at(0), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.plus_at(1, 1), std::out_of_range);
  check_vector(vector.plus_at(0, 1), {1});
}

CATCH_TEST_CASE("vector_append_versions", "[vector_append_versions]") {
  const std::vector<std::size_t> kept_sizes{1, 31, 32, 33, 64, 65, 1024, 1025};
  std::map<std::size_t, IntVector> versions;

  IntVector vector;
  for (auto i = 0; i < 1100; ++i) {
    vector = vector.plus(i);
    if (std::find(kept_sizes.begin(), kept_sizes.end(), vector.size()) != kept_sizes.end())
      versions.emplace(vector.size(), vector);
  }
  check_vector(vector, iota_vector(0, 1100));
  CATCH_REQUIRE(vector.front() == 0);
  CATCH_REQUIRE(vector.back() == 1099);

  // Appending never disturbs earlier versions
  CATCH_REQUIRE(versions.size() == kept_sizes.size());
  for (const auto& [size, version] : versions)
    check_vector(version, iota_vector(0, static_cast<int>(size)));

  // Two appends to the same version diverge
  const auto& v32 = versions.at(32);
  const auto lhs = v32.plus(-1);
  const auto rhs = v32.plus(-2);
  CATCH_REQUIRE(lhs.back() == -1);
  CATCH_REQUIRE(rhs.back() == -2);
  CATCH_REQUIRE(v32.size() == 32);
}

CATCH_TEST_CASE("vector_with", "[vector_with]") {
  const auto items = iota_vector(0, 100);
  const IntVector vector(items.begin(), items.end());
  CATCH_REQUIRE(vector.size() == 100);

  const auto in_table = vector.with(5, -5);
  const auto in_tail = vector.with(98, -98);
  CATCH_REQUIRE(in_table.get(5) == -5);
  CATCH_REQUIRE(in_tail.get(98) == -98);
  CATCH_REQUIRE(vector.get(5) == 5);
  CATCH_REQUIRE(vector.get(98) == 98);

  auto expected = iota_vector(0, 100);
  expected[5] = -5;
  check_vector(in_table, expected);

  CATCH_REQUIRE_THROWS_AS(vector.with(100, 0), std::out_of_range);
  CATCH_REQUIRE(vector.with(3, 3) == vector);
}

CATCH_TEST_CASE("vector_plus_at_minus_at", "[vector_plus_at_minus_at]") {
  const auto items = iota_vector(0, 100);
  const IntVector vector(items.begin(), items.end());

  const auto inserted = vector.plus_at(50, -1);
  CATCH_REQUIRE(inserted.size() == 101);
  CATCH_REQUIRE(inserted.get(49) == 49);
  CATCH_REQUIRE(inserted.get(50) == -1);
  CATCH_REQUIRE(inserted.get(51) == 50);
  CATCH_REQUIRE(inserted.minus_at(50) == vector);

  CATCH_REQUIRE(vector.plus_at(0, -1).front() == -1);
  CATCH_REQUIRE(vector.plus_at(100, 7) == vector.plus(7));
  CATCH_REQUIRE_THROWS_AS(vector.plus_at(101, 7), std::out_of_range);

  const auto many = vector.plus_all_at(10, std::vector<int>{-1, -2, -3});
  CATCH_REQUIRE(many.size() == 103);
  CATCH_REQUIRE(many.get(10) == -1);
  CATCH_REQUIRE(many.get(12) == -3);
  CATCH_REQUIRE(many.get(13) == 10);

  const auto removed = vector.minus_at(0).minus_at(98);
  check_vector(removed, iota_vector(1, 99));
  CATCH_REQUIRE_THROWS_AS(vector.minus_at(100), std::out_of_range);
}

CATCH_TEST_CASE("vector_minus", "[vector_minus]") {
  const IntVector vector{1, 2, 3, 2, 1};
  check_vector(vector.minus(2), {1, 3, 2, 1});
  CATCH_REQUIRE(vector.minus(9).identical(vector));
  check_vector(vector.minus_all({1, 2}), {3});
  CATCH_REQUIRE(vector.minus_all({8, 9}).identical(vector));
  CATCH_REQUIRE(vector.minus_all(std::vector<int>{1, 2, 3}).empty());
}

CATCH_TEST_CASE("vector_sub_list", "[vector_sub_list]") {
  const auto items = iota_vector(0, 100);
  const IntVector vector(items.begin(), items.end());

  CATCH_REQUIRE(vector.sub_list(0, 100).identical(vector));
  check_vector(vector.sub_list(10, 20), iota_vector(10, 20));
  check_vector(vector.sub_list(30, 100), iota_vector(30, 100));
  CATCH_REQUIRE(vector.sub_list(5, 5).empty());
  CATCH_REQUIRE_THROWS_AS(vector.sub_list(20, 10), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(vector.sub_list(0, 101), std::out_of_range);

  // A sub list is a vector like any other
  check_vector(vector.sub_list(60, 70).plus(100), {60, 61, 62, 63, 64, 65, 66, 67, 68, 69, 100});
}

CATCH_TEST_CASE("vector_index_of", "[vector_index_of]") {
  const IntVector vector{5, 6, 7, 6, 5};
  CATCH_REQUIRE(vector.index_of(6) == 1);
  CATCH_REQUIRE(vector.last_index_of(6) == 3);
  CATCH_REQUIRE(vector.index_of(5) == 0);
  CATCH_REQUIRE(vector.last_index_of(5) == 4);
  CATCH_REQUIRE(vector.index_of(8) == IntVector::npos);
  CATCH_REQUIRE(vector.contains(7));
  CATCH_REQUIRE(!vector.contains(8));
  CATCH_REQUIRE(vector[2] == 7);
}

CATCH_TEST_CASE("vector_iterators", "[vector_iterators]") {
  const auto items = iota_vector(0, 200);
  const IntVector vector(items.begin(), items.end());

  CATCH_REQUIRE(std::distance(vector.begin(), vector.end()) == 200);
  CATCH_REQUIRE(vector.begin()[70] == 70);
  CATCH_REQUIRE(*(vector.end() - 1) == 199);
  CATCH_REQUIRE(*(vector.begin() + 33) == 33);
  CATCH_REQUIRE(vector.begin() < vector.end());
  CATCH_REQUIRE(std::accumulate(vector.begin(), vector.end(), 0) == 199 * 200 / 2);

  const std::vector<int> reversed(std::make_reverse_iterator(vector.end()),
                                  std::make_reverse_iterator(vector.begin()));
  CATCH_REQUIRE(reversed.front() == 199);
  CATCH_REQUIRE(reversed.back() == 0);

  int counter = 0;
  vector.for_each([&counter](int value) { CATCH_REQUIRE(value == counter++); });
  CATCH_REQUIRE(counter == 200);
}

CATCH_TEST_CASE("vector_traced_items", "[vector_traced_items]") {
  uint32_t counter{0};
  {
    using TracedVector = persistent_vector<TracedItem>;
    TracedVector vector;
    for (auto i = 0u; i < 100; ++i)
      vector = vector.plus(TracedItem{counter, i});
    CATCH_REQUIRE(counter == 100);

    const auto changed =
        vector.with(10, TracedItem{counter, 1000}).with(99, TracedItem{counter, 0});
    CATCH_REQUIRE(changed.get(10).value() == 1000);
    CATCH_REQUIRE(vector.get(10).value() == 10);

    const auto slice = vector.sub_list(20, 40);
    CATCH_REQUIRE(slice.size() == 20);
    CATCH_REQUIRE(slice.front().value() == 20);

    const auto fewer = vector.minus_all(std::vector<TracedItem>{TracedItem{counter, 0}});
    CATCH_REQUIRE(fewer.size() == 99);
    CATCH_REQUIRE(fewer.front().value() == 1);

    const auto inserted = vector.plus_at(3, TracedItem{counter, 3000});
    CATCH_REQUIRE(inserted.get(3).value() == 3000);

    const std::vector<TracedItem> items{TracedItem{counter, 1}, TracedItem{counter, 2}};
    const TracedVector copied(items.begin(), items.end());
    CATCH_REQUIRE(copied.back().value() == 2);
  }
  CATCH_REQUIRE(counter == 0);
}

CATCH_TEST_CASE("vector_null_elements", "[vector_null_elements]") {
  using SharedVector = persistent_vector<std::shared_ptr<int>>;
  const auto one = std::make_shared<int>(1);
  const auto vector = SharedVector{}.plus(one);
  CATCH_REQUIRE_THROWS_AS(vector.plus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(vector.with(0, nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(vector.plus_at(0, nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(vector.plus_all(std::vector<std::shared_ptr<int>>{one, nullptr}),
                          null_argument_error);
  const std::vector<std::shared_ptr<int>> items{one, nullptr};
  CATCH_REQUIRE_THROWS_AS(SharedVector(items.begin(), items.end()), null_argument_error);
  CATCH_REQUIRE(vector.size() == 1);
  CATCH_REQUIRE(!vector.contains(nullptr));
  CATCH_REQUIRE(vector.minus(nullptr).identical(vector));
}

CATCH_TEST_CASE("vector_equality", "[vector_equality]") {
  IntVector built;
  for (auto i = 1; i <= 3; ++i)
    built = built.plus(i);
  CATCH_REQUIRE(built == IntVector{1, 2, 3});
  CATCH_REQUIRE(built != IntVector{1, 2});
  CATCH_REQUIRE(built != IntVector{1, 2, 4});
  CATCH_REQUIRE(built.plus_all({4, 5}) == IntVector{1, 2, 3, 4, 5});
  CATCH_REQUIRE(IntVector{} == IntVector{});
}

} // namespace obsidian::test
