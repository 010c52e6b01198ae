
#include "test-helpers.hpp"

#include "obsidian/persistent-stack.hpp"

#include <cstdint>
#include <stdexcept>
#include <vector>

namespace obsidian::test {

using IntStack = persistent_stack<int>;

static std::vector<int> stack_items(const IntStack& stack) {
  return std::vector<int>(stack.begin(), stack.end());
}

CATCH_TEST_CASE("stack_empty", "[stack_empty]") {
  const IntStack stack;
  CATCH_REQUIRE(stack.empty());
  CATCH_REQUIRE(stack.size() == 0);
  CATCH_REQUIRE(stack.peek() == nullptr);
  CATCH_REQUIRE(stack.begin() == stack.end());
  CATCH_REQUIRE(stack.pop().identical(stack));
  CATCH_REQUIRE(stack.sub_list(0).identical(stack));
  CATCH_REQUIRE(stack.minus(1).identical(stack));
  CATCH_REQUIRE(stack.index_of(1) == IntStack::npos);
  CATCH_REQUIRE_THROWS_AS(stack.front(), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.get(0), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.minus_at(0), std::out_of_range);
  CATCH_REQUIRE(stack_items(stack.plus_at(0, 1)) == std::vector<int>{1});
}

CATCH_TEST_CASE("stack_push_pop", "[stack_push_pop]") {
  const IntStack s0;
  const auto s1 = s0.plus(1);
  const auto s2 = s1.plus(2);

  CATCH_REQUIRE(s0.empty());
  CATCH_REQUIRE(s1.size() == 1);
  CATCH_REQUIRE(s2.size() == 2);
  CATCH_REQUIRE(*s2.peek() == 2);
  CATCH_REQUIRE(s2.front() == 2);
  CATCH_REQUIRE(s2.get(1) == 1);
  CATCH_REQUIRE(stack_items(s2) == std::vector<int>{2, 1});

  // Popping shares the cells below the top
  CATCH_REQUIRE(s2.pop().identical(s1));
  CATCH_REQUIRE(s1.plus(0).pop().identical(s1));
  CATCH_REQUIRE(s2.sub_list(1).identical(s1));
  CATCH_REQUIRE(s2.minus_at(0).identical(s1));
  CATCH_REQUIRE(s1.pop().empty());
}

CATCH_TEST_CASE("stack_construction_order", "[stack_construction_order]") {
  const IntStack stack{1, 2, 3};
  CATCH_REQUIRE(stack.front() == 1);
  CATCH_REQUIRE(stack_items(stack) == std::vector<int>{1, 2, 3});

  const std::vector<int> items{4, 5};
  CATCH_REQUIRE(stack_items(IntStack(items.begin(), items.end())) == items);

  // plus_all keeps the order of the range, above the existing elements
  CATCH_REQUIRE(stack_items(IntStack{3}.plus_all({1, 2})) == std::vector<int>{1, 2, 3});
  CATCH_REQUIRE(IntStack{3}.plus_all(std::vector<int>{}).size() == 1);
}

CATCH_TEST_CASE("stack_indexed", "[stack_indexed]") {
  const IntStack stack{1, 2, 3, 4, 5};

  const auto replaced = stack.with(2, 30);
  CATCH_REQUIRE(stack_items(replaced) == std::vector<int>{1, 2, 30, 4, 5});
  CATCH_REQUIRE(replaced.sub_list(3).identical(stack.sub_list(3)));
  CATCH_REQUIRE(stack.get(2) == 3);

  const auto inserted = stack.plus_at(2, 9);
  CATCH_REQUIRE(stack_items(inserted) == std::vector<int>{1, 2, 9, 3, 4, 5});
  CATCH_REQUIRE(inserted.sub_list(3).identical(stack.sub_list(2)));
  CATCH_REQUIRE(stack_items(stack.plus_at(5, 6)) == std::vector<int>{1, 2, 3, 4, 5, 6});

  const auto many = stack.plus_all_at(1, std::vector<int>{7, 8});
  CATCH_REQUIRE(stack_items(many) == std::vector<int>{1, 7, 8, 2, 3, 4, 5});
  CATCH_REQUIRE(many.sub_list(3).identical(stack.sub_list(1)));

  CATCH_REQUIRE(stack_items(stack.minus_at(4)) == std::vector<int>{1, 2, 3, 4});
  CATCH_REQUIRE(stack_items(stack.minus_at(2)) == std::vector<int>{1, 2, 4, 5});
  CATCH_REQUIRE(stack.minus_at(2).sub_list(2).identical(stack.sub_list(3)));

  CATCH_REQUIRE_THROWS_AS(stack.with(5, 0), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.plus_at(6, 0), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.minus_at(5), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.get(5), std::out_of_range);
}

CATCH_TEST_CASE("stack_minus", "[stack_minus]") {
  const IntStack repeated{1, 2, 3, 2, 1};
  CATCH_REQUIRE(stack_items(repeated.minus(2)) == std::vector<int>{1, 3, 2, 1});
  CATCH_REQUIRE(repeated.minus(9).identical(repeated));
  CATCH_REQUIRE(stack_items(repeated.minus_all({2, 3})) == std::vector<int>{1, 1});
  CATCH_REQUIRE(repeated.minus_all({8, 9}).identical(repeated));

  // Everything below the last removed element is shared
  const IntStack stack{1, 2, 3, 4, 5};
  const auto fewer = stack.minus_all({2, 3});
  CATCH_REQUIRE(stack_items(fewer) == std::vector<int>{1, 4, 5});
  CATCH_REQUIRE(fewer.sub_list(1).identical(stack.sub_list(3)));
  CATCH_REQUIRE(stack.minus_all(std::vector<int>{1, 2, 3, 4, 5}).empty());
}

CATCH_TEST_CASE("stack_sub_list", "[stack_sub_list]") {
  const IntStack stack{1, 2, 3, 4, 5};
  CATCH_REQUIRE(stack_items(stack.sub_list(1, 3)) == std::vector<int>{2, 3});
  CATCH_REQUIRE(stack.sub_list(2, 2).empty());
  CATCH_REQUIRE(stack.sub_list(0, 5).identical(stack));
  CATCH_REQUIRE(stack.sub_list(5).empty());
  CATCH_REQUIRE_THROWS_AS(stack.sub_list(3, 2), std::out_of_range);
  CATCH_REQUIRE_THROWS_AS(stack.sub_list(0, 6), std::out_of_range);
}

CATCH_TEST_CASE("stack_lookup", "[stack_lookup]") {
  const IntStack stack{5, 6, 7, 6};
  CATCH_REQUIRE(stack.index_of(6) == 1);
  CATCH_REQUIRE(stack.index_of(8) == IntStack::npos);
  CATCH_REQUIRE(stack.contains(7));
  CATCH_REQUIRE(!stack.contains(8));

  std::vector<int> seen;
  stack.for_each([&seen](int value) { seen.push_back(value); });
  CATCH_REQUIRE(seen == std::vector<int>{5, 6, 7, 6});
}

CATCH_TEST_CASE("stack_deep_release", "[stack_deep_release]") {
  IntStack stack;
  for (auto i = 0; i < 1000000; ++i)
    stack = stack.plus(i);
  CATCH_REQUIRE(stack.size() == 1000000);
  CATCH_REQUIRE(stack.front() == 999999);

  const auto bottom = stack.sub_list(999990);
  CATCH_REQUIRE(bottom.size() == 10);
  stack = IntStack{}; // releases 999990 cells without recursion
  CATCH_REQUIRE(bottom.front() == 9);
  CATCH_REQUIRE(bottom.size() == 10);
}

CATCH_TEST_CASE("stack_traced_items", "[stack_traced_items]") {
  uint32_t counter{0};
  {
    using TracedStack = persistent_stack<TracedItem>;
    TracedStack stack;
    for (auto i = 0u; i < 50; ++i)
      stack = stack.plus(TracedItem{counter, i});
    CATCH_REQUIRE(counter == 50);

    const auto replaced = stack.with(10, TracedItem{counter, 1000});
    CATCH_REQUIRE(replaced.get(10).value() == 1000);
    CATCH_REQUIRE(counter == 61); // ten copied cells above, plus the new one

    const auto fewer = stack.minus_all(std::vector<TracedItem>{TracedItem{counter, 45}});
    CATCH_REQUIRE(fewer.size() == 49);
    const auto middle = stack.sub_list(10, 20);
    CATCH_REQUIRE(middle.front().value() == 39);
    CATCH_REQUIRE(stack.plus_at(3, TracedItem{counter, 7}).get(3).value() == 7);
  }
  CATCH_REQUIRE(counter == 0);
}

/**
 * Copies throw once `copies_left` runs out
 */
class FragileItem {
private:
  int& copies_left_;
  uint32_t& counter_;
  int value_{0};

public:
  FragileItem(int& copies_left, uint32_t& counter, int value)
      : copies_left_{copies_left}, counter_{counter}, value_{value} {
    counter_++;
  }
  FragileItem(const FragileItem& o)
      : copies_left_{o.copies_left_}, counter_{o.counter_}, value_{o.value_} {
    if (copies_left_-- <= 0)
      throw std::runtime_error{"copy failed"};
    counter_++;
  }
  ~FragileItem() { counter_--; }
  FragileItem& operator=(const FragileItem&) = delete;
  int value() const { return value_; }
  bool operator==(const FragileItem& o) const { return o.value() == value(); }
};

CATCH_TEST_CASE("stack_failed_copy", "[stack_failed_copy]") {
  uint32_t counter{0};
  int copies_left{1000};
  {
    persistent_stack<FragileItem> stack;
    for (auto i = 0; i < 5; ++i)
      stack = stack.plus(FragileItem{copies_left, counter, i});
    const FragileItem replacement{copies_left, counter, 99};
    CATCH_REQUIRE(counter == 6);

    // The third copy fails while relinking the cells above index 3
    copies_left = 2;
    CATCH_REQUIRE_THROWS_AS(stack.with(3, replacement), std::runtime_error);
    CATCH_REQUIRE(counter == 6);
    copies_left = 0;
    CATCH_REQUIRE_THROWS_AS(stack.plus(replacement), std::runtime_error);
    CATCH_REQUIRE(counter == 6);

    CATCH_REQUIRE(stack.size() == 5);
    CATCH_REQUIRE(stack.front().value() == 4);
    CATCH_REQUIRE(stack.get(3).value() == 1);
  }
  CATCH_REQUIRE(counter == 0);
}

struct alignas(64) WideItem {
  int value{0};
  bool operator==(const WideItem&) const = default;
};

CATCH_TEST_CASE("stack_aligned_cells", "[stack_aligned_cells]") {
  persistent_stack<WideItem> stack;
  for (auto i = 0; i < 16; ++i)
    stack = stack.plus(WideItem{i});
  for (const auto& item : stack)
    CATCH_REQUIRE(reinterpret_cast<std::uintptr_t>(&item) % alignof(WideItem) == 0);
  CATCH_REQUIRE(stack.sub_list(4, 8).front().value == 11);
}

CATCH_TEST_CASE("stack_null_elements", "[stack_null_elements]") {
  int value = 1;
  using PointerStack = persistent_stack<int*>;
  const auto stack = PointerStack{}.plus(&value);
  CATCH_REQUIRE_THROWS_AS(stack.plus(nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(stack.with(0, nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(stack.plus_at(1, nullptr), null_argument_error);
  CATCH_REQUIRE_THROWS_AS(stack.plus_all(std::vector<int*>{&value, nullptr}),
                          null_argument_error);
  const std::vector<int*> items{nullptr};
  CATCH_REQUIRE_THROWS_AS(PointerStack(items.begin(), items.end()), null_argument_error);
  CATCH_REQUIRE(stack.size() == 1);
}

CATCH_TEST_CASE("stack_equality", "[stack_equality]") {
  const auto built = IntStack{}.plus(3).plus(2).plus(1);
  CATCH_REQUIRE(built == IntStack{1, 2, 3});
  CATCH_REQUIRE(!built.identical(IntStack{1, 2, 3}));
  CATCH_REQUIRE(built != IntStack{1, 2});
  CATCH_REQUIRE(built != IntStack{3, 2, 1});
  CATCH_REQUIRE(IntStack{} == IntStack{});
}

} // namespace obsidian::test
