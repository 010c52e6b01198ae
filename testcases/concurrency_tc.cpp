
#include "test-helpers.hpp"

#include "obsidian/persistent-map.hpp"
#include "obsidian/persistent-stack.hpp"
#include "obsidian/persistent-vector.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace obsidian::test {

constexpr int k_n_threads = 8;
constexpr int k_n_items = 2000;

// Threads derive private versions from shared roots; the shared roots never change
CATCH_TEST_CASE("concurrent_derivation", "[concurrent_derivation]") {
  persistent_map<int, int> shared_map;
  persistent_vector<int> shared_vector;
  persistent_stack<int> shared_stack;
  for (auto i = 0; i < k_n_items; ++i) {
    shared_map = shared_map.plus(i, i);
    shared_vector = shared_vector.plus(i);
    shared_stack = shared_stack.plus(i);
  }

  std::atomic<int> failures{0};
  std::vector<std::thread> threads;
  threads.reserve(k_n_threads);
  for (auto t = 0; t < k_n_threads; ++t) {
    threads.emplace_back([&, t]() {
      auto map = shared_map;
      auto vector = shared_vector;
      auto stack = shared_stack;
      for (auto i = 0; i < k_n_items; ++i) {
        const auto key = k_n_items * (t + 1) + i;
        map = map.plus(key, t).minus(i);
        vector = vector.with(static_cast<std::size_t>(i), t).plus(key);
        stack = stack.pop().plus(key);
      }
      const bool ok = map.size() == static_cast<std::size_t>(k_n_items)
                      && !map.contains_key(0) && map.at(k_n_items * (t + 1)) == t
                      && vector.size() == static_cast<std::size_t>(2 * k_n_items)
                      && vector.get(0) == t && stack.size() == static_cast<std::size_t>(k_n_items)
                      && stack.front() == k_n_items * (t + 2) - 1;
      if (!ok)
        ++failures;
    });
  }
  for (auto& thread : threads)
    thread.join();

  CATCH_REQUIRE(failures.load() == 0);
  CATCH_REQUIRE(shared_map.size() == static_cast<std::size_t>(k_n_items));
  CATCH_REQUIRE(shared_vector.size() == static_cast<std::size_t>(k_n_items));
  CATCH_REQUIRE(shared_stack.size() == static_cast<std::size_t>(k_n_items));
  for (auto i = 0; i < k_n_items; ++i) {
    CATCH_REQUIRE(shared_map.at(i) == i);
    CATCH_REQUIRE(shared_vector.get(static_cast<std::size_t>(i)) == i);
  }
  CATCH_REQUIRE(shared_stack.front() == k_n_items - 1);
}

} // namespace obsidian::test
