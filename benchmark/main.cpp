
#include "obsidian/persistent-map.hpp"
#include "obsidian/persistent-stack.hpp"
#include "obsidian/persistent-vector.hpp"

#include <fmt/format.h>

#include <array>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <iostream>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <vector>

using namespace std::string_literals;

using ticktock_type = std::chrono::time_point<std::chrono::steady_clock>;

static ticktock_type tick() { return std::chrono::steady_clock::now(); }
static std::chrono::microseconds tock(const ticktock_type& whence) {
  auto now = std::chrono::steady_clock::now();
  return std::chrono::duration_cast<std::chrono::microseconds>(now - whence);
}

constexpr std::size_t k_n_columns = 3;

struct Data {
  std::string label;
  std::size_t size;
  std::array<std::string, k_n_columns> columns;
  std::array<uint64_t, k_n_columns> insert_times;
  std::array<uint64_t, k_n_columns> iterate_times;
  std::array<uint64_t, k_n_columns> find_times;
  std::array<uint64_t, k_n_columns> delete_times;
  std::size_t volatile_data = 0; // to prevent optimizing away
};

template <typename T> T generate(std::size_t counter) {
  static_assert(std::is_integral<T>::value || std::is_same<T, std::string>::value);
  if constexpr (std::is_integral<T>::value) {
    return static_cast<T>(counter);
  } else {
    return fmt::format("{0}:{1}:{0}:{2}", counter, 10 * counter, 437 * counter * 12345667);
  }
}

static auto make_profiler(uint32_t sample_size) {
  return [sample_size](std::string_view label, auto thunk) {
    uint64_t total_us = 0;
    for (auto i = 0u; i < sample_size; ++i) {
      const auto reference = tick();
      thunk();
      total_us += static_cast<uint64_t>(tock(reference).count());
    }
    const auto average_us = uint64_t(double(total_us) / double(sample_size));
    const auto seconds = average_us / 1000000;
    std::cout << fmt::format("             {:15s} = {}.{:06d}s\n", label, seconds,
                             average_us % 1000000);
    return average_us;
  };
}

// -------------------------------------------------------------------------------------------- Maps

template <typename key_type, typename value_type>
Data run_maps(std::string label, const std::size_t size, const uint32_t sample_size) {
  using item_type = std::pair<key_type, value_type>;
  using atomic_map_type = obsidian::persistent_map<key_type, value_type>;
  using non_atomic_map_type = obsidian::persistent_map<key_type, value_type, std::hash<key_type>,
                                                       std::equal_to<key_type>, false>;
  using std_map_type = std::unordered_map<key_type, value_type>;

  std::vector<item_type> items;
  items.reserve(size);
  for (auto i = 0u; i < size; ++i)
    items.push_back({generate<key_type>(i), generate<value_type>(i)});

  Data data;
  data.label = label;
  data.size = size;
  data.columns = decltype(data.columns){{"std-map"s, "atomic-hamt"s, "na-hamt"s}};

  std_map_type std_map;
  atomic_map_type atomic_map;
  non_atomic_map_type non_atomic_map;

  auto profile = make_profiler(sample_size);

  { // Insert: one version per item
    std::cout << fmt::format("{}({}) -- INSERT\n", label, size);
    data.insert_times[0] = profile(data.columns[0], [&]() {
      std_map = std_map_type{};
      for (const auto& [key, value] : items)
        std_map.insert_or_assign(key, value);
    });
    data.insert_times[1] = profile(data.columns[1], [&]() {
      atomic_map = atomic_map_type{};
      for (const auto& [key, value] : items)
        atomic_map = atomic_map.plus(key, value);
    });
    data.insert_times[2] = profile(data.columns[2], [&]() {
      non_atomic_map = non_atomic_map_type{};
      for (const auto& [key, value] : items)
        non_atomic_map = non_atomic_map.plus(key, value);
    });
  }

  { // Iterate
    std::cout << fmt::format("{}({}) -- ITERATE\n", label, size);
    std::size_t counter = 0;
    data.iterate_times[0] = profile(data.columns[0], [&]() {
      for (const auto& item : std_map)
        counter += item.second;
    });
    data.iterate_times[1] = profile(data.columns[1], [&]() {
      for (const auto& item : atomic_map)
        counter += item.second;
    });
    data.iterate_times[2] = profile(data.columns[2], [&]() {
      for (const auto& item : non_atomic_map)
        counter += item.second;
    });
    data.volatile_data = counter;
  }

  { // Find
    std::cout << fmt::format("{}({}) -- FIND\n", label, size);
    std::size_t counter = 0;
    data.find_times[0] = profile(data.columns[0], [&]() {
      for (const auto& item : items)
        counter += std_map.at(item.first);
    });
    data.find_times[1] = profile(data.columns[1], [&]() {
      for (const auto& item : items)
        counter += atomic_map[item.first];
    });
    data.find_times[2] = profile(data.columns[2], [&]() {
      for (const auto& item : items)
        counter += non_atomic_map[item.first];
    });
    data.volatile_data += counter;
  }

  { // Delete: every sample starts from the full map
    std::cout << fmt::format("{}({}) -- DELETE\n", label, size);
    data.delete_times[0] = profile(data.columns[0], [&]() {
      auto copy = std_map;
      for (const auto& item : items)
        copy.erase(item.first);
    });
    data.delete_times[1] = profile(data.columns[1], [&]() {
      auto version = atomic_map;
      for (const auto& item : items)
        version = version.minus(item.first);
    });
    data.delete_times[2] = profile(data.columns[2], [&]() {
      auto version = non_atomic_map;
      for (const auto& item : items)
        version = version.minus(item.first);
    });
  }

  std::cout << "\n";
  return data;
}

// --------------------------------------------------------------------------------------- Sequences

Data run_sequences(std::string label, const std::size_t size, const uint32_t sample_size) {
  using vector_type = obsidian::persistent_vector<std::size_t>;
  using stack_type = obsidian::persistent_stack<std::size_t>;

  Data data;
  data.label = label;
  data.size = size;
  data.columns = decltype(data.columns){{"std-vector"s, "pvector"s, "pstack"s}};

  std::vector<std::size_t> std_vector;
  vector_type vector;
  stack_type stack;

  auto profile = make_profiler(sample_size);

  { // Append (push for the stack)
    std::cout << fmt::format("{}({}) -- INSERT\n", label, size);
    data.insert_times[0] = profile(data.columns[0], [&]() {
      std_vector = std::vector<std::size_t>{};
      for (auto i = 0u; i < size; ++i)
        std_vector.push_back(i);
    });
    data.insert_times[1] = profile(data.columns[1], [&]() {
      vector = vector_type{};
      for (auto i = 0u; i < size; ++i)
        vector = vector.plus(i);
    });
    data.insert_times[2] = profile(data.columns[2], [&]() {
      stack = stack_type{};
      for (auto i = 0u; i < size; ++i)
        stack = stack.plus(i);
    });
  }

  { // Iterate
    std::cout << fmt::format("{}({}) -- ITERATE\n", label, size);
    std::size_t counter = 0;
    data.iterate_times[0] = profile(data.columns[0], [&]() {
      for (const auto value : std_vector)
        counter += value;
    });
    data.iterate_times[1] = profile(data.columns[1], [&]() {
      for (const auto value : vector)
        counter += value;
    });
    data.iterate_times[2] = profile(data.columns[2], [&]() {
      for (const auto value : stack)
        counter += value;
    });
    data.volatile_data = counter;
  }

  { // Indexed reads; the stack only reads its top
    std::cout << fmt::format("{}({}) -- FIND\n", label, size);
    std::size_t counter = 0;
    data.find_times[0] = profile(data.columns[0], [&]() {
      for (auto i = 0u; i < size; ++i)
        counter += std_vector[i];
    });
    data.find_times[1] = profile(data.columns[1], [&]() {
      for (auto i = 0u; i < size; ++i)
        counter += vector[i];
    });
    data.find_times[2] = profile(data.columns[2], [&]() {
      for (auto i = 0u; i < size; ++i)
        counter += stack.front();
    });
    data.volatile_data += counter;
  }

  { // Remove from the end (pop for the stack)
    std::cout << fmt::format("{}({}) -- DELETE\n", label, size);
    data.delete_times[0] = profile(data.columns[0], [&]() {
      auto copy = std_vector;
      while (!copy.empty())
        copy.pop_back();
    });
    data.delete_times[1] = profile(data.columns[1], [&]() {
      auto version = vector;
      while (!version.empty())
        version = version.minus_at(version.size() - 1);
    });
    data.delete_times[2] = profile(data.columns[2], [&]() {
      auto version = stack;
      while (!version.empty())
        version = version.pop();
    });
  }

  std::cout << "\n";
  return data;
}

// ------------------------------------------------------------------------------------------ Output

template <typename RunFn>
void run_sizes(std::ostream& os, std::string label, std::size_t size0, std::size_t max_size,
               uint32_t sample_size, RunFn run) {
  // collect all the data
  std::vector<Data> data;
  for (std::size_t size = size0; size <= max_size; size *= 2)
    data.push_back(run(label, size, sample_size));

  auto output = [&](std::string op_type, auto fn) {
    os << fmt::format("{}_{}\t{}\n", label, op_type, fmt::join(data[0].columns, "\t"));
    for (const auto& datum : data)
      os << fmt::format("{}\t{}\n", datum.size, fmt::join(fn(datum), "\t"));
    os << "\n";
  };

  output("insert", std::mem_fn(&Data::insert_times));
  output("iterate", std::mem_fn(&Data::iterate_times));
  output("find", std::mem_fn(&Data::find_times));
  output("delete", std::mem_fn(&Data::delete_times));
}

void run_benchmark(std::string filename) {
  const std::size_t min_size = 1000;
  const std::size_t max_size = 512000;
  const uint32_t sample_size = 10;
  std::fstream file(filename, file.out);
  if (!file.is_open()) {
    std::cerr << fmt::format("failed to open file '{}'\n", filename);
    std::exit(1);
  }

  run_sizes(file, "integer", min_size, max_size, sample_size, run_maps<int, int>);
  run_sizes(file, "string", min_size, max_size, sample_size, run_maps<std::string, int>);
  run_sizes(file, "sequence", min_size, max_size, sample_size, run_sequences);

  file.close();
  std::cout << fmt::format("Benchmark results collated in '{}'\n", filename);
}

int main(int argc, char* argv[]) {
  run_benchmark(argc > 1 ? argv[1] : "/tmp/obsidian-benchmark.csv");
  return EXIT_SUCCESS;
}
