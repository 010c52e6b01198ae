
#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>

#include <cstddef>

namespace obsidian {

/**
 * A null element or key was handed to a structure that does not store nulls.
 * Always raised before any structural change.
 */
class null_argument_error : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

/**
 * A precondition on the collection itself was violated, e.g., a null comparator, or a
 * duplicate key under `fail_on_duplicate_keys`.
 */
class illegal_state_error : public std::logic_error {
public:
  using std::logic_error::logic_error;
};

namespace detail {

  [[noreturn]] inline void throw_index_error(std::size_t index, std::size_t size) {
    throw std::out_of_range{fmt::format("index {} out of bounds for size {}", index, size)};
  }

  //@{ Bounds
  inline void check_index(std::size_t index, std::size_t size) {
    if (index >= size)
      throw_index_error(index, size);
  }

  inline void check_position_index(std::size_t index, std::size_t size) { // insert: index <= size
    if (index > size)
      throw_index_error(index, size);
  }

  inline void check_from_to_index(std::size_t from, std::size_t to, std::size_t size) {
    if (from > to || to > size)
      throw std::out_of_range{
          fmt::format("sub-range [{}, {}) out of bounds for size {}", from, to, size)};
  }

  [[noreturn]] inline void throw_empty_error(const char* what) {
    throw std::out_of_range{fmt::format("{}() called on an empty collection", what)};
  }
  //@}

} // namespace detail

} // namespace obsidian
