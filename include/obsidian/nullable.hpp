
#pragma once

#include "errors.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <type_traits>

namespace obsidian {

// --------------------------------------------------------------------------------- nullable_traits

/**
 * Which values of `T` count as "null".
 *
 * Every structure rejects null elements and keys (map values are the one exception), so the
 * library needs a uniform way to ask. Specialize this for handle types of your own:
 *
 * ```
 * template <> struct obsidian::nullable_traits<MyHandle> {
 *   static constexpr bool is_nullable = true;
 *   static constexpr bool is_null(const MyHandle& handle) noexcept { return !handle.valid(); }
 * };
 * ```
 */
template <typename T, typename Enable = void> struct nullable_traits {
  static constexpr bool is_nullable = false;
  static constexpr bool is_null(const T&) noexcept { return false; }
};

template <typename T> struct nullable_traits<T*> {
  static constexpr bool is_nullable = true;
  static constexpr bool is_null(T* value) noexcept { return value == nullptr; }
};

template <> struct nullable_traits<std::nullptr_t> {
  static constexpr bool is_nullable = true;
  static constexpr bool is_null(std::nullptr_t) noexcept { return true; }
};

template <typename T> struct nullable_traits<std::shared_ptr<T>> {
  static constexpr bool is_nullable = true;
  static bool is_null(const std::shared_ptr<T>& value) noexcept { return value == nullptr; }
};

template <typename T> struct nullable_traits<std::optional<T>> {
  static constexpr bool is_nullable = true;
  static constexpr bool is_null(const std::optional<T>& value) noexcept {
    return !value.has_value();
  }
};

template <typename Signature> struct nullable_traits<std::function<Signature>> {
  static constexpr bool is_nullable = true;
  static bool is_null(const std::function<Signature>& value) noexcept {
    return !static_cast<bool>(value);
  }
};

namespace detail {

  template <typename T> constexpr bool is_null(const T& value) noexcept {
    return nullable_traits<T>::is_null(value);
  }

  /**
   * @throws null_argument_error if `value` is null; `what` names the argument
   */
  template <typename T> constexpr const T& require_non_null(const T& value, const char* what) {
    if constexpr (nullable_traits<T>::is_nullable) {
      if (is_null(value))
        throw null_argument_error{fmt::format("null {} is not permitted", what)};
    }
    return value;
  }

  template <typename Range> void require_no_nulls(const Range& range, const char* what) {
    using item_type = std::remove_cvref_t<decltype(*std::begin(range))>;
    if constexpr (nullable_traits<item_type>::is_nullable) {
      for (const auto& item : range)
        require_non_null(item, what);
    }
  }

} // namespace detail

} // namespace obsidian
