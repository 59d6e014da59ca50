#pragma once

#include "mbx/types.hpp"
#include <algorithm>
#include <any>
#include <concepts>
#include <optional>
#include <string>
#include <iterator>
#include <type_traits>
#include <typeinfo>
#include <utility>

namespace mbx {

/**
 * @brief 类型擦除的单值载体
 *
 * Box 不携带静态类型信息，通道两端必须按约定使用相同的类型。
 * 取值有两种方式：
 * 1. `unsafe_unpack<T>()`：调用方断言类型正确；类型不符属于编程错误，
 *    抛出 `std::bad_any_cast`，而不是读取错误的内存。
 * 2. `try_unpack<T>()`：安全向下转型，类型不符时返回空 optional。
 */
class Box {
public:
  Box() noexcept = default;

  template <typename T>
    requires(!std::same_as<std::decay_t<T>, Box>) && Packable<T>
  explicit Box(T &&value) : payload_(store(std::forward<T>(value))) {}

  Box(const Box &) = default;
  Box &operator=(const Box &) = default;
  Box(Box &&) noexcept = default;
  Box &operator=(Box &&) noexcept = default;

  template <typename T> [[nodiscard]] T unsafe_unpack() const & {
    return std::any_cast<const T &>(payload_);
  }

  /// 右值版本：搬走负载，Box 之后不再使用
  template <typename T> [[nodiscard]] T unsafe_unpack() && {
    return std::any_cast<T>(std::move(payload_));
  }

  template <typename T>
  [[nodiscard]] std::optional<T> try_unpack() const & {
    if (const T *p = std::any_cast<T>(&payload_)) {
      return *p;
    }
    return std::nullopt;
  }

  template <typename T> [[nodiscard]] std::optional<T> try_unpack() && {
    if (T *p = std::any_cast<T>(&payload_)) {
      return std::optional<T>(std::move(*p));
    }
    return std::nullopt;
  }

  template <typename T> [[nodiscard]] bool holds() const noexcept {
    return payload_.type() == typeid(T);
  }

  [[nodiscard]] bool has_value() const noexcept {
    return payload_.has_value();
  }

  [[nodiscard]] const std::type_info &type() const noexcept {
    return payload_.type();
  }

private:
  template <typename T> static std::any store(T &&value) {
    if constexpr (CharArray<T>) {
      // 截断在第一个 '\0'，没有 '\0' 时取整个数组
      return std::any(std::string(
          std::begin(value), std::find(std::begin(value), std::end(value), '\0')));
    } else {
      return std::any(std::forward<T>(value));
    }
  }

  std::any payload_;
};

/// 装箱，总是成功。字符数组保存为 std::string
template <typename T>
  requires Packable<T>
[[nodiscard]] Box pack(T &&value) {
  return Box(std::forward<T>(value));
}

/// 拆箱。前置条件：box 中保存的正是 T
template <typename T> [[nodiscard]] T unsafe_unpack(Box &&box) {
  return std::move(box).template unsafe_unpack<T>();
}

template <typename T> [[nodiscard]] T unsafe_unpack(const Box &box) {
  return box.template unsafe_unpack<T>();
}

} // namespace mbx
