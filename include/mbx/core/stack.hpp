#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace mbx {

/**
 * @brief LIFO 栈
 *
 * 底层为连续存储，`items_.back()` 即栈顶 (最近一次 push 的元素)。
 * 只由所属的 Queue 独占持有，通过 push / pop / clear 修改。
 *
 * LIFO 律：pop 返回的恰好是 peek 会返回的元素；push 之后立即 pop
 * 不影响栈中其余元素。
 */
template <typename T> class Stack {
public:
  Stack() = default;

  template <typename U>
    requires std::is_constructible_v<T, U>
  void push(U &&item) {
    items_.emplace_back(std::forward<U>(item));
  }

  template <typename... Args> T &emplace(Args &&...args) {
    return items_.emplace_back(std::forward<Args>(args)...);
  }

  [[nodiscard]] std::optional<T> pop() {
    if (items_.empty()) {
      return std::nullopt;
    }
    std::optional<T> res(std::move(items_.back()));
    items_.pop_back();
    return res;
  }

  [[nodiscard]] std::optional<T> peek() const {
    if (items_.empty()) {
      return std::nullopt;
    }
    return items_.back();
  }

  /// 零拷贝查看栈顶，空栈返回 nullptr
  [[nodiscard]] T *top() noexcept {
    return items_.empty() ? nullptr : &items_.back();
  }
  [[nodiscard]] const T *top() const noexcept {
    return items_.empty() ? nullptr : &items_.back();
  }

  void clear() noexcept { items_.clear(); }

  /**
   * @brief 反转：把全部元素按相反顺序搬进一个新栈，本栈清空
   *
   * 原栈底成为新栈顶。这是 Queue 轮转 (rear -> front) 的唯一 O(n) 步骤。
   */
  [[nodiscard]] Stack reversed() {
    Stack out;
    out.items_ = std::move(items_);
    std::reverse(out.items_.begin(), out.items_.end());
    items_.clear();
    return out;
  }

  [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
  [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

private:
  std::vector<T> items_;
};

} // namespace mbx
