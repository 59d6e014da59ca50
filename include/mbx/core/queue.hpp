#pragma once

#include "mbx/core/stack.hpp"
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>

namespace mbx {

/**
 * @brief 双栈 FIFO 队列 (Banker's Queue)
 *
 * 由两个栈组成：
 * - `front_`：可直接出队的元素，栈顶即队首；
 * - `rear_` ：尚未就绪的元素，栈顶即最近入队的元素。
 *
 * 逻辑内容恒等于 `front_ ++ reverse(rear_)`。
 * 每次 dequeue / peek 之后满足：front_ 为空 => rear_ 为空。
 *
 * 轮转 (把 rear_ 反转成新的 front_) 只在 front_ 耗尽时发生，
 * 其 O(n) 开销摊到此前的 n 次 enqueue 上，因此所有操作均摊 O(1)。
 *
 * @note 非线程安全。跨线程共享请使用 SharedQueue。
 */
template <typename T> class Queue {
public:
  Queue() = default;

  // ===========================================================================
  // 写端
  // ===========================================================================

  /// 总是压入 rear_，从不触碰 front_
  template <typename U>
    requires std::is_constructible_v<T, U>
  void enqueue(U &&item) {
    rear_.push(std::forward<U>(item));
  }

  template <typename... Args> void emplace(Args &&...args) {
    rear_.emplace(std::forward<Args>(args)...);
  }

  // ===========================================================================
  // 读端
  // ===========================================================================

  [[nodiscard]] std::optional<T> dequeue() {
    switch (front_.size()) {
    case 0:
      if (rear_.empty()) {
        return std::nullopt;
      }
      front_ = rear_.reversed();
      return front_.pop();

    case 1: {
      auto head = front_.pop();
      switch (rear_.size()) {
      case 0:
        break;
      case 1:
        // 单元素 rear 直接挪过去，省掉一次反转
        front_.push(std::move(*rear_.top()));
        rear_.clear();
        break;
      default:
        front_ = rear_.reversed();
        break;
      }
      return head;
    }

    default:
      return front_.pop();
    }
  }

  /**
   * @brief 查看队首但不移除
   *
   * 与 dequeue 做相同的轮转，使之后的 peek / dequeue 走 O(1) 快路径。
   * 队首留在 front_ 栈顶。
   */
  [[nodiscard]] std::optional<T> peek() {
    if (const T *h = head()) {
      return *h;
    }
    return std::nullopt;
  }

  /// peek 的零拷贝版本，空队列返回 nullptr
  [[nodiscard]] const T *head() {
    switch (front_.size()) {
    case 0:
      if (rear_.empty()) {
        return nullptr;
      }
      front_ = rear_.reversed();
      break;

    case 1:
      if (!rear_.empty()) {
        // 队首压回新 front_ 的栈顶：front_ := b :: reverse(rear_)
        auto b = front_.pop();
        front_ = rear_.reversed();
        front_.push(std::move(*b));
      }
      break;

    default:
      break;
    }
    return front_.top();
  }

  // ===========================================================================
  // 状态查询
  // ===========================================================================

  [[nodiscard]] std::size_t size() const noexcept {
    return front_.size() + rear_.size();
  }
  [[nodiscard]] bool empty() const noexcept {
    return front_.empty() && rear_.empty();
  }

  void clear() noexcept {
    front_.clear();
    rear_.clear();
  }

  [[nodiscard]] std::size_t front_size() const noexcept {
    return front_.size();
  }
  [[nodiscard]] std::size_t rear_size() const noexcept { return rear_.size(); }

private:
  Stack<T> front_;
  Stack<T> rear_;
};

/**
 * @brief 带锁的 Queue，作为通道两端共享的存储单元
 *
 * 轮转会同时修改 front_ 和 rear_，所以每个操作都在同一把互斥锁内完成。
 * enqueue 之后通知条件变量，等待方无需自旋。
 *
 * 每个方向只允许一个生产者和一个消费者。
 */
template <typename T> class SharedQueue {
public:
  SharedQueue() = default;

  SharedQueue(const SharedQueue &) = delete;
  SharedQueue &operator=(const SharedQueue &) = delete;

  template <typename U>
    requires std::is_constructible_v<T, U>
  void enqueue(U &&item) {
    {
      std::lock_guard lock(mutex_);
      queue_.enqueue(std::forward<U>(item));
    }
    not_empty_.notify_one();
  }

  [[nodiscard]] std::optional<T> dequeue() {
    std::lock_guard lock(mutex_);
    return queue_.dequeue();
  }

  [[nodiscard]] std::optional<T> peek() {
    std::lock_guard lock(mutex_);
    return queue_.peek();
  }

  /// 等价于 peek().has_value()，但不拷贝队首
  [[nodiscard]] bool has_next() {
    std::lock_guard lock(mutex_);
    return queue_.head() != nullptr;
  }

  // ===========================================================================
  // 阻塞接口：检查与取出在同一次加锁内完成
  // ===========================================================================

  [[nodiscard]] std::optional<T> wait_dequeue() {
    std::unique_lock lock(mutex_);
    not_empty_.wait(lock, [this] { return !queue_.empty(); });
    return queue_.dequeue();
  }

  /// 超时后仍在锁内做最后一次非阻塞出队
  template <class Rep, class Period>
  [[nodiscard]] std::optional<T>
  wait_dequeue_for(const std::chrono::duration<Rep, Period> &timeout) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
    return queue_.dequeue();
  }

  template <class Clock, class Duration>
  [[nodiscard]] std::optional<T>
  wait_dequeue_until(const std::chrono::time_point<Clock, Duration> &deadline) {
    std::unique_lock lock(mutex_);
    not_empty_.wait_until(lock, deadline, [this] { return !queue_.empty(); });
    return queue_.dequeue();
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

  [[nodiscard]] bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  void clear() {
    std::lock_guard lock(mutex_);
    queue_.clear();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable not_empty_;
  Queue<T> queue_;
};

} // namespace mbx
