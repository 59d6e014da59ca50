#pragma once

#include "mbx/core/box.hpp"
#include "mbx/core/queue.hpp"
#include "mbx/platform.hpp"
#include "mbx/types.hpp"
#include <algorithm>
#include <chrono>
#include <concepts>
#include <cstdio>
#include <memory>
#include <optional>
#include <print>
#include <thread>
#include <utility>

namespace mbx {

using BoxQueue = SharedQueue<Box>;

/**
 * @brief 通道句柄：一对共享的队列
 *
 * 句柄本身没有方向。通过 make_sender / make_receiver 取得两个视图，
 * 两个视图引用同一对队列，只是 inbox / outbox 的角色互换。
 */
struct Channel {
  std::shared_ptr<BoxQueue> inbox;
  std::shared_ptr<BoxQueue> outbox;
};

/// 创建一个包含两个空队列的通道
[[nodiscard]] inline Channel new_channel() {
  return Channel{std::make_shared<BoxQueue>(), std::make_shared<BoxQueue>()};
}

namespace detail {

/**
 * @brief await 取出数据后的收尾
 *
 * Block 策略下检查与取出在同一把锁内，item 必然有值；Spin 策略下二者分两次
 * 加锁，只有当另一个消费者同时读取同一个 inbox 时才会落空。落空时记录日志并
 * 抛出 ChannelError。
 */
[[nodiscard]] inline Box take_awaited(std::optional<Box> item,
                                      const BoxQueue &inbox) {
  if (!item) {
    std::println(stderr,
                 "[mbx::channel] await: inbox reported a pending item but "
                 "dequeue returned nothing, inbox={} pending={}",
                 static_cast<const void *>(&inbox), inbox.size());
    throw ChannelError("await: pending item vanished between check and take "
                       "(concurrent consumer on the same inbox)");
  }
  return std::move(*item);
}

/// now + timeout，超出 Clock 表示范围时截断为 time_point::max()
template <class Clock, class Rep, class Period>
[[nodiscard]] typename Clock::time_point
deadline_after(const std::chrono::duration<Rep, Period> &timeout) {
  using seconds_f = std::chrono::duration<long double>;
  const auto now = Clock::now();
  // 留 1s 余量，ceil 向上取整后也不会越界
  if (seconds_f(timeout) >=
      seconds_f(Clock::time_point::max() - now) - std::chrono::seconds(1)) {
    return Clock::time_point::max();
  }
  if (seconds_f(timeout) <= seconds_f::zero()) {
    return now;
  }
  return now + std::chrono::ceil<typename Clock::duration>(timeout);
}

} // namespace detail

/**
 * @brief 通道端点 (视图)
 *
 * 轻量句柄，持有两个队列的共享引用，从不复制队列内容。
 * send 写入 outbox；receive / await 读取 inbox。
 *
 * 同一方向上只允许一个消费者：不要让两个视图同时读取同一个 inbox。
 */
class View {
public:
  View(std::shared_ptr<BoxQueue> inbox, std::shared_ptr<BoxQueue> outbox)
      : inbox_(std::move(inbox)), outbox_(std::move(outbox)) {}

  // --- 基础接口 ---
  template <typename T>
    requires Packable<T>
  void send(T &&item) {
    outbox_->enqueue(pack(std::forward<T>(item)));
  }

  /// 非阻塞，队列为空时返回 nullopt
  [[nodiscard]] std::optional<Box> receive() { return inbox_->dequeue(); }

  [[nodiscard]] bool has_next() { return inbox_->has_next(); }

  // --- 阻塞接口 ---

  /**
   * @brief 一直等待直到 inbox 中出现数据，然后取出
   *
   * Block 策略在条件变量上睡眠，由 enqueue 唤醒；
   * Spin 策略轮询 has_next，每轮 cpu_relax 并让出时间片。
   *
   * @throws ChannelError 检查到有数据却取不到 (存在并发消费者)
   */
  [[nodiscard]] Box
  await(WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
    std::optional<Box> item;
    if (strategy == WaitStrategy::Block) {
      item = inbox_->wait_dequeue();
    } else {
      while (!inbox_->has_next()) {
        cpu_relax();
        std::this_thread::yield();
      }
      item = inbox_->dequeue();
    }
    return detail::take_awaited(std::move(item), *inbox_);
  }

  // --- 超时接口 ---

  /**
   * @brief 限时等待
   *
   * 超时后仍做最后一次非阻塞接收，然后返回。timeout <= 0 时只做这一次接收。
   */
  template <class Rep, class Period>
  [[nodiscard]] std::optional<Box>
  await_timeout(const std::chrono::duration<Rep, Period> &timeout,
                WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
    using clock = std::chrono::steady_clock;
    const auto deadline = detail::deadline_after<clock>(timeout);
    if (strategy == WaitStrategy::Block) {
      return inbox_->wait_dequeue_until(deadline);
    }

    for (auto now = clock::now(); now < deadline; now = clock::now()) {
      if (auto item = inbox_->dequeue()) {
        return item;
      }
      std::this_thread::sleep_for(std::min<clock::duration>(
          deadline - now, config::AWAIT_POLL_INTERVAL));
    }
    return inbox_->dequeue();
  }

  /// 整数超时以 config::TIMEOUT_UNIT (秒) 为单位
  template <std::integral Units>
  [[nodiscard]] std::optional<Box>
  await_timeout(Units units,
                WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
    return await_timeout(config::TIMEOUT_UNIT * units, strategy);
  }

  // --- 类型化接口 (调用方保证类型一致) ---
  template <typename T> [[nodiscard]] std::optional<T> receive_as() {
    if (auto box = receive()) {
      return unsafe_unpack<T>(std::move(*box));
    }
    return std::nullopt;
  }

  template <typename T>
  [[nodiscard]] T
  await_as(WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
    return unsafe_unpack<T>(await(strategy));
  }

  template <typename T, class Rep, class Period>
  [[nodiscard]] std::optional<T>
  await_timeout_as(const std::chrono::duration<Rep, Period> &timeout,
                   WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
    if (auto box = await_timeout(timeout, strategy)) {
      return unsafe_unpack<T>(std::move(*box));
    }
    return std::nullopt;
  }

  // --- 状态查询 ---
  [[nodiscard]] std::size_t pending() const { return inbox_->size(); }

  /// other 是否是同一通道上方向相反的视图
  [[nodiscard]] bool aliases(const View &other) const noexcept {
    return inbox_ == other.outbox_ && outbox_ == other.inbox_;
  }

  [[nodiscard]] const std::shared_ptr<BoxQueue> &inbox() const noexcept {
    return inbox_;
  }
  [[nodiscard]] const std::shared_ptr<BoxQueue> &outbox() const noexcept {
    return outbox_;
  }

private:
  std::shared_ptr<BoxQueue> inbox_;
  std::shared_ptr<BoxQueue> outbox_;
};

// =========================================================
// 视图构造
// =========================================================

/// 正向视图：inbox / outbox 与句柄一致
[[nodiscard]] inline View make_sender(const Channel &ch) {
  return View(ch.inbox, ch.outbox);
}

/// 镜像视图：inbox 与 outbox 互换
[[nodiscard]] inline View make_receiver(const Channel &ch) {
  return View(ch.outbox, ch.inbox);
}

// 工厂：一次创建通道并取得两端
[[nodiscard]] inline std::pair<View, View> duplex_channel() {
  auto ch = new_channel();
  return std::make_pair(make_sender(ch), make_receiver(ch));
}

// =========================================================
// 自由函数形式
// =========================================================

template <typename T>
  requires Packable<T>
void send(View &view, T &&item) {
  view.send(std::forward<T>(item));
}

[[nodiscard]] inline std::optional<Box> receive(View &view) {
  return view.receive();
}

[[nodiscard]] inline bool has_next(View &view) { return view.has_next(); }

[[nodiscard]] inline Box
await(View &view, WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
  return view.await(strategy);
}

template <typename Timeout>
[[nodiscard]] std::optional<Box>
await_timeout(View &view, const Timeout &timeout,
              WaitStrategy strategy = config::DEFAULT_WAIT_STRATEGY) {
  return view.await_timeout(timeout, strategy);
}

} // namespace mbx
