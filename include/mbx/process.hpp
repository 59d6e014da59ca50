#pragma once

#include "mbx/platform.hpp"
#include <concepts>
#include <cstdio>
#include <functional>
#include <print>
#include <system_error>
#include <thread>
#include <utility>

namespace mbx {

using ProcessId = std::thread::id;

/**
 * @brief 轻量执行上下文
 *
 * 对 std::jthread 的薄封装。析构时自动 join，不会留下悬空线程。
 */
class Process {
public:
  explicit Process(std::jthread thread) : thread_(std::move(thread)) {}

  Process(const Process &) = delete;
  Process &operator=(const Process &) = delete;
  Process(Process &&) noexcept = default;
  Process &operator=(Process &&) noexcept = default;

  [[nodiscard]] ProcessId id() const noexcept { return thread_.get_id(); }

  [[nodiscard]] bool joinable() const noexcept { return thread_.joinable(); }

  void join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

private:
  std::jthread thread_;
};

/// 在新线程中运行 task
template <typename F>
  requires std::invocable<F>
[[nodiscard]] Process spawn(F &&task) {
  return Process(std::jthread(std::forward<F>(task)));
}

/**
 * 在新线程中运行 task，运行前绑定到 core_id。
 * 绑核失败时打印警告并在未绑核的线程上继续运行。
 */
template <typename F>
  requires std::invocable<F>
[[nodiscard]] Process spawn_on(int core_id, F &&task) {
  return Process(
      std::jthread([core_id, task = std::forward<F>(task)]() mutable {
        try {
          bind_cpu(core_id);
        } catch (const std::system_error &e) {
          std::println(stderr, "[mbx::process] Warning: bind_cpu({}) failed: {}",
                       core_id, e.what());
        }
        std::invoke(task);
      }));
}

/**
 * 在新线程中运行 task，运行前把线程和它的内存分配绑定到 NUMA 节点 node 的
 * core_id 上。绑定失败时打印警告并在未绑定的线程上继续运行。
 */
template <typename F>
  requires std::invocable<F>
[[nodiscard]] Process spawn_on(int node, int core_id, F &&task) {
  return Process(
      std::jthread([node, core_id, task = std::forward<F>(task)]() mutable {
        try {
          bind_numa(node, core_id);
        } catch (const std::system_error &e) {
          std::println(stderr,
                       "[mbx::process] Warning: bind_numa({}, {}) failed: {}",
                       node, core_id, e.what());
        }
        std::invoke(task);
      }));
}

[[nodiscard]] inline ProcessId my_pid() noexcept {
  return std::this_thread::get_id();
}

} // namespace mbx
