#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace mbx::test {

// 线程辅助工具
class ThreadRunner {
  std::vector<std::thread> threads_;

public:
  template <typename Func, typename... Args>
  void spawn(Func&& func, Args&&... args) {
    threads_.emplace_back(std::forward<Func>(func), std::forward<Args>(args)...);
  }

  void join_all() {
    for (auto& t : threads_) {
      if (t.joinable()) {
        t.join();
      }
    }
    threads_.clear();
  }

  ~ThreadRunner() {
    join_all();
  }
};

// 超时检测工具：func 在 timeout 内结束返回 true
// 超时的 worker 会被分离，func 只能按值持有它用到的对象 (shared_ptr / View)
template <typename Func>
bool run_with_timeout(Func&& func, std::chrono::milliseconds timeout) {
  auto finished = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([finished, f = std::forward<Func>(func)]() mutable {
    f();
    finished->store(true);
  });

  auto start = std::chrono::steady_clock::now();
  while (!finished->load()) {
    if (std::chrono::steady_clock::now() - start > timeout) {
      worker.detach();
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  worker.join();
  return true;
}

} // namespace mbx::test
