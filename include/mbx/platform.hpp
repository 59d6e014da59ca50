#pragma once

#include <cerrno>
#include <cstdio>
#include <memory>
#include <numa.h>
#include <print>
#include <pthread.h>
#include <sched.h>
#include <system_error>
#include <thread>

// 平台特定的头文件包含
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) ||             \
    defined(_M_IX86)
#include <immintrin.h>
#endif

namespace mbx {

/**
 * @brief CPU 自旋等待提示
 *
 * 在轮询循环中每轮调用一次。x86 上发出 `pause`，ARM64 上发出 `yield`，
 * 其余平台退化为让出时间片。
 */
inline void cpu_relax() noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) ||             \
    defined(_M_IX86)
  _mm_pause();
#elif defined(__aarch64__)
  asm volatile("yield");
#else
  std::this_thread::yield();
#endif
}

/**
 * 绑定当前线程的 CPU 亲和性
 */
inline void bind_cpu(int core_id) {
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(core_id, &cpuset);

  if (sched_setaffinity(0, sizeof(cpu_set_t), &cpuset) != 0) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to set CPU affinity");
  }
}

/**
 * @brief 保存当前线程的 CPU 亲和性，离开作用域时恢复
 *
 * 用于只在一段代码内绑核的场景 (基准测试、临时提升局部性)。
 */
class ScopedAffinity {
public:
  ScopedAffinity() {
    if (sched_getaffinity(0, sizeof(cpu_set_t), &saved_) != 0) {
      throw std::system_error(errno, std::generic_category(),
                              "Failed to read CPU affinity");
    }
  }

  ScopedAffinity(const ScopedAffinity &) = delete;
  ScopedAffinity &operator=(const ScopedAffinity &) = delete;

  ~ScopedAffinity() {
    if (sched_setaffinity(0, sizeof(cpu_set_t), &saved_) != 0) {
      std::println(stderr, "[mbx::platform] Warning: failed to restore CPU "
                           "affinity: errno={}",
                   errno);
    }
  }

  [[nodiscard]] const cpu_set_t &saved() const noexcept { return saved_; }

private:
  cpu_set_t saved_{};
};

namespace detail {
struct NodemaskDeleter {
  void operator()(struct bitmask *mask) const noexcept {
    numa_free_nodemask(mask);
  }
};
using NodemaskPtr = std::unique_ptr<struct bitmask, NodemaskDeleter>;
} // namespace detail

/**
 * @brief 把当前线程放到 node 上的 core_id，并让之后的内存分配只落在 node
 *
 * 通道两端放在同一节点时，队列节点的分配与访问都不跨 NUMA 互连。
 *
 * @throws std::system_error 系统不支持 NUMA、节点不存在或 core 不属于该节点
 */
inline void bind_numa(int node, int core_id) {
  if (numa_available() < 0) {
    throw std::system_error(ENOTSUP, std::generic_category(),
                            "NUMA is not available on this system");
  }
  if (node < 0 || node > numa_max_node()) {
    throw std::system_error(EINVAL, std::generic_category(),
                            "NUMA node out of range");
  }
  if (numa_node_of_cpu(core_id) != node) {
    throw std::system_error(EINVAL, std::generic_category(),
                            "CPU core does not belong to the requested NUMA node");
  }

  detail::NodemaskPtr mask(numa_allocate_nodemask());
  if (!mask) {
    throw std::system_error(ENOMEM, std::generic_category(),
                            "Failed to allocate NUMA nodemask");
  }
  numa_bitmask_setbit(mask.get(), static_cast<unsigned>(node));

  bind_cpu(core_id);
  numa_set_membind(mask.get());
}

} // namespace mbx
