#include <benchmark/benchmark.h>
#include <cstdint>
#include <cstdio>
#include <numa.h>
#include <print>
#include <string>
#include <system_error>
#include <thread>

#include "mbx/channel/channel.hpp"
#include "mbx/core/queue.hpp"
#include "mbx/platform.hpp"
#include "mbx/process.hpp"

// ============================================================================
// 1. Queue_PushPop
// 场景：单线程，front 始终为单元素，走不反转的快路径
// ============================================================================

static void BM_Queue_PushPop(benchmark::State &state) {
  mbx::Queue<uint64_t> q;
  uint64_t val = 1;

  for ([[maybe_unused]] auto _ : state) {
    q.enqueue(val);
    auto out = q.dequeue();
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_Queue_PushPop);

// ============================================================================
// 2. Queue_Batch<N>
// 场景：先写入 N 个再全部读出，单次反转的开销摊到 N 次 enqueue 上
// ============================================================================

static void BM_Queue_Batch(benchmark::State &state) {
  const auto n = static_cast<uint64_t>(state.range(0));
  mbx::Queue<uint64_t> q;

  for ([[maybe_unused]] auto _ : state) {
    for (uint64_t i = 0; i < n; ++i) {
      q.enqueue(i);
    }
    for (uint64_t i = 0; i < n; ++i) {
      auto out = q.dequeue();
      benchmark::DoNotOptimize(out);
    }
  }
  state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n) * 2);
}
BENCHMARK(BM_Queue_Batch)->RangeMultiplier(8)->Range(8, 32768);

// ============================================================================
// 3. SharedQueue_PushPop
// 场景：无竞争时加锁的额外开销
// ============================================================================

static void BM_SharedQueue_PushPop(benchmark::State &state) {
  mbx::SharedQueue<uint64_t> q;
  uint64_t val = 1;

  for ([[maybe_unused]] auto _ : state) {
    q.enqueue(val);
    auto out = q.dequeue();
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations() * 2);
}
BENCHMARK(BM_SharedQueue_PushPop);

// ============================================================================
// 4. Channel_SendReceive
// 场景：装箱 + 入队 + 出队 + 拆箱
// ============================================================================

static void BM_Channel_SendReceive(benchmark::State &state) {
  auto [tx, rx] = mbx::duplex_channel();

  for ([[maybe_unused]] auto _ : state) {
    tx.send(uint64_t{42});
    auto out = rx.receive_as<uint64_t>();
    benchmark::DoNotOptimize(out);
  }
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Channel_SendReceive);

static void BM_Channel_SendReceive_String(benchmark::State &state) {
  auto [tx, rx] = mbx::duplex_channel();
  const std::string payload(static_cast<size_t>(state.range(0)), 'x');

  for ([[maybe_unused]] auto _ : state) {
    tx.send(payload);
    auto out = rx.receive_as<std::string>();
    benchmark::DoNotOptimize(out);
  }
  state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Channel_SendReceive_String)->Range(8, 4096);

// ============================================================================
// 5. Channel_PingPong
// 场景：跨线程往返延迟。T1 send -> T2 await -> T2 send -> T1 await
// ============================================================================

static void BM_Channel_PingPong(benchmark::State &state) {
  const auto strategy = state.range(0) == 0 ? mbx::WaitStrategy::Block
                                            : mbx::WaitStrategy::Spin;
  auto [client, server] = mbx::duplex_channel();
  const unsigned cores = std::thread::hardware_concurrency();
  const int client_core = 0;
  const int server_core = cores > 1 ? 1 : 0;
  const int server_node =
      numa_available() < 0 ? 0 : numa_node_of_cpu(server_core);

  auto echo = mbx::spawn_on(server_node, server_core,
                            [srv = server, strategy]() mutable {
    while (true) {
      auto v = srv.await_as<uint64_t>(strategy);
      if (v == UINT64_MAX) {
        break;
      }
      srv.send(v);
    }
  });

  // 只在本函数内绑核，结束时恢复，避免影响之后注册的基准
  mbx::ScopedAffinity restore_affinity;
  try {
    mbx::bind_cpu(client_core);
  } catch (const std::system_error &e) {
    std::println(stderr, "Warning: client not pinned: {}", e.what());
  }
  uint64_t seq = 0;
  for ([[maybe_unused]] auto _ : state) {
    client.send(seq);
    auto back = client.await_as<uint64_t>(strategy);
    benchmark::DoNotOptimize(back);
    ++seq;
  }
  client.send(UINT64_MAX);
  echo.join();

  state.SetItemsProcessed(state.iterations());
  state.SetLabel(strategy == mbx::WaitStrategy::Block ? "block" : "spin");
}
BENCHMARK(BM_Channel_PingPong)->Arg(0)->Arg(1)->UseRealTime();

BENCHMARK_MAIN();
