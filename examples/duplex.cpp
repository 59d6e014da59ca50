#include "mbx/channel/channel.hpp"
#include "mbx/process.hpp"
#include <chrono>
#include <iostream>
#include <thread>

using namespace mbx;

struct Request {
  int x;
  int y;
};

struct Response {
  int sum;
};

// -----------------------------------------------------------
// Thread A: Client -> 发起计算请求 (x + y)
// Thread B: Server -> 接收请求，计算结果，返回
// -----------------------------------------------------------

void run_client(View client) {
  std::cout << "[Client]   Thread " << my_pid() << " sending 5 tasks..."
            << std::endl;

  for (int i = 0; i < 5; ++i) {
    Request req{i, i * 10};
    client.send(req);

    auto resp = client.await_as<Response>();
    std::cout << "[Client]   Request: " << req.x << " + " << req.y
              << " | Result: " << resp.sum << std::endl;

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
  }

  std::cout << "[Client]   Done." << std::endl;
}

void run_server(View server) {
  std::cout << "[Server]   Thread " << my_pid() << " started." << std::endl;

  for (int i = 0; i < 5; ++i) {
    auto req = server.await_as<Request>();
    server.send(Response{req.x + req.y});
  }
  std::cout << "[Server]   Processed all tasks. Exiting." << std::endl;
}

int main() {
  std::cout << "=== Duplex Channel Demo (Threads) ===" << std::endl;

  // 1. 创建通道，取得两个方向相反的视图
  auto ch = new_channel();
  View client = make_sender(ch);
  View server = make_receiver(ch);

  // 2. 启动服务器
  auto server_proc = spawn([server] { run_server(server); });

  // 3. 在主线程运行客户端
  run_client(client);

  // 4. 等待结束
  server_proc.join();

  std::cout << "=== Demo Finished ===" << std::endl;
  return 0;
}
