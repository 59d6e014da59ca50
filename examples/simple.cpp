#include "mbx/mbx.hpp"
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace mbx;
using namespace std::chrono_literals;

int main() {
  std::cout << "=== Simple Channel Demo ===" << std::endl;

  auto [sender, receiver] = duplex_channel();

  auto producer = spawn([tx = sender]() mutable {
    for (int i = 0; i < 10; ++i) {
      tx.send(std::string("message #") + std::to_string(i));
      std::this_thread::sleep_for(50ms);
    }
    std::cout << "[Sender]   Done." << std::endl;
  });

  // 生产者停止后，等待超时即退出
  while (auto msg = receiver.await_timeout_as<std::string>(500ms)) {
    std::cout << "[Receiver] Received: " << *msg << std::endl;
  }
  std::cout << "[Receiver] Timed out, no more messages." << std::endl;

  producer.join();
  std::cout << "=== Demo Finished ===" << std::endl;
  return 0;
}
