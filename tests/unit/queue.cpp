#include "mbx/core/queue.hpp"
#include "../fixtures/config.hpp"
#include <deque>
#include <gtest/gtest.h>
#include <memory>
#include <random>
#include <string>

using namespace mbx;
using namespace mbx::test;

class QueueTest : public ::testing::Test {
protected:
  Queue<int> q_;

  // dequeue / peek 之后：front 为空 => rear 为空
  void expect_rotation_invariant() const {
    if (q_.front_size() == 0) {
      EXPECT_EQ(q_.rear_size(), 0);
    }
  }
};

// ============================================================================
// 1. 空队列
// ============================================================================
TEST_F(QueueTest, EmptyQueueReturnsNothing) {
  EXPECT_TRUE(q_.empty());
  EXPECT_EQ(q_.size(), 0);
  EXPECT_FALSE(q_.dequeue().has_value());
  EXPECT_FALSE(q_.peek().has_value());
  EXPECT_EQ(q_.head(), nullptr);
}

// ============================================================================
// 2. FIFO 与交错
// ============================================================================
TEST_F(QueueTest, FifoOrder) {
  for (int i = 1; i <= 5; ++i) {
    q_.enqueue(i);
  }
  EXPECT_EQ(q_.size(), 5);

  for (int i = 1; i <= 5; ++i) {
    EXPECT_EQ(q_.dequeue(), i);
    expect_rotation_invariant();
  }
  EXPECT_TRUE(q_.empty());
  EXPECT_FALSE(q_.dequeue().has_value());
}

TEST_F(QueueTest, InterleavedEnqueueDequeue) {
  q_.enqueue(1);
  q_.enqueue(2);
  EXPECT_EQ(q_.dequeue(), 1);
  q_.enqueue(3);
  EXPECT_EQ(q_.dequeue(), 2);
  EXPECT_EQ(q_.dequeue(), 3);
  EXPECT_FALSE(q_.dequeue().has_value());
}

TEST_F(QueueTest, RandomInterleavingMatchesReferenceDeque) {
  std::mt19937 rng(1234);
  std::bernoulli_distribution do_push(0.55);
  std::deque<int> model;
  int next = 0;

  for (int step = 0; step < TestConfig::MEDIUM_DATA_SIZE; ++step) {
    if (do_push(rng)) {
      q_.enqueue(next);
      model.push_back(next);
      ++next;
    } else {
      auto got = q_.dequeue();
      if (model.empty()) {
        EXPECT_FALSE(got.has_value());
      } else {
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(*got, model.front());
        model.pop_front();
      }
      expect_rotation_invariant();
    }
    ASSERT_EQ(q_.size(), model.size());
  }
}

// ============================================================================
// 3. Peek
// ============================================================================
TEST_F(QueueTest, PeekIsIdempotent) {
  q_.enqueue(7);
  q_.enqueue(8);

  for (int i = 0; i < 4; ++i) {
    EXPECT_EQ(q_.peek(), 7);
    expect_rotation_invariant();
  }
  EXPECT_EQ(q_.size(), 2);
  EXPECT_EQ(q_.dequeue(), 7);
  EXPECT_EQ(q_.dequeue(), 8);
}

TEST_F(QueueTest, PeekOnEmptyFrontRotatesRear) {
  q_.enqueue(1);
  q_.enqueue(2);
  EXPECT_EQ(q_.front_size(), 0);
  EXPECT_EQ(q_.rear_size(), 2);

  EXPECT_EQ(q_.peek(), 1);
  EXPECT_EQ(q_.front_size(), 2);
  EXPECT_EQ(q_.rear_size(), 0);
}

TEST_F(QueueTest, PeekOnSingletonFrontKeepsHeadOnTop) {
  q_.enqueue(1);
  q_.enqueue(2);
  EXPECT_EQ(q_.dequeue(), 1); // front = [2]
  q_.enqueue(3);
  q_.enqueue(4);              // rear = [3, 4]
  ASSERT_EQ(q_.front_size(), 1);
  ASSERT_EQ(q_.rear_size(), 2);

  EXPECT_EQ(q_.peek(), 2);
  EXPECT_EQ(q_.front_size(), 3);
  EXPECT_EQ(q_.rear_size(), 0);

  EXPECT_EQ(q_.dequeue(), 2);
  EXPECT_EQ(q_.dequeue(), 3);
  EXPECT_EQ(q_.dequeue(), 4);
}

// ============================================================================
// 4. 轮转的各个分支
// ============================================================================
TEST_F(QueueTest, RotationCases) {
  q_.enqueue(1);
  q_.enqueue(2);
  q_.enqueue(3);

  // front 为空：整体反转
  EXPECT_EQ(q_.dequeue(), 1);
  EXPECT_EQ(q_.front_size(), 2);
  EXPECT_EQ(q_.rear_size(), 0);

  // front >= 2：直接弹出，不轮转
  q_.enqueue(4);
  EXPECT_EQ(q_.dequeue(), 2);
  EXPECT_EQ(q_.front_size(), 1);
  EXPECT_EQ(q_.rear_size(), 1);

  // front == 1, rear == 1：rear 元素直接挪到 front
  EXPECT_EQ(q_.dequeue(), 3);
  EXPECT_EQ(q_.front_size(), 1);
  EXPECT_EQ(q_.rear_size(), 0);

  // front == 1, rear >= 2：反转 rear
  q_.enqueue(5);
  q_.enqueue(6);
  EXPECT_EQ(q_.dequeue(), 4);
  EXPECT_EQ(q_.front_size(), 2);
  EXPECT_EQ(q_.rear_size(), 0);

  // front == 1, rear == 0：清空
  EXPECT_EQ(q_.dequeue(), 5);
  EXPECT_EQ(q_.dequeue(), 6);
  EXPECT_TRUE(q_.empty());
}

TEST_F(QueueTest, Clear) {
  q_.enqueue(1);
  q_.enqueue(2);
  (void)q_.peek();
  q_.enqueue(3);

  q_.clear();
  EXPECT_TRUE(q_.empty());
  EXPECT_FALSE(q_.dequeue().has_value());
}

TEST(QueueMoveOnlyTest, MoveOnlyPayload) {
  Queue<std::unique_ptr<std::string>> q;
  q.enqueue(std::make_unique<std::string>("a"));
  q.emplace(std::make_unique<std::string>("b"));

  const auto *head = q.head();
  ASSERT_NE(head, nullptr);
  EXPECT_EQ(**head, "a");

  auto a = q.dequeue();
  auto b = q.dequeue();
  ASSERT_TRUE(a && b);
  EXPECT_EQ(**a, "a");
  EXPECT_EQ(**b, "b");
}
