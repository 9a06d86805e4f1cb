#include <gtest/gtest.h>
#include "channel.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace siphon;
using namespace std::chrono_literals;

TEST(ChannelTest, DeliversInFifoOrder) {
  Channel<int> ch(4);
  EXPECT_TRUE(ch.send(1));
  EXPECT_TRUE(ch.send(2));
  int v = 0;
  ASSERT_EQ(ch.recv(v), RecvStatus::Value);
  EXPECT_EQ(v, 1);
  ASSERT_EQ(ch.recv(v), RecvStatus::Value);
  EXPECT_EQ(v, 2);
}

TEST(ChannelTest, CloseDrainsBufferedItemsFirst) {
  Channel<int> ch(4);
  ch.send(7);
  EXPECT_TRUE(ch.close());
  int v = 0;
  EXPECT_EQ(ch.recv(v), RecvStatus::Value);
  EXPECT_EQ(v, 7);
  EXPECT_EQ(ch.recv(v), RecvStatus::Closed);
}

TEST(ChannelTest, CloseHappensOnce) {
  Channel<int> ch(1);
  EXPECT_TRUE(ch.close());
  EXPECT_FALSE(ch.close());
  EXPECT_TRUE(ch.closed());
  EXPECT_FALSE(ch.send(1));
}

TEST(ChannelTest, SendBlocksWhileFull) {
  Channel<int> ch(1);
  ch.send(1);
  std::atomic<bool> sent{false};
  std::thread producer([&] {
    ch.send(2);
    sent = true;
  });
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(sent);

  int v = 0;
  ch.recv(v);
  producer.join();
  EXPECT_TRUE(sent);
  EXPECT_EQ(ch.size(), 1u);
}

TEST(ChannelTest, RecvWakesOnCancel) {
  Channel<int> ch(1);
  Context ctx;
  std::thread canceller([&] {
    std::this_thread::sleep_for(50ms);
    ctx.cancel();
  });
  int v = 0;
  EXPECT_EQ(ch.recv(ctx, v), RecvStatus::Cancelled);
  canceller.join();
}

TEST(ChannelTest, CancellationWinsOverBufferedItems) {
  Channel<int> ch(1);
  ch.send(1);
  Context ctx;
  ctx.cancel();
  int v = 0;
  EXPECT_EQ(ch.recv(ctx, v), RecvStatus::Cancelled);
  EXPECT_EQ(ch.size(), 1u);
}

TEST(ChannelTest, RecvWakesOnClose) {
  Channel<int> ch(1);
  Context ctx;
  std::thread closer([&] {
    std::this_thread::sleep_for(20ms);
    ch.close();
  });
  int v = 0;
  EXPECT_EQ(ch.recv(ctx, v), RecvStatus::Closed);
  closer.join();
}

TEST(CompletionBarrierTest, FiresOnceAfterLastArrival) {
  std::atomic<int> fired{0};
  CompletionBarrier barrier(8, [&] { fired++; });

  std::vector<std::thread> threads;
  for (int i = 0; i < 8; i++) threads.emplace_back([&] { barrier.arrive(); });
  for (auto& t : threads) t.join();
  barrier.wait();

  EXPECT_TRUE(barrier.completed());
  barrier.arrive();
  EXPECT_EQ(fired.load(), 1);
}

TEST(CompletionBarrierTest, ClosesChannelForConsumers) {
  Channel<int> ch(16);
  CompletionBarrier barrier(3, [&] { ch.close(); });
  std::vector<std::thread> workers;
  for (int i = 0; i < 3; i++) {
    workers.emplace_back([&, i] {
      ch.send(i);
      barrier.arrive();
    });
  }
  int v = 0, count = 0;
  while (ch.recv(v) == RecvStatus::Value) count++;
  for (auto& t : workers) t.join();
  EXPECT_EQ(count, 3);
}

TEST(CompletionBarrierTest, ZeroPartiesCompletesImmediately) {
  bool fired = false;
  CompletionBarrier barrier(0, [&] { fired = true; });
  EXPECT_TRUE(fired);
  EXPECT_TRUE(barrier.completed());
}
