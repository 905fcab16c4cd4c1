#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <mutex>
#include "store/write_channel.hpp"
#include "test_utils.hpp"

using namespace ghostnet::store;
using namespace std::chrono_literals;

class WriteChannelTest : public ::testing::Test {
protected:
  void SetUp() override {
    init_logging(boost::log::trivial::warning);
  }

  WriteChannel channel;

  // Helper to run a consumer that executes tasks until the channel closes and drains
  void runConsumer(std::atomic<int>& executed) {
    WriteChannel::Task task;
    while (!channel.closed() || !channel.empty()) {
      if (channel.consume(task, 10ms)) {
        task();
        ++executed;
        channel.task_done();
      }
    }
  }
};

TEST_F(WriteChannelTest, InitialState) {
  EXPECT_TRUE(channel.empty());
  EXPECT_EQ(channel.size(), 0u);
  EXPECT_FALSE(channel.closed());
}

TEST_F(WriteChannelTest, SingleProduceConsume) {
  int value = 0;
  EXPECT_TRUE(channel.produce([&value]() { value = 42; }));
  EXPECT_FALSE(channel.empty());
  EXPECT_EQ(channel.size(), 1u);

  WriteChannel::Task task;
  ASSERT_TRUE(channel.consume(task, 0ms));
  task();
  channel.task_done();

  EXPECT_EQ(value, 42);
  EXPECT_TRUE(channel.empty());
}

TEST_F(WriteChannelTest, TasksKeepOrder) {
  std::vector<int> order;
  for (int i = 0; i < 5; ++i) {
    channel.produce([&order, i]() { order.push_back(i); });
  }
  EXPECT_EQ(channel.size(), 5u);

  WriteChannel::Task task;
  while (channel.consume(task, 0ms)) {
    task();
    channel.task_done();
  }

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3, 4}));
}

TEST_F(WriteChannelTest, ConsumeEmptyChannelTimesOut) {
  WriteChannel::Task task;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(channel.consume(task, 50ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 40ms);
}

TEST_F(WriteChannelTest, ClosedChannelRejectsTasks) {
  channel.produce([]() {});
  channel.close();

  EXPECT_TRUE(channel.closed());
  EXPECT_FALSE(channel.produce([]() {}));

  // Tasks queued before close are still delivered
  WriteChannel::Task task;
  EXPECT_TRUE(channel.consume(task, 0ms));
  channel.task_done();
  EXPECT_FALSE(channel.consume(task, 1000ms));
}

TEST_F(WriteChannelTest, WaitIdleBlocksUntilTasksFinish) {
  std::atomic<int> executed{0};
  for (int i = 0; i < 20; ++i) {
    channel.produce([]() { std::this_thread::sleep_for(1ms); });
  }

  std::thread consumer([this, &executed]() { runConsumer(executed); });
  channel.wait_idle();
  EXPECT_EQ(executed, 20);

  channel.close();
  consumer.join();
}

TEST_F(WriteChannelTest, ConcurrentProducers) {
  const int num_producers = 4;
  const int tasks_per_producer = 50;
  std::atomic<int> executed{0};
  std::mutex sum_mutex;
  int sum = 0;

  std::thread consumer([this, &executed]() { runConsumer(executed); });

  std::vector<std::thread> producers;
  for (int p = 0; p < num_producers; ++p) {
    producers.emplace_back([this, &sum_mutex, &sum]() {
      for (int i = 0; i < tasks_per_producer; ++i) {
        channel.produce([&sum_mutex, &sum]() {
          std::lock_guard<std::mutex> lock(sum_mutex);
          ++sum;
        });
      }
    });
  }

  for (auto& producer : producers) {
    producer.join();
  }
  channel.wait_idle();
  channel.close();
  consumer.join();

  EXPECT_EQ(executed, num_producers * tasks_per_producer);
  EXPECT_EQ(sum, num_producers * tasks_per_producer);
  EXPECT_TRUE(channel.empty());
}
