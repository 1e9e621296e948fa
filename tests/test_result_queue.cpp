#include "result_queue.hpp"

#include <memory>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

using namespace mdns_discover;

TEST(ResultQueue, PopsInPushOrder)
{
    ResultQueue<int> queue;
    queue.Push(1);
    queue.Push(2);
    queue.Push(3);
    EXPECT_EQ(queue.Pop(), 1);
    EXPECT_EQ(queue.Pop(), 2);
    EXPECT_EQ(queue.Pop(), 3);
}

TEST(ResultQueue, MoveOnlyItems)
{
    ResultQueue<std::unique_ptr<int>> queue;
    queue.Push(std::make_unique<int>(7));
    const auto item = queue.Pop();
    ASSERT_NE(item, nullptr);
    EXPECT_EQ(*item, 7);
}

TEST(ResultQueue, EveryProducerIsDelivered)
{
    constexpr int kProducers = 4;
    constexpr int kPerProducer = 250;

    ResultQueue<int> queue;
    std::vector<std::thread> producers;
    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([&queue, p] {
            for (int i = 0; i < kPerProducer; ++i) {
                queue.Push(p * kPerProducer + i);
            }
        });
    }

    std::set<int> received;
    for (int i = 0; i < kProducers * kPerProducer; ++i) {
        received.insert(queue.Pop());
    }
    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(received.size(), static_cast<std::size_t>(kProducers * kPerProducer));
    EXPECT_EQ(*received.begin(), 0);
    EXPECT_EQ(*received.rbegin(), kProducers * kPerProducer - 1);
}
