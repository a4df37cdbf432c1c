#include "fcat/ingest/work_queue.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using fcat::ingest::WorkQueue;

TEST(WorkQueueTest, PopReturnsNulloptOnceDrained) {
    WorkQueue<int> queue;
    queue.push(1);

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(*item, 1);
    EXPECT_EQ(queue.outstanding(), 1u);

    queue.task_done();
    EXPECT_EQ(queue.outstanding(), 0u);
    EXPECT_FALSE(queue.pop().has_value());
}

// Models a tree: item n spawns children 2n+1 and 2n+2 below a bound
TEST(WorkQueueTest, SelfFeedingWorkersTerminate) {
    constexpr int kLimit = 1000;
    WorkQueue<int> queue;
    std::atomic<int> handled{0};

    queue.push(0);

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&]() {
            while (auto item = queue.pop()) {
                for (int child : {2 * *item + 1, 2 * *item + 2}) {
                    if (child < kLimit) {
                        queue.push(child);
                    }
                }
                handled++;
                queue.task_done();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(handled.load(), kLimit);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(WorkQueueTest, ShutdownReleasesWaiters) {
    WorkQueue<int> queue;
    queue.push(1);
    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());

    // One task is outstanding, so this pop would block until shutdown
    std::thread waiter([&]() {
        EXPECT_FALSE(queue.pop().has_value());
    });

    queue.shutdown();
    waiter.join();
}
