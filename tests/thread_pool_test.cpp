#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <set>
#include <string>
#include <thread>

#include "infra/thread_pool/completion_queue.hpp"
#include "infra/thread_pool/thread_pool.hpp"

using blockcopy::infra::CompletionQueue;
using blockcopy::infra::ThreadPool;

TEST(ThreadPoolTest, FuturesCarryResults)
{
    ThreadPool pool{3};

    auto a = pool.enqueue_with_future([](int x) { return x * 2; }, 21);
    auto b = pool.enqueue_with_future([] { return std::string("done"); });
    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
}

TEST(ThreadPoolTest, DestructorRunsQueuedTasks)
{
    std::atomic<int> counter{0};
    {
        ThreadPool pool{2};
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&counter] {
                std::this_thread::sleep_for(std::chrono::microseconds(200));
                counter.fetch_add(1);
            });
        }
    }
    EXPECT_EQ(counter.load(), 50);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool{0};
    EXPECT_EQ(pool.enqueue_with_future([] { return 7; }).get(), 7);
}

TEST(CompletionQueueTest, PopWaitsForProducers)
{
    CompletionQueue<int> queue;
    ThreadPool pool{4};
    for (int i = 1; i <= 8; ++i) {
        pool.enqueue([&queue, i] {
            std::this_thread::sleep_for(std::chrono::milliseconds(i));
            queue.push(i);
        });
    }

    std::set<int> seen;
    for (int i = 0; i < 8; ++i) {
        seen.insert(queue.pop());
    }
    EXPECT_EQ(seen.size(), 8u);
    EXPECT_EQ(*seen.begin(), 1);
    EXPECT_EQ(*seen.rbegin(), 8);
}
