#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>

#include "../src/threading/ThreadPool.hpp"

using namespace BulkBridge;

TEST(ThreadPoolTest, RunsEveryTaskAndReturnsResultsInOrder)
{
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i)
        futures.push_back(pool.submit([i]()
                                      { return i * i; }));

    auto results = join_all(futures);
    ASSERT_EQ(results.size(), 32u);
    for (int i = 0; i < 32; ++i)
        EXPECT_EQ(results[static_cast<size_t>(i)], i * i);
}

TEST(ThreadPoolTest, JoinAllWaitsForEveryTaskBeforeRethrowing)
{
    ThreadPool pool(4);
    std::atomic<int> finished{0};

    std::vector<std::future<void>> futures;
    futures.push_back(pool.submit([]()
                                  { throw std::runtime_error("first task failed"); }));
    for (int i = 0; i < 3; ++i)
    {
        futures.push_back(pool.submit([&finished]()
                                      {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            ++finished; }));
    }

    EXPECT_THROW(join_all(futures), std::runtime_error);
    EXPECT_EQ(finished.load(), 3);
}

TEST(ThreadPoolTest, DestructorDrainsTheQueue)
{
    std::atomic<int> counter{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 100; ++i)
            (void)pool.submit([&counter]()
                              { ++counter; });
    }
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ZeroThreadsStillRunsTasks)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.thread_count(), 1u);
    EXPECT_EQ(pool.submit([]()
                          { return 7; })
                  .get(),
              7);
}
